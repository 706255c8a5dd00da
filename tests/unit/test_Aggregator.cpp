#include <gtest/gtest.h>
#include "aggregator.hpp"

#include <numeric>

using namespace shrink;

namespace {

FileRecord make_record(const std::string& path, Status status,
                       std::uintmax_t before, std::optional<std::uintmax_t> after,
                       double seconds = 0.0) {
    FileRecord r;
    r.path = path;
    r.extension = lower_extension(path);
    r.size_before = before;
    r.size_after = after;
    r.status = status;
    r.elapsed_seconds = seconds;
    return r;
}

void expect_invariants(const AggregateSnapshot& s) {
    EXPECT_EQ(s.total, s.compressed_count + s.skipped_backup_count + s.skipped_named_count +
                       s.unreadable_count + s.error_count);
    const std::size_t ext_total = std::accumulate(s.extensions.begin(), s.extensions.end(), std::size_t{0},
                                                  [](std::size_t acc, const ExtensionStats& e) { return acc + e.count; });
    EXPECT_EQ(ext_total, s.compressed_count + s.skipped_backup_count);
    EXPECT_EQ(s.records.size(), s.total);
}

} // namespace

TEST(AggregatorTest, EmptySnapshot) {
    Aggregator agg;
    const auto s = agg.snapshot();
    EXPECT_EQ(s.total, 0u);
    EXPECT_TRUE(s.extensions.empty());
    expect_invariants(s);
}

TEST(AggregatorTest, CompressedJpegFillsExtensionStats) {
    Aggregator agg;
    agg.update(make_record("img.jpg", Status::Compressed, 500000, 300000, 0.5));
    const auto s = agg.snapshot();

    ASSERT_NE(s.find_extension(".jpg"), nullptr);
    const auto& jpg = *s.find_extension(".jpg");
    EXPECT_EQ(jpg.count, 1u);
    EXPECT_EQ(jpg.bytes_before, 500000u);
    EXPECT_EQ(jpg.bytes_after, 300000u);
    EXPECT_EQ(s.bytes_before_total, 500000u);
    EXPECT_EQ(s.bytes_after_total, 300000u);
    EXPECT_DOUBLE_EQ(s.compressed_seconds_total, 0.5);
    expect_invariants(s);
}

TEST(AggregatorTest, EveryStatusHasItsCounter) {
    Aggregator agg;
    agg.update(make_record("a.jpg", Status::Compressed, 100, 80));
    agg.update(make_record("b.png", Status::SkippedBackedUp, 50, 50));
    agg.update(make_record("c_skip.jpg", Status::SkippedByName, 70, std::nullopt));
    agg.update(make_record("d.png", Status::Unreadable, 10, std::nullopt));
    agg.update(make_record("e.webp", Status::CompressionError, 20, std::nullopt));

    const auto s = agg.snapshot();
    EXPECT_EQ(s.total, 5u);
    EXPECT_EQ(s.compressed_count, 1u);
    EXPECT_EQ(s.skipped_backup_count, 1u);
    EXPECT_EQ(s.skipped_named_count, 1u);
    EXPECT_EQ(s.unreadable_count, 1u);
    EXPECT_EQ(s.error_count, 1u);
    expect_invariants(s);
}

TEST(AggregatorTest, OnlyByteLevelRecordsCountTowardExtensions) {
    Aggregator agg;
    agg.update(make_record("c_skip.jpg", Status::SkippedByName, 70, std::nullopt));
    agg.update(make_record("d.png", Status::Unreadable, 10, std::nullopt));
    agg.update(make_record("e.webp", Status::CompressionError, 20, std::nullopt));

    const auto s = agg.snapshot();
    EXPECT_TRUE(s.extensions.empty());
    EXPECT_EQ(s.bytes_before_total, 0u);
    EXPECT_EQ(s.bytes_after_total, 0u);
    expect_invariants(s);
}

TEST(AggregatorTest, SkippedBackedUpCountsUnchangedSize) {
    Aggregator agg;
    agg.update(make_record("b.png", Status::SkippedBackedUp, 50, 50));
    const auto s = agg.snapshot();
    ASSERT_NE(s.find_extension(".png"), nullptr);
    EXPECT_EQ(s.find_extension(".png")->bytes_before, 50u);
    EXPECT_EQ(s.find_extension(".png")->bytes_after, 50u);
    EXPECT_DOUBLE_EQ(s.compressed_seconds_total, 0.0);
}

TEST(AggregatorTest, ExtensionsKeepFirstSeenOrder) {
    Aggregator agg;
    agg.update(make_record("1.png", Status::Compressed, 10, 5));
    agg.update(make_record("2.jpg", Status::Compressed, 10, 5));
    agg.update(make_record("3.png", Status::Compressed, 10, 5));
    agg.update(make_record("4.webp", Status::Compressed, 10, 5));

    const auto s = agg.snapshot();
    ASSERT_EQ(s.extensions.size(), 3u);
    EXPECT_EQ(s.extensions[0].extension, ".png");
    EXPECT_EQ(s.extensions[1].extension, ".jpg");
    EXPECT_EQ(s.extensions[2].extension, ".webp");
    EXPECT_EQ(s.extensions[0].count, 2u);
}

TEST(AggregatorTest, ExtensionsAreLowerCased) {
    Aggregator agg;
    agg.update(make_record("A.JPG", Status::Compressed, 10, 5));
    agg.update(make_record("b.jpg", Status::Compressed, 10, 5));
    const auto s = agg.snapshot();
    ASSERT_EQ(s.extensions.size(), 1u);
    EXPECT_EQ(s.extensions[0].count, 2u);
}

TEST(AggregatorTest, SnapshotDoesNotReset) {
    Aggregator agg;
    agg.update(make_record("a.jpg", Status::Compressed, 10, 5));
    (void)agg.snapshot();
    agg.update(make_record("b.jpg", Status::Compressed, 10, 5));
    EXPECT_EQ(agg.snapshot().total, 2u);
}

TEST(AggregatorTest, RecordsKeepUpdateOrder) {
    Aggregator agg;
    for (int i = 0; i < 10; ++i) {
        agg.update(make_record("f" + std::to_string(i) + ".jpg", Status::Compressed, 10, 5));
    }
    const auto s = agg.snapshot();
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(s.records[static_cast<std::size_t>(i)].path, "f" + std::to_string(i) + ".jpg");
    }
}

TEST(FileRecordTest, StableIdentifiers) {
    EXPECT_EQ(to_string(Status::SkippedBackedUp), "skipped_backed_up");
    EXPECT_EQ(to_string(Status::CompressionError), "compression_error");
    EXPECT_EQ(to_string(FailureKind::UnsupportedFormat), "unsupported_format");
    EXPECT_EQ(lower_extension("Photo.JPEG"), ".jpeg");
    EXPECT_EQ(lower_extension("README"), "");
}
