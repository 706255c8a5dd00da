#include <gtest/gtest.h>
#include "batch_driver.hpp"
#include "codec_registry.hpp"
#include "events.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

using namespace shrink;
using namespace shrink::test;

class BatchDriverTest : public ::testing::Test {
protected:
    TempDir dir;
    CodecRegistry registry = CodecRegistry::empty();
    ProcessOptions options;
    EventBus bus;

    void SetUp() override {
        registry.add(std::make_unique<FakeCodec>(0.5, std::chrono::milliseconds(2)));
        options.backup = false;
    }

    std::vector<fs::path> make_files(const std::vector<std::string>& names, std::size_t size = 200) {
        std::vector<fs::path> files;
        for (const auto& name : names) {
            files.push_back(dir / name);
            write_bytes(files.back(), size);
        }
        return files;
    }
};

TEST_F(BatchDriverTest, EmptyInput) {
    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 2);

    const auto s = driver.run({});

    EXPECT_EQ(s.total, 0u);
    EXPECT_FALSE(driver.interrupted());
    EXPECT_LE(s.start_time, s.end_time);
}

TEST_F(BatchDriverTest, ParallelRunKeepsInputOrder) {
    std::vector<std::string> names;
    for (int i = 0; i < 24; ++i) names.push_back("f" + std::to_string(100 + i) + ".jpg");
    const auto files = make_files(names);

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 4);
    const auto s = driver.run(files);

    ASSERT_EQ(s.records.size(), files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(s.records[i].path, files[i]);
    }
    EXPECT_EQ(s.compressed_count, files.size());
}

TEST_F(BatchDriverTest, FailuresDoNotStopTheBatch) {
    const auto files = make_files({"a.jpg", "bad.jpg", "photo_skip.jpg", "fail.jpg", "scan.bmp", "z.jpg"});

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 3);
    const auto s = driver.run(files);

    EXPECT_EQ(s.total, 6u);
    EXPECT_EQ(s.compressed_count, 2u);
    EXPECT_EQ(s.skipped_named_count, 1u);
    EXPECT_EQ(s.unreadable_count, 2u);
    EXPECT_EQ(s.error_count, 1u);
    EXPECT_EQ(s.total, s.compressed_count + s.skipped_backup_count + s.skipped_named_count +
                       s.unreadable_count + s.error_count);
    EXPECT_EQ(s.records.back().path, files.back());
    EXPECT_EQ(s.records.back().status, Status::Compressed);
}

TEST_F(BatchDriverTest, PublishesEventsInOrder) {
    const auto files = make_files({"1.jpg", "2.jpg", "3.jpg"});
    std::size_t started_with = 0;
    std::vector<std::size_t> indices;
    bus.subscribe<BatchStartEvent>([&](const BatchStartEvent& e) { started_with = e.total; });
    bus.subscribe<FileProcessedEvent>([&](const FileProcessedEvent& e) {
        indices.push_back(e.index);
        EXPECT_EQ(e.total, 3u);
    });

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 2);
    (void)driver.run(files);

    EXPECT_EQ(started_with, 3u);
    EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1, 2}));
}

TEST_F(BatchDriverTest, SingleThreadMatchesParallel) {
    const auto files = make_files({"a.jpg", "bad.jpg", "c.jpg", "d_skip.jpg"});

    const FileProcessor processor(registry, options);
    BatchDriver serial(processor, bus, 1);
    const auto first = serial.run(files);

    // restore the inputs the first run rewrote
    (void)make_files({"a.jpg", "bad.jpg", "c.jpg", "d_skip.jpg"});
    BatchDriver parallel(processor, bus, 4);
    const auto second = parallel.run(files);

    ASSERT_EQ(first.records.size(), second.records.size());
    for (std::size_t i = 0; i < first.records.size(); ++i) {
        EXPECT_EQ(first.records[i].status, second.records[i].status);
        EXPECT_EQ(first.records[i].size_after, second.records[i].size_after);
    }
}

TEST_F(BatchDriverTest, StopBeforeRunProcessesNothing) {
    const auto files = make_files({"a.jpg", "b.jpg", "c.jpg"});

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 2);
    std::size_t dropped = 0;
    bus.subscribe<BatchInterruptedEvent>([&](const BatchInterruptedEvent& e) { dropped = e.dropped; });

    driver.request_stop();
    const auto s = driver.run(files);

    EXPECT_TRUE(driver.interrupted());
    EXPECT_EQ(s.total, 0u);
    EXPECT_EQ(dropped, 3u);
    EXPECT_EQ(fs::file_size(files[0]), 200u);
}

TEST_F(BatchDriverTest, StopDuringRunReturnsConsistentPartialSnapshot) {
    std::vector<std::string> names;
    for (int i = 0; i < 40; ++i) names.push_back("s" + std::to_string(100 + i) + ".jpg");
    const auto files = make_files(names);

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 2);
    bus.subscribe<FileProcessedEvent>([&](const FileProcessedEvent& e) {
        if (e.index == 4) driver.request_stop();
    });

    const auto s = driver.run(files);

    EXPECT_TRUE(driver.interrupted());
    EXPECT_GE(s.total, 5u);
    EXPECT_LT(s.total, files.size());
    EXPECT_EQ(s.total, s.compressed_count);
    // the first five were folded before the stop; the rest keep input order
    for (std::size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(s.records[i].path, files[i]);
    }
    for (std::size_t i = 1; i < s.records.size(); ++i) {
        EXPECT_LT(s.records[i - 1].path, s.records[i].path);
    }
}

TEST_F(BatchDriverTest, StopIsSafeFromAnotherThread) {
    static_assert(noexcept(std::declval<BatchDriver&>().request_stop()));

    std::vector<std::string> names;
    for (int i = 0; i < 300; ++i) names.push_back("t" + std::to_string(1000 + i) + ".jpg");
    const auto files = make_files(names);

    const FileProcessor processor(registry, options);
    BatchDriver driver(processor, bus, 2);
    std::jthread stopper([&driver] {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        driver.request_stop();
    });

    const auto s = driver.run(files);
    stopper.join();

    EXPECT_TRUE(driver.interrupted());
    EXPECT_LT(s.total, files.size());
    EXPECT_EQ(s.total, s.compressed_count);
    EXPECT_EQ(s.total, s.records.size());
}

TEST_F(BatchDriverTest, ThrowingSubscriberLeavesQueuedWorkSafe) {
    std::vector<std::string> names;
    for (int i = 0; i < 20; ++i) names.push_back("u" + std::to_string(100 + i) + ".jpg");
    const auto files = make_files(names);
    const FileProcessor processor(registry, options);

    {
        EventBus throwing_bus;
        throwing_bus.subscribe<FileProcessedEvent>([](const FileProcessedEvent&) {
            throw std::runtime_error("listener gave up");
        });
        BatchDriver driver(processor, throwing_bus, 2);
        EXPECT_THROW((void)driver.run(files), std::runtime_error);
        // the driver is destroyed here while tasks may still be queued
    }

    // every queued task either ran to completion or was never started
    for (const auto& file : files) {
        const auto size = fs::file_size(file);
        EXPECT_TRUE(size == 200u || size == 100u) << file;
    }
}
