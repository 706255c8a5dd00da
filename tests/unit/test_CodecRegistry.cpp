#include <gtest/gtest.h>
#include "codec_registry.hpp"
#include "mime_detector.hpp"
#include "test_helpers.hpp"

using namespace shrink;
using namespace shrink::test;

TEST(CodecRegistryTest, BuiltinsAreRegistered) {
    const CodecRegistry registry;
    ASSERT_EQ(registry.all().size(), 3u);
    EXPECT_EQ(registry.all()[0]->get_name(), "JPEG");
    EXPECT_EQ(registry.all()[1]->get_name(), "PNG");
    EXPECT_EQ(registry.all()[2]->get_name(), "WebP");
}

TEST(CodecRegistryTest, LookupByExtensionIgnoresCase) {
    const CodecRegistry registry;
    ASSERT_NE(registry.find_by_extension(".JPG"), nullptr);
    EXPECT_EQ(registry.find_by_extension(".JPG")->get_name(), "JPEG");
    EXPECT_EQ(registry.find_by_extension(".jpeg")->get_name(), "JPEG");
    EXPECT_EQ(registry.find_by_extension(".Png")->get_name(), "PNG");
    EXPECT_EQ(registry.find_by_extension(".webp")->get_name(), "WebP");
    EXPECT_EQ(registry.find_by_extension(".bmp"), nullptr);
    EXPECT_EQ(registry.find_by_extension(""), nullptr);
    EXPECT_EQ(registry.find_by_extension("jpg"), nullptr);
}

TEST(CodecRegistryTest, LookupByMime) {
    const CodecRegistry registry;
    EXPECT_EQ(registry.find_by_mime("image/png")->get_name(), "PNG");
    EXPECT_EQ(registry.find_by_mime("image/webp")->get_name(), "WebP");
    EXPECT_EQ(registry.find_by_mime("image/gif"), nullptr);
    EXPECT_EQ(registry.find_by_mime(""), nullptr);
}

TEST(CodecRegistryTest, ContentWinsOverExtension) {
    TempDir dir;
    const auto misnamed = dir / "really_a_jpeg.png";
    write_test_jpeg(misnamed, 16, 16);

    EXPECT_EQ(MimeDetector::detect(misnamed), "image/jpeg");
    const CodecRegistry registry;
    ASSERT_NE(registry.find_for(misnamed), nullptr);
    EXPECT_EQ(registry.find_for(misnamed)->get_name(), "JPEG");
}

TEST(CodecRegistryTest, EmptyRegistryFindsNothing) {
    auto registry = CodecRegistry::empty();
    EXPECT_TRUE(registry.all().empty());
    EXPECT_EQ(registry.find_by_extension(".jpg"), nullptr);

    registry.add(std::make_unique<FakeCodec>());
    EXPECT_EQ(registry.find_by_extension(".jpg")->get_name(), "Fake");
}
