#include <gtest/gtest.h>
#include "naming_policy.hpp"

using namespace shrink;

class NamingPolicyTest : public ::testing::Test {
protected:
    NamingPolicy policy;
};

TEST_F(NamingPolicyTest, PlainNameNeedsFullProcessing) {
    EXPECT_EQ(classify("holiday.jpg", policy), Classification::NeedsFullProcessing);
}

TEST_F(NamingPolicyTest, SkipSuffixIsSkipped) {
    EXPECT_EQ(classify("photo_skip.jpg", policy), Classification::NeedsSkip);
}

TEST_F(NamingPolicyTest, OriginalSuffixIsSkipped) {
    EXPECT_EQ(classify("photo_original.png", policy), Classification::NeedsSkip);
}

TEST_F(NamingPolicyTest, DisabledRulesDoNotSkip) {
    policy.skip_skip = false;
    policy.skip_original = false;
    EXPECT_EQ(classify("photo_skip.jpg", policy), Classification::NeedsFullProcessing);
    EXPECT_EQ(classify("photo_original.jpg", policy), Classification::NeedsFullProcessing);
}

TEST_F(NamingPolicyTest, SuffixMustEndTheStem) {
    EXPECT_EQ(classify("photo_skipped.jpg", policy), Classification::NeedsFullProcessing);
    EXPECT_EQ(classify("_skip_photo.jpg", policy), Classification::NeedsFullProcessing);
}

TEST_F(NamingPolicyTest, ExtensionIsNotPartOfTheStem) {
    // "x.jpg_skip" has stem "x" and extension ".jpg_skip"
    EXPECT_EQ(classify("x.jpg_skip", policy), Classification::NeedsFullProcessing);
}

TEST_F(NamingPolicyTest, CaseSensitiveByDefault) {
    EXPECT_EQ(classify("photo_SKIP.jpg", policy), Classification::NeedsFullProcessing);
    EXPECT_EQ(classify("photo_Original.jpg", policy), Classification::NeedsFullProcessing);
}

TEST_F(NamingPolicyTest, CaseInsensitiveOption) {
    policy.case_insensitive = true;
    EXPECT_EQ(classify("photo_SKIP.jpg", policy), Classification::NeedsSkip);
    EXPECT_EQ(classify("photo_Original.JPG", policy), Classification::NeedsSkip);
}

TEST_F(NamingPolicyTest, DirectoryPartIsIgnored) {
    EXPECT_EQ(classify("albums_skip/photo.jpg", policy), Classification::NeedsFullProcessing);
    EXPECT_EQ(classify("albums/photo_skip.jpg", policy), Classification::NeedsSkip);
}

TEST_F(NamingPolicyTest, ExistingBackupMeansBackupOnly) {
    EXPECT_EQ(classify("photo.jpg", policy, true), Classification::NeedsBackupOnly);
}

TEST_F(NamingPolicyTest, NameRulesWinOverExistingBackup) {
    EXPECT_EQ(classify("photo_skip.jpg", policy, true), Classification::NeedsSkip);
}

TEST_F(NamingPolicyTest, ClassificationIsIdempotent) {
    for (const char* name : {"a.jpg", "a_skip.jpg", "a_original.png", "a_SKIP.webp"}) {
        for (const bool present : {false, true}) {
            const auto first = classify(name, policy, present);
            EXPECT_EQ(classify(name, policy, present), first) << name;
        }
    }
}

TEST_F(NamingPolicyTest, EmptySuffixNeverMatches) {
    policy.skip_suffix.clear();
    policy.original_suffix.clear();
    EXPECT_EQ(classify("photo.jpg", policy), Classification::NeedsFullProcessing);
    EXPECT_FALSE(stem_has_suffix("photo.jpg", "", false));
}

TEST(BackupPathTest, RelativeFolderIsNextToTheFile) {
    const auto p = backup_path_for("/data/pics/cat.JPG", "original image", "_original");
    EXPECT_EQ(p, std::filesystem::path("/data/pics/original image/cat_original.JPG"));
}

TEST(BackupPathTest, AbsoluteFolderIsUsedAsIs) {
    const auto p = backup_path_for("/data/pics/cat.png", "/backups", "_orig");
    EXPECT_EQ(p, std::filesystem::path("/backups/cat_orig.png"));
}

TEST(BackupPathTest, BackupNameIsSkippedByDefaultPolicy) {
    const NamingPolicy policy;
    const auto p = backup_path_for("/data/cat.png", "original image", policy.original_suffix);
    EXPECT_EQ(classify(p.filename().string(), policy), Classification::NeedsSkip);
}
