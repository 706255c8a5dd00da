#include <gtest/gtest.h>
#include "config.hpp"
#include "config_yaml.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace shrink;
using shrink::test::TempDir;

namespace {

void write_text(const std::filesystem::path& file, const std::string& text) {
    std::ofstream out(file);
    out << text;
}

} // namespace

TEST(ConfigTest, DefaultsMatchTheDocumentedValues) {
    const Config cfg;
    EXPECT_EQ(cfg.compress_quality, 85);
    EXPECT_TRUE(cfg.backup);
    EXPECT_EQ(cfg.backup_folder, "original image");
    EXPECT_EQ(cfg.original_suffix, "_original");
    EXPECT_EQ(cfg.skip_suffix, "_skip");
    EXPECT_TRUE(cfg.skip_original);
    EXPECT_TRUE(cfg.skip_skip);
    EXPECT_FALSE(cfg.case_insensitive_suffixes);
    EXPECT_EQ(cfg.summary_folder, "summary");
    EXPECT_EQ(cfg.summary_filename, "report");
    EXPECT_EQ(cfg.lang_code, "zh-tw");
    EXPECT_GE(cfg.threads, 1u);
    EXPECT_NO_THROW(validate_config(cfg));
}

TEST(ConfigTest, QualityBoundaries) {
    Config cfg;
    cfg.compress_quality = 1;
    EXPECT_NO_THROW(validate_config(cfg));
    cfg.compress_quality = 100;
    EXPECT_NO_THROW(validate_config(cfg));
    cfg.compress_quality = 0;
    EXPECT_THROW(validate_config(cfg), ConfigurationError);
    cfg.compress_quality = 101;
    EXPECT_THROW(validate_config(cfg), ConfigurationError);
}

TEST(ConfigTest, EmptySummaryFilenameOnlyMattersWithCsv) {
    Config cfg;
    cfg.summary_filename.clear();
    EXPECT_THROW(validate_config(cfg), ConfigurationError);
    cfg.save_summary_to_csv = false;
    EXPECT_NO_THROW(validate_config(cfg));
}

TEST(ConfigTest, ZeroThreadsRejected) {
    Config cfg;
    cfg.threads = 0;
    EXPECT_THROW(validate_config(cfg), ConfigurationError);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
    const auto cfg = load_config_file("/nonexistent/shrink/config.yaml");
    EXPECT_EQ(cfg.compress_quality, 85);
    EXPECT_TRUE(cfg.path.empty());
}

TEST(ConfigTest, YamlOverridesOnlyGivenKeys) {
    TempDir dir;
    write_text(dir / "config.yaml",
               "path: /photos\n"
               "compress_quality: 70\n"
               "backup: false\n"
               "skip_suffix: \"_keep\"\n"
               "lang_code: en\n"
               "threads: 3\n");

    const auto cfg = load_config_file(dir / "config.yaml");
    EXPECT_EQ(cfg.path, "/photos");
    EXPECT_EQ(cfg.compress_quality, 70);
    EXPECT_FALSE(cfg.backup);
    EXPECT_EQ(cfg.skip_suffix, "_keep");
    EXPECT_EQ(cfg.lang_code, "en");
    EXPECT_EQ(cfg.threads, 3u);
    EXPECT_EQ(cfg.original_suffix, "_original");
    EXPECT_TRUE(cfg.print_summary);
}

TEST(ConfigTest, MissingKeysAreListedInOrder) {
    const auto missing = missing_config_keys(YAML::Load("compress_quality: 70\nbackup: false\n"));
    ASSERT_EQ(missing.size(), 16u);
    EXPECT_EQ(missing.front(), "path");
    EXPECT_EQ(missing[1], "backup_folder");
    EXPECT_EQ(missing.back(), "recursive");
    EXPECT_EQ(std::find(missing.begin(), missing.end(), "compress_quality"), missing.end());

    EXPECT_EQ(missing_config_keys(YAML::Load("[1, 2]")).size(), 18u);
}

TEST(ConfigTest, EmptyPathKeyMeansAsk) {
    TempDir dir;
    write_text(dir / "config.yaml", "path:\ncompress_quality: 60\n");
    const auto cfg = load_config_file(dir / "config.yaml");
    EXPECT_TRUE(cfg.path.empty());
    EXPECT_EQ(cfg.compress_quality, 60);
}

TEST(ConfigTest, MalformedYamlIsAConfigurationError) {
    TempDir dir;
    write_text(dir / "config.yaml", "compress_quality: [1, 2\n");
    EXPECT_THROW((void)load_config_file(dir / "config.yaml"), ConfigurationError);
}

TEST(ConfigTest, WrongTypeIsAConfigurationError) {
    TempDir dir;
    write_text(dir / "config.yaml", "compress_quality: high\n");
    EXPECT_THROW((void)load_config_file(dir / "config.yaml"), ConfigurationError);
}

TEST(ConfigTest, NonMappingIsAConfigurationError) {
    TempDir dir;
    write_text(dir / "config.yaml", "- just\n- a list\n");
    EXPECT_THROW((void)load_config_file(dir / "config.yaml"), ConfigurationError);
}

TEST(ConfigTest, ProcessOptionsCarryTheNamingPolicy) {
    Config cfg;
    cfg.compress_quality = 33;
    cfg.skip_suffix = "_no";
    cfg.case_insensitive_suffixes = true;
    const auto opts = cfg.process_options();
    EXPECT_EQ(opts.quality, 33);
    EXPECT_EQ(opts.backup_folder, std::filesystem::path("original image"));
    EXPECT_EQ(opts.naming.skip_suffix, "_no");
    EXPECT_TRUE(opts.naming.case_insensitive);
}

TEST(ConfigTest, PrepareOutputFoldersCreatesSummaryFolder) {
    TempDir dir;
    const Config cfg;
    const auto summary = prepare_output_folders(cfg, dir.path());
    EXPECT_EQ(summary, dir / "summary");
    EXPECT_TRUE(std::filesystem::is_directory(summary));
}

TEST(ConfigTest, PrepareOutputFoldersWithoutCsv) {
    TempDir dir;
    Config cfg;
    cfg.save_summary_to_csv = false;
    EXPECT_TRUE(prepare_output_folders(cfg, dir.path()).empty());
    EXPECT_FALSE(std::filesystem::exists(dir / "summary"));
}

TEST(ConfigTest, PrepareOutputFoldersReportsFailure) {
    TempDir dir;
    shrink::test::write_bytes(dir / "summary", 4);
    const Config cfg;
    EXPECT_THROW((void)prepare_output_folders(cfg, dir.path()), ConfigurationError);
}
