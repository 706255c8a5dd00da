/**
 * @file config.hpp
 * @brief Run configuration, loaded from YAML and overridden from the command line.
 */

#ifndef SHRINK_CONFIG_HPP
#define SHRINK_CONFIG_HPP

#include "file_processor.hpp"
#include "naming_policy.hpp"
#include <filesystem>
#include <string>

namespace shrink {

/// hardware_concurrency / 2, at least 1.
[[nodiscard]] unsigned default_thread_count() noexcept;

/**
 * @brief Every setting of a run. Validated once by validate_config();
 * the core never re-checks it.
 */
struct Config {
    std::string path;                            ///< Folder to process; empty means ask the user
    int compress_quality = 85;                   ///< 1..100
    bool backup = true;
    std::string backup_folder = "original image";
    std::string original_suffix = "_original";
    std::string skip_suffix = "_skip";
    bool skip_original = true;
    bool skip_skip = true;
    bool case_insensitive_suffixes = false;
    bool print_image_reduced = true;             ///< One line per processed file
    bool print_summary = true;
    bool save_summary_to_csv = true;
    std::string summary_folder = "summary";      ///< Created under the processed folder
    std::string summary_filename = "report";     ///< Without timestamp and extension
    std::string lang_code = "zh-tw";
    std::string language_dir = "language";
    unsigned threads = default_thread_count();
    bool recursive = true;

    [[nodiscard]] NamingPolicy naming_policy() const;
    [[nodiscard]] ProcessOptions process_options() const;
};

/**
 * @brief Read a YAML config file. Keys that are absent keep their defaults.
 * @return Defaults if @p path does not exist.
 * @throws ConfigurationError if the file exists but cannot be parsed.
 */
Config load_config_file(const std::filesystem::path& path);

/**
 * @brief Range and consistency checks.
 * @throws ConfigurationError naming the first offending field.
 */
void validate_config(const Config& cfg);

/**
 * @brief Create the folders the run writes to: the summary folder under
 * @p root when CSV output is on, and the backup folder when it is absolute.
 * @return The summary folder (empty when CSV output is off).
 * @throws ConfigurationError if a folder cannot be created.
 */
std::filesystem::path prepare_output_folders(const Config& cfg, const std::filesystem::path& root);

} // namespace shrink

#endif // SHRINK_CONFIG_HPP
