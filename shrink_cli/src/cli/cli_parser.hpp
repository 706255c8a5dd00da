#ifndef SHRINK_CLI_PARSER_HPP
#define SHRINK_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "../../../libshrink/include/config.hpp"

// forward declaration
namespace CLI { class App; }

/**
 * @brief Command-line state. Every config override is optional: an unset
 * value leaves the config-file value (or the default) in place.
 */
struct Settings {
    std::filesystem::path config_path = "config.yaml";
    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    bool about = false;

    std::optional<std::string> path;
    std::optional<int> compress_quality;
    std::optional<bool> backup;
    std::optional<std::string> backup_folder;
    std::optional<std::string> original_suffix;
    std::optional<std::string> skip_suffix;
    std::optional<bool> skip_original;
    std::optional<bool> skip_skip;
    std::optional<bool> case_insensitive_suffixes;
    std::optional<bool> print_image_reduced;
    std::optional<bool> print_summary;
    std::optional<bool> save_summary_to_csv;
    std::optional<std::string> summary_folder;
    std::optional<std::string> summary_filename;
    std::optional<std::string> lang_code;
    std::optional<std::string> language_dir;
    std::optional<unsigned> threads;
    std::optional<bool> recursive;
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

/// Command line wins over the config file.
void apply_overrides(const Settings& settings, shrink::Config& cfg);

#endif // SHRINK_CLI_PARSER_HPP
