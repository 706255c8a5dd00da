#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

#ifndef SHRINK_VERSION
#define SHRINK_VERSION "0.0.0"
#endif

namespace {

template <typename T>
void override_if_set(const std::optional<T>& value, T& target) {
    if (value) target = *value;
}

} // namespace

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", SHRINK_VERSION);

    app.add_flag("--about", settings.about,
                 "Show project information and exit.");

    app.add_option("--config", settings.config_path,
                   "Path to the YAML configuration file.")
                   ->default_val("config.yaml");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("WARNING")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to this file.");

    // --- Run settings (override config.yaml) ---
    app.add_option("--path", settings.path,
                   "Folder of images to compress. Asked interactively when missing.");

    // range is checked by validate_config so a bad value is a configuration error
    app.add_option("--compress_quality", settings.compress_quality,
                   "Compression quality (1-100).");

    app.add_option("--backup", settings.backup,
                   "Copy each original into the backup folder before compressing (true/false).");

    app.add_option("--backup_folder", settings.backup_folder,
                   "Backup folder name, created next to each image (or an absolute path).");

    app.add_option("--original_suffix", settings.original_suffix,
                   "Suffix added to backup copies.");

    app.add_option("--skip_suffix", settings.skip_suffix,
                   "Images whose name ends with this suffix are left alone.");

    app.add_option("--skip_original", settings.skip_original,
                   "Skip images whose name ends with the original suffix (true/false).");

    app.add_option("--skip_skip", settings.skip_skip,
                   "Skip images whose name ends with the skip suffix (true/false).");

    app.add_option("--case_insensitive_suffixes", settings.case_insensitive_suffixes,
                   "Match suffixes regardless of case (true/false).");

    app.add_option("--print_image_reduced", settings.print_image_reduced,
                   "Print one line per processed image (true/false).");

    app.add_option("--print_summary", settings.print_summary,
                   "Print the summary report (true/false).");

    app.add_option("--save_summary_to_csv", settings.save_summary_to_csv,
                   "Save the summary report as CSV (true/false).");

    app.add_option("--summary_folder", settings.summary_folder,
                   "Folder, inside the processed folder, for CSV reports.");

    app.add_option("--summary_filename", settings.summary_filename,
                   "CSV report name, without timestamp and extension.");

    app.add_option("--lang_code", settings.lang_code,
                   "Language of messages and reports, e.g. zh-tw, en.");

    app.add_option("--language_dir", settings.language_dir,
                   "Folder holding the <lang_code>.yaml language files.");

    app.add_option("--threads", settings.threads,
                   "Threads to use for parallel compression.")
                   ->check(CLI::PositiveNumber);

    app.add_option("--recursive", settings.recursive,
                   "Descend into subfolders (true/false).");
}

void apply_overrides(const Settings& settings, shrink::Config& cfg) {
    override_if_set(settings.path, cfg.path);
    override_if_set(settings.compress_quality, cfg.compress_quality);
    override_if_set(settings.backup, cfg.backup);
    override_if_set(settings.backup_folder, cfg.backup_folder);
    override_if_set(settings.original_suffix, cfg.original_suffix);
    override_if_set(settings.skip_suffix, cfg.skip_suffix);
    override_if_set(settings.skip_original, cfg.skip_original);
    override_if_set(settings.skip_skip, cfg.skip_skip);
    override_if_set(settings.case_insensitive_suffixes, cfg.case_insensitive_suffixes);
    override_if_set(settings.print_image_reduced, cfg.print_image_reduced);
    override_if_set(settings.print_summary, cfg.print_summary);
    override_if_set(settings.save_summary_to_csv, cfg.save_summary_to_csv);
    override_if_set(settings.summary_folder, cfg.summary_folder);
    override_if_set(settings.summary_filename, cfg.summary_filename);
    override_if_set(settings.lang_code, cfg.lang_code);
    override_if_set(settings.language_dir, cfg.language_dir);
    override_if_set(settings.threads, cfg.threads);
    override_if_set(settings.recursive, cfg.recursive);
}
