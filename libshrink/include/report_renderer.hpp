/**
 * @file report_renderer.hpp
 * @brief Localized console and CSV rendering of an AggregateSnapshot.
 *
 * Everything here is a pure function of its arguments except
 * write_csv_report(), which writes the rendered document to disk. Every
 * user-visible string goes through the LanguagePack; a missing message
 * makes the render call throw MissingMessageError.
 */

#ifndef SHRINK_REPORT_RENDERER_HPP
#define SHRINK_REPORT_RENDERER_HPP

#include "aggregator.hpp"
#include "file_record.hpp"
#include "language_pack.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace shrink {

/**
 * @brief Every message key used by the renderer and the CLI.
 *
 * Checked with LanguagePack::require() at startup so a broken language
 * pack is reported before any file is touched.
 */
inline constexpr std::string_view kRequiredMessageKeys[] = {
    "general.ask_input_path",
    "general.folder_not_found",
    "general.start_processing",
    "general.finished_processing",
    "general.saved_report",
    "general.interrupted",

    "status.compressed",
    "status.skipped_backup",
    "status.skipped_named",
    "status.unreadable",
    "status.compression_error",

    "error.backup",
    "error.unsupported",
    "error.decode",
    "error.encode",

    "progress.size_change",
    "progress.status_only",
    "progress.failed",
    "progress.with_warning",

    "units.KB",
    "units.MB",
    "units.GB",

    "report.header_summary",
    "report.header_ext_summary",
    "report.start_time",
    "report.end_time",
    "report.elapsed",
    "report.avg_time",
    "report.no_avg_time",
    "report.total_images",
    "report.compressed_success",
    "report.skipped_backup",
    "report.skipped_named",
    "report.error_unreadable",
    "report.error_failed",
    "report.size_before",
    "report.size_after",
    "report.size_saved",
    "report.size_saved_unavailable",
    "report.ext_format",

    "csv.section_summary",
    "csv.section_ext",
    "csv.section_detail",
    "csv.unavailable",
    "csv.fields.key",
    "csv.fields.value",
    "csv.fields.start_time",
    "csv.fields.end_time",
    "csv.fields.elapsed",
    "csv.fields.avg_time",
    "csv.fields.total_images",
    "csv.fields.compressed",
    "csv.fields.skipped_backup",
    "csv.fields.skipped_named",
    "csv.fields.unreadable",
    "csv.fields.errors",
    "csv.fields.size_before",
    "csv.fields.size_after",
    "csv.fields.size_saved",
    "csv.fields.size_percent",
    "csv.fields.ext",
    "csv.fields.ext_count",
    "csv.fields.ext_before",
    "csv.fields.ext_after",
    "csv.fields.ext_saved",
    "csv.fields.ext_percent",
    "csv.fields.detail_path",
    "csv.fields.detail_ext",
    "csv.fields.detail_before",
    "csv.fields.detail_after",
    "csv.fields.detail_percent",
    "csv.fields.detail_status",
    "csv.fields.detail_time",
    "csv.fields.detail_error",
};

/**
 * @brief A byte count scaled for display.
 */
struct HumanSize {
    double value{};         ///< Scaled magnitude, sign preserved
    std::string_view unit;  ///< "KB", "MB" or "GB"; also the suffix of the "units.*" key
};

/**
 * @brief Scale @p bytes to the largest of KB/MB/GB whose magnitude is at
 * least 1, falling back to KB for anything under 1 KB. 1024-based.
 */
[[nodiscard]] HumanSize human_size(double bytes) noexcept;

/// (before - after) / before * 100, or nullopt when before is 0.
[[nodiscard]] std::optional<double> percent_saved(std::uintmax_t before, std::uintmax_t after) noexcept;

/// Average seconds per compressed file, or nullopt when nothing was compressed.
[[nodiscard]] std::optional<double> average_seconds(const AggregateSnapshot& snapshot) noexcept;

/// "H:MM:SS.ss"
[[nodiscard]] std::string format_duration(double seconds);

/// Local time, using a strftime pattern.
[[nodiscard]] std::string format_timestamp(AggregateSnapshot::Clock::time_point when,
                                           const char* pattern = "%Y-%m-%d %H:%M:%S");

/// Quote a CSV field if it contains a separator, a quote or a line break.
[[nodiscard]] std::string csv_escape(std::string_view data);

/// Localized label of a status (the "status.*" messages).
[[nodiscard]] std::string status_label(Status status, const LanguagePack& lang);

/// Localized description of every failure of @p record, joined with "; ".
[[nodiscard]] std::string render_failures(const FileRecord& record, const LanguagePack& lang);

/// One console line for a processed file, without trailing newline.
[[nodiscard]] std::string render_progress_line(const FileRecord& record, const LanguagePack& lang);

/// Human-readable summary: totals, timings, sizes, then one line per extension.
[[nodiscard]] std::string render_console(const AggregateSnapshot& snapshot, const LanguagePack& lang);

/**
 * @brief CSV document with three sections: summary key/value pairs,
 * per-extension rows (first-seen order), per-file rows (input order).
 *
 * Each section starts with a localized title line and a localized column
 * header line; sections are separated by an empty line. Byte counts are
 * written as raw integers.
 */
[[nodiscard]] std::string render_csv(const AggregateSnapshot& snapshot, const LanguagePack& lang);

/**
 * @brief Render the CSV and write it as UTF-8 with BOM to
 * `<folder>/<filename>_<YYYY-mm-dd-HH-MM-SS>.csv`, stamped with end_time.
 * @return Path of the written file.
 * @throws std::runtime_error if the file cannot be written.
 */
std::filesystem::path write_csv_report(const AggregateSnapshot& snapshot,
                                       const LanguagePack& lang,
                                       const std::filesystem::path& folder,
                                       const std::string& filename);

} // namespace shrink

#endif // SHRINK_REPORT_RENDERER_HPP
