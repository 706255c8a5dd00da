/**
 * @file file_record.hpp
 * @brief Per-file outcome produced by FileProcessor.
 */

#ifndef SHRINK_FILE_RECORD_HPP
#define SHRINK_FILE_RECORD_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shrink {

/**
 * @brief Terminal outcome of one file. Exactly one per FileRecord.
 */
enum class Status {
    Compressed,       ///< Recompressed and written back in place
    SkippedBackedUp,  ///< A backup from an earlier run exists; not compressed again
    SkippedByName,    ///< Excluded by the naming policy before any I/O
    Unreadable,       ///< No codec for the format, or the codec could not decode it
    CompressionError  ///< Decoded, but re-encoding or writing the result failed
};

/**
 * @brief Classified cause of a per-file failure.
 */
enum class FailureKind {
    BackupFailure,     ///< Copying the original to the backup folder failed
    UnsupportedFormat, ///< No codec handles this file
    DecodeFailure,     ///< The codec rejected the input
    EncodeFailure      ///< Encoding, writing or replacing the output failed
};

/**
 * @brief A failure and its technical context (library message, errno text).
 *
 * The detail is not localized; the report renderer wraps it in a
 * localized template chosen by kind.
 */
struct Failure {
    FailureKind kind;
    std::string detail;
};

struct FileRecord {
    std::filesystem::path path;              ///< Path as enumerated
    std::string extension;                   ///< Lower-cased extension including the dot
    std::uintmax_t size_before{};            ///< Size before processing, in bytes
    std::optional<std::uintmax_t> size_after;///< Size after processing, unset if never produced
    Status status{Status::Unreadable};
    double elapsed_seconds{};                ///< Wall-clock time spent in FileProcessor::process
    std::vector<Failure> errors;             ///< Every failure met, in order

    [[nodiscard]] bool has_error() const noexcept { return !errors.empty(); }
};

/// Stable, untranslated identifier of a status (used in logs).
[[nodiscard]] std::string_view to_string(Status status) noexcept;

/// Stable, untranslated identifier of a failure kind (used in logs).
[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;

/// Lower-cased extension of a path, including the leading dot.
[[nodiscard]] std::string lower_extension(const std::filesystem::path& path);

} // namespace shrink

#endif // SHRINK_FILE_RECORD_HPP
