#ifndef SHRINK_FILE_SCANNER_HPP
#define SHRINK_FILE_SCANNER_HPP

#include <filesystem>
#include <string_view>
#include <vector>
#include "../../../libshrink/include/config.hpp"

/// Extensions picked up by the scanner, lower-case with the dot.
inline constexpr std::string_view kImageExtensions[] = {
    ".jpg", ".jpeg", ".png", ".webp", ".bmp", ".tiff", ".gif", ".avif", ".heic"
};

/**
 * @brief List the images under @p root, sorted.
 *
 * Folders named like the backup folder (any case) and the summary folder
 * are not entered. Name-based skipping is left to the FileProcessor so
 * skipped files still appear in the report.
 */
std::vector<std::filesystem::path>
collect_image_files(const std::filesystem::path& root, const shrink::Config& cfg);

#endif // SHRINK_FILE_SCANNER_HPP
