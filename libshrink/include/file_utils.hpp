#ifndef SHRINK_FILE_UTILS_HPP
#define SHRINK_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace shrink {

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief File size that reports failure as 0 instead of throwing.
     */
    std::uintmax_t safe_file_size(const std::filesystem::path &path);

    /**
     * @brief Sibling path used to stage a recompressed file before it
     * replaces @p file (same directory, so the final rename is atomic).
     */
    std::filesystem::path staging_path_for(const std::filesystem::path &file);

    /**
     * @brief Removes a file if present and logs a failure instead of throwing.
     * @param file The file to remove.
     * @param tag The logger tag.
     */
    void remove_quietly(const std::filesystem::path &file,
                        std::string_view tag = "file_utils");

} // namespace shrink

#endif // SHRINK_FILE_UTILS_HPP
