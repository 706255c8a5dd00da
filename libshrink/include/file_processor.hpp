/**
 * @file file_processor.hpp
 * @brief Turns one input file into one FileRecord.
 */

#ifndef SHRINK_FILE_PROCESSOR_HPP
#define SHRINK_FILE_PROCESSOR_HPP

#include "codec_registry.hpp"
#include "file_record.hpp"
#include "naming_policy.hpp"
#include <filesystem>

namespace shrink {

/**
 * @brief Per-file settings, a subset of Config already validated.
 */
struct ProcessOptions {
    int quality = 85;                                    ///< 1..100
    bool backup = true;                                  ///< Copy the original before compressing
    std::filesystem::path backup_folder = "original image"; ///< Relative to each file's folder unless absolute
    NamingPolicy naming;
};

/**
 * @brief Applies the naming policy, the backup and the codec to one file.
 *
 * @details The processor holds no per-file state: process() can be called
 * concurrently for different files. It relies on no two calls touching the
 * same file.
 *
 * Outcomes:
 * - name matches a skip suffix: SkippedByName, nothing written;
 * - backup enabled and the backup copy already exists: SkippedBackedUp,
 *   the file is left as is;
 * - no codec for the format: Unreadable, nothing written and no backup;
 * - otherwise the original is copied to the backup folder (a failed copy
 *   is recorded and compression still goes ahead) and recompressed into a
 *   staging file. The staging file replaces the original only when it is
 *   smaller; if not, the original is kept and the record is Compressed
 *   with size_after equal to size_before.
 */
class FileProcessor {
public:
    FileProcessor(const CodecRegistry& registry, ProcessOptions options);

    /**
     * @brief Process one file. Never throws.
     * @param file Path of an image file as enumerated.
     * @return The outcome, with every failure recorded in FileRecord::errors.
     */
    [[nodiscard]] FileRecord process(const std::filesystem::path& file) const noexcept;

    [[nodiscard]] const ProcessOptions& options() const noexcept { return options_; }

private:
    void process_full(const std::filesystem::path& file,
                      const std::filesystem::path& backup_target,
                      FileRecord& record) const;

    static void make_backup(const std::filesystem::path& file,
                            const std::filesystem::path& backup_target,
                            FileRecord& record);

    void compress_in_place(const std::filesystem::path& file, const ICodec& codec, FileRecord& record) const;

    const CodecRegistry& registry_;
    ProcessOptions options_;
};

} // namespace shrink

#endif // SHRINK_FILE_PROCESSOR_HPP
