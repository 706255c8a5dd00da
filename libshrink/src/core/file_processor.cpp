#include "../../include/file_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace shrink {

FileProcessor::FileProcessor(const CodecRegistry& registry, ProcessOptions options)
    : registry_(registry),
      options_(std::move(options)) {}

FileRecord FileProcessor::process(const fs::path& file) const noexcept {
    const auto start = std::chrono::steady_clock::now();

    FileRecord record;
    try {
        record.path = file;
        record.extension = lower_extension(file);
        record.size_before = safe_file_size(file);

        fs::path backup_target;
        bool backup_present = false;
        if (options_.backup) {
            backup_target = backup_path_for(file, options_.backup_folder, options_.naming.original_suffix);
            std::error_code ec;
            backup_present = fs::exists(backup_target, ec);
        }

        switch (classify(file.filename().string(), options_.naming, backup_present)) {
            case Classification::NeedsSkip:
                record.status = Status::SkippedByName;
                Logger::log(LogLevel::Debug, "Skipped by name: " + file.string(), "FileProcessor");
                break;
            case Classification::NeedsBackupOnly:
                record.status = Status::SkippedBackedUp;
                record.size_after = record.size_before;
                Logger::log(LogLevel::Debug, "Backup already present, not recompressing: " + file.string(),
                            "FileProcessor");
                break;
            case Classification::NeedsFullProcessing:
                process_full(file, backup_target, record);
                break;
        }
    } catch (const std::exception& e) {
        // only reachable on allocation failure or a filesystem error outside the codec path
        Logger::log(LogLevel::Error, "Unexpected error on " + file.string() + ": " + e.what(), "FileProcessor");
        record.status = Status::CompressionError;
        record.size_after.reset();
        record.errors.push_back({FailureKind::EncodeFailure, e.what()});
    }

    record.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return record;
}

void FileProcessor::process_full(const fs::path& file,
                                 const fs::path& backup_target,
                                 FileRecord& record) const {
    const ICodec* codec = registry_.find_for(file);
    if (!codec) {
        Logger::log(LogLevel::Warning, "No codec for " + file.string(), "FileProcessor");
        record.status = Status::Unreadable;
        record.errors.push_back({FailureKind::UnsupportedFormat, record.extension});
        return;
    }

    if (options_.backup) {
        make_backup(file, backup_target, record);
    }
    compress_in_place(file, *codec, record);
}

void FileProcessor::make_backup(const fs::path& file,
                                const fs::path& backup_target,
                                FileRecord& record) {
    std::error_code ec;
    fs::create_directories(backup_target.parent_path(), ec);
    if (!ec) {
        fs::copy_file(file, backup_target, fs::copy_options::none, ec);
    }
    if (ec) {
        Logger::log(LogLevel::Warning,
                    "Backup failed for " + file.string() + " -> " + backup_target.string() + " (" + ec.message() + ")",
                    "FileProcessor");
        record.errors.push_back({FailureKind::BackupFailure, ec.message()});
        return;
    }
    Logger::log(LogLevel::Debug, "Backed up " + file.string() + " -> " + backup_target.string(), "FileProcessor");
}

void FileProcessor::compress_in_place(const fs::path& file, const ICodec& codec, FileRecord& record) const {
    const fs::path staging = staging_path_for(file);
    try {
        codec.recompress(file, staging, options_.quality);
    } catch (const DecodeError& e) {
        Logger::log(LogLevel::Error, "Cannot decode " + file.string() + ": " + e.what(), "FileProcessor");
        remove_quietly(staging, "FileProcessor");
        record.status = Status::Unreadable;
        record.errors.push_back({FailureKind::DecodeFailure, e.what()});
        return;
    } catch (const std::exception& e) {
        // EncodeError, or an I/O error raised while writing the staging file
        Logger::log(LogLevel::Error, "Cannot encode " + file.string() + ": " + e.what(), "FileProcessor");
        remove_quietly(staging, "FileProcessor");
        record.status = Status::CompressionError;
        record.errors.push_back({FailureKind::EncodeFailure, e.what()});
        return;
    }

    const std::uintmax_t new_size = safe_file_size(staging);
    if (new_size == 0) {
        remove_quietly(staging, "FileProcessor");
        record.status = Status::CompressionError;
        record.errors.push_back({FailureKind::EncodeFailure, std::string(codec.get_name()) + " produced an empty file"});
        return;
    }

    // accept the recompressed file only if it is smaller than the original
    if (new_size >= record.size_before) {
        remove_quietly(staging, "FileProcessor");
        record.status = Status::Compressed;
        record.size_after = record.size_before;
        Logger::log(LogLevel::Info,
                    file.string() + ": no size improvement (" + std::to_string(new_size) + " >= " +
                    std::to_string(record.size_before) + " bytes), original kept",
                    "FileProcessor");
        return;
    }

    std::error_code ec;
    fs::rename(staging, file, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Replace failed: " + file.string() + " (" + ec.message() + ")", "FileProcessor");
        remove_quietly(staging, "FileProcessor");
        record.status = Status::CompressionError;
        record.errors.push_back({FailureKind::EncodeFailure, ec.message()});
        return;
    }

    record.status = Status::Compressed;
    record.size_after = safe_file_size(file);
    Logger::log(LogLevel::Info,
                file.string() + ": " + std::to_string(record.size_before) + " -> " +
                std::to_string(*record.size_after) + " bytes",
                "FileProcessor");
}

} // namespace shrink
