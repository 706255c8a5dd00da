#include "../../include/file_record.hpp"
#include <algorithm>
#include <cctype>

namespace shrink {

std::string_view to_string(const Status status) noexcept {
    switch (status) {
        case Status::Compressed:       return "compressed";
        case Status::SkippedBackedUp:  return "skipped_backed_up";
        case Status::SkippedByName:    return "skipped_by_name";
        case Status::Unreadable:       return "unreadable";
        case Status::CompressionError: return "compression_error";
    }
    return "";
}

std::string_view to_string(const FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::BackupFailure:     return "backup_failure";
        case FailureKind::UnsupportedFormat: return "unsupported_format";
        case FailureKind::DecodeFailure:     return "decode_failure";
        case FailureKind::EncodeFailure:     return "encode_failure";
    }
    return "";
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace shrink
