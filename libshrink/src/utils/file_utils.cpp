#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace shrink {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    std::uintmax_t safe_file_size(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        return ec ? 0 : size;
    }

    std::filesystem::path staging_path_for(const std::filesystem::path& file) {
        return file.parent_path() / (file.filename().string() + ".shrink.tmp");
    }

    void remove_quietly(const std::filesystem::path& file, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove " + file.string() + " (" + ec.message() + ")", tag);
        }
    }

} // namespace shrink
