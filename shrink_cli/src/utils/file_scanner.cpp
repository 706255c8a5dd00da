#include "file_scanner.hpp"
#include "../../../libshrink/include/file_record.hpp"
#include "../../../libshrink/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_image_extension(const fs::path& p) {
    const auto ext = shrink::lower_extension(p);
    return std::ranges::find(kImageExtensions, std::string_view(ext)) != std::end(kImageExtensions);
}

bool is_excluded_dir(const fs::path& dir, const std::string& backup_lower, const std::string& summary_name) {
    const auto name = dir.filename().string();
    if (!backup_lower.empty() && to_lower(name) == backup_lower) return true;
    return !summary_name.empty() && name == summary_name;
}

} // namespace

std::vector<fs::path> collect_image_files(const fs::path& root, const shrink::Config& cfg) {
    std::vector<fs::path> files;

    // an absolute backup folder lives outside the tree and needs no exclusion
    const std::string backup_lower =
        fs::path(cfg.backup_folder).is_absolute() ? std::string{} : to_lower(cfg.backup_folder);
    const std::string summary_name = cfg.save_summary_to_csv ? cfg.summary_folder : std::string{};

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::log(LogLevel::Error, "Scanner error: cannot open '" + root.string() + "': " + ec.message(),
                    "file_scanner");
        return files;
    }

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            Logger::log(LogLevel::Warning, "Scanner error: " + ec.message(), "file_scanner");
            ec.clear();
            continue;
        }

        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (!cfg.recursive || is_excluded_dir(entry.path(), backup_lower, summary_name)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(type_ec) && is_image_extension(entry.path())) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(files.size()) + " images under " + root.string(),
                "file_scanner");
    return files;
}
