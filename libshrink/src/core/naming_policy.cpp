#include "../../include/naming_policy.hpp"
#include <algorithm>
#include <cctype>

namespace shrink {

namespace {

bool ends_with(const std::string_view s, const std::string_view suffix, const bool case_insensitive) {
    if (suffix.size() > s.size()) return false;
    const auto tail = s.substr(s.size() - suffix.size());
    if (!case_insensitive) return tail == suffix;
    return std::equal(tail.begin(), tail.end(), suffix.begin(), suffix.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace

bool stem_has_suffix(const std::string_view filename,
                     const std::string_view suffix,
                     const bool case_insensitive) {
    if (suffix.empty()) return false;
    const std::string stem = std::filesystem::path(filename).stem().string();
    return ends_with(stem, suffix, case_insensitive);
}

Classification classify(const std::string_view filename,
                        const NamingPolicy& policy,
                        const bool backup_present) {
    const std::string name = std::filesystem::path(filename).filename().string();

    if (policy.skip_skip && stem_has_suffix(name, policy.skip_suffix, policy.case_insensitive)) {
        return Classification::NeedsSkip;
    }
    if (policy.skip_original && stem_has_suffix(name, policy.original_suffix, policy.case_insensitive)) {
        return Classification::NeedsSkip;
    }
    if (backup_present) {
        return Classification::NeedsBackupOnly;
    }
    return Classification::NeedsFullProcessing;
}

std::filesystem::path backup_path_for(const std::filesystem::path& file,
                                      const std::filesystem::path& backup_folder,
                                      const std::string_view original_suffix) {
    const std::filesystem::path dir = backup_folder.is_absolute()
                                          ? backup_folder
                                          : file.parent_path() / backup_folder;
    std::string name = file.stem().string();
    name += original_suffix;
    name += file.extension().string();
    return dir / name;
}

} // namespace shrink
