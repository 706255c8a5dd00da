/**
 * @file naming_policy.hpp
 * @brief Filename rules deciding whether a file is processed at all.
 */

#ifndef SHRINK_NAMING_POLICY_HPP
#define SHRINK_NAMING_POLICY_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace shrink {

/**
 * @brief Suffix configuration for name-based skipping and backup naming.
 *
 * A file "photo_original.jpg" has stem "photo_original"; it carries the
 * original suffix "_original" and is, by default, a backup made by an
 * earlier run.
 */
struct NamingPolicy {
    std::string original_suffix = "_original"; ///< Appended to backup copies
    std::string skip_suffix = "_skip";         ///< Marks files the user wants left alone
    bool skip_original = true;                 ///< Skip stems ending with original_suffix
    bool skip_skip = true;                     ///< Skip stems ending with skip_suffix
    bool case_insensitive = false;             ///< Compare suffixes ignoring ASCII case
};

enum class Classification {
    NeedsSkip,          ///< Excluded by name; no I/O beyond a stat
    NeedsBackupOnly,    ///< Already backed up by an earlier run; do not compress again
    NeedsFullProcessing ///< Back up (when enabled) and compress
};

/**
 * @brief Classify a file name. Pure: same inputs, same answer.
 *
 * Rules, first match wins:
 * 1. skip_skip and the stem ends with skip_suffix: NeedsSkip.
 * 2. skip_original and the stem ends with original_suffix: NeedsSkip.
 * 3. backup_present: NeedsBackupOnly.
 * 4. otherwise NeedsFullProcessing.
 *
 * @param filename File name (a full path is accepted; only its last
 *        component is used).
 * @param policy Suffix configuration.
 * @param backup_present True when backups are enabled and the backup copy
 *        for this file already exists.
 */
[[nodiscard]] Classification classify(std::string_view filename,
                                      const NamingPolicy& policy,
                                      bool backup_present = false);

/**
 * @brief True if the stem of @p filename ends with @p suffix.
 *
 * An empty suffix never matches.
 */
[[nodiscard]] bool stem_has_suffix(std::string_view filename,
                                   std::string_view suffix,
                                   bool case_insensitive);

/**
 * @brief Where the backup copy of @p file goes.
 *
 * `<dir>/<stem><original_suffix><ext>`, with `<dir>` = @p backup_folder
 * when absolute, otherwise `<file's parent>/<backup_folder>`.
 */
[[nodiscard]] std::filesystem::path backup_path_for(const std::filesystem::path& file,
                                                    const std::filesystem::path& backup_folder,
                                                    std::string_view original_suffix);

} // namespace shrink

#endif // SHRINK_NAMING_POLICY_HPP
