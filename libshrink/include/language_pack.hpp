/**
 * @file language_pack.hpp
 * @brief Localized message templates with named placeholders.
 */

#ifndef SHRINK_LANGUAGE_PACK_HPP
#define SHRINK_LANGUAGE_PACK_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace shrink {

/// Value substituted into a placeholder.
using MessageValue = std::variant<std::string, std::int64_t, std::uint64_t, double>;

/// Named arguments for LanguagePack::format, e.g. {{"count", 3}}.
using MessageArgs = std::vector<std::pair<std::string, MessageValue>>;

/**
 * @brief Maps dot-path message keys to templates for one language.
 *
 * Templates use Python-style named fields, formatted with fmt:
 * "{count}", "{size:.2f} {unit}", "{ext:<6}". A LanguagePack is a plain
 * value: it is passed explicitly to the renderer, never looked up
 * globally.
 */
class LanguagePack {
public:
    LanguagePack() = default;
    LanguagePack(std::string code, std::unordered_map<std::string, std::string> messages);

    /**
     * @brief Load `<dir>/<code>.yaml`.
     * @throws ConfigurationError if the file is missing or not valid YAML.
     */
    static LanguagePack load(const std::filesystem::path& dir, const std::string& code);

    /**
     * @brief Load a YAML file; nested maps become dot-path keys.
     * @param path The YAML file.
     * @param code Language code to report in errors; defaults to the file stem.
     * @throws ConfigurationError
     */
    static LanguagePack load_file(const std::filesystem::path& path, std::string code = {});

    /**
     * @brief Parse YAML text. Scalars nested under maps become
     * "outer.inner" keys; sequences are rejected.
     * @throws ConfigurationError
     */
    static LanguagePack from_yaml(const std::string& code, const std::string& yaml_text);

    [[nodiscard]] const std::string& code() const noexcept { return code_; }
    [[nodiscard]] std::size_t size() const noexcept { return messages_.size(); }
    [[nodiscard]] bool contains(std::string_view key) const;

    /**
     * @brief Raw template for @p key.
     * @throws MissingMessageError if the key is absent.
     */
    [[nodiscard]] const std::string& lookup(std::string_view key) const;

    /**
     * @brief Template for @p key with @p args substituted.
     * @throws MissingMessageError if the key is absent.
     * @throws ConfigurationError if the template is malformed or names a
     *         placeholder missing from @p args.
     */
    [[nodiscard]] std::string format(std::string_view key, const MessageArgs& args = {}) const;

    /**
     * @brief Check that every key in @p keys is defined.
     * @throws MissingMessageError naming the first missing key.
     */
    void require(std::span<const std::string_view> keys) const;

private:
    std::string code_;
    std::unordered_map<std::string, std::string> messages_;
};

} // namespace shrink

#endif // SHRINK_LANGUAGE_PACK_HPP
