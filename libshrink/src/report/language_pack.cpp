#include "../../include/language_pack.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <fmt/args.h>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace shrink {

namespace {

void flatten(const YAML::Node& node,
             const std::string& prefix,
             std::unordered_map<std::string, std::string>& out) {
    if (node.IsMap()) {
        for (const auto& entry : node) {
            const auto key = entry.first.as<std::string>();
            flatten(entry.second, prefix.empty() ? key : prefix + "." + key, out);
        }
    } else if (node.IsScalar()) {
        out[prefix] = node.as<std::string>();
    } else if (node.IsNull()) {
        out[prefix] = "";
    } else {
        throw ConfigurationError("unsupported YAML node at '" + prefix + "' (only maps and strings are allowed)");
    }
}

} // namespace

LanguagePack::LanguagePack(std::string code, std::unordered_map<std::string, std::string> messages)
    : code_(std::move(code)),
      messages_(std::move(messages)) {}

LanguagePack LanguagePack::load(const std::filesystem::path& dir, const std::string& code) {
    return load_file(dir / (code + ".yaml"), code);
}

LanguagePack LanguagePack::load_file(const std::filesystem::path& path, std::string code) {
    if (code.empty()) code = path.stem().string();
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("language file not found: " + path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("invalid language file " + path.string() + ": " + e.what());
    }

    std::unordered_map<std::string, std::string> messages;
    if (root.IsMap()) {
        flatten(root, "", messages);
    } else if (!root.IsNull()) {
        throw ConfigurationError("language file " + path.string() + " must contain a map");
    }
    Logger::log(LogLevel::Debug,
                "Loaded " + std::to_string(messages.size()) + " messages for '" + code + "' from " + path.string(),
                "LanguagePack");
    return {std::move(code), std::move(messages)};
}

LanguagePack LanguagePack::from_yaml(const std::string& code, const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("invalid language pack '" + code + "': " + e.what());
    }
    std::unordered_map<std::string, std::string> messages;
    if (root.IsMap()) {
        flatten(root, "", messages);
    }
    return {code, std::move(messages)};
}

bool LanguagePack::contains(const std::string_view key) const {
    return messages_.find(std::string(key)) != messages_.end();
}

const std::string& LanguagePack::lookup(const std::string_view key) const {
    const auto it = messages_.find(std::string(key));
    if (it == messages_.end()) {
        throw MissingMessageError(code_, std::string(key));
    }
    return it->second;
}

std::string LanguagePack::format(const std::string_view key, const MessageArgs& args) const {
    const std::string& tmpl = lookup(key);

    fmt::dynamic_format_arg_store<fmt::format_context> store;
    for (const auto& [name, value] : args) {
        std::visit([&store, &name](const auto& v) { store.push_back(fmt::arg(name.c_str(), v)); }, value);
    }

    try {
        return fmt::vformat(tmpl, store);
    } catch (const fmt::format_error& e) {
        throw ConfigurationError("message '" + std::string(key) + "' in language pack '" + code_ +
                                 "' cannot be formatted: " + e.what());
    }
}

void LanguagePack::require(const std::span<const std::string_view> keys) const {
    for (const auto key : keys) {
        if (!contains(key)) {
            throw MissingMessageError(code_, std::string(key));
        }
    }
}

} // namespace shrink
