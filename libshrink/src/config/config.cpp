#include "../../include/config.hpp"
#include "../../include/config_yaml.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <system_error>
#include <thread>

namespace shrink {

unsigned default_thread_count() noexcept {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw / 2 > 0 ? hw / 2 : 1U;
}

NamingPolicy Config::naming_policy() const {
    NamingPolicy policy;
    policy.original_suffix = original_suffix;
    policy.skip_suffix = skip_suffix;
    policy.skip_original = skip_original;
    policy.skip_skip = skip_skip;
    policy.case_insensitive = case_insensitive_suffixes;
    return policy;
}

ProcessOptions Config::process_options() const {
    ProcessOptions opts;
    opts.quality = compress_quality;
    opts.backup = backup;
    opts.backup_folder = backup_folder;
    opts.naming = naming_policy();
    return opts;
}

std::vector<std::string> missing_config_keys(const YAML::Node& node) {
    std::vector<std::string> missing;
    const YAML::Node defaults = YAML::convert<Config>::encode(Config{});
    for (const auto& entry : defaults) {
        const auto key = entry.first.as<std::string>();
        if (!node.IsMap() || !node[key]) missing.push_back(key);
    }
    return missing;
}

Config load_config_file(const std::filesystem::path& path) {
    Config cfg;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        Logger::log(LogLevel::Debug, "No config file at " + path.string() + ", using defaults", "config");
        return cfg;
    }

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return cfg;
        if (!YAML::convert<Config>::decode(root, cfg)) {
            throw ConfigurationError("config file " + path.string() + " is not a mapping");
        }
        const YAML::Node defaults = YAML::convert<Config>::encode(Config{});
        for (const auto& key : missing_config_keys(root)) {
            Logger::log(LogLevel::Info,
                        "Missing parameter '" + key + "' in " + path.string() +
                        ", using default: " + defaults[key].as<std::string>(),
                        "config");
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("cannot read config file " + path.string() + ": " + e.what());
    }

    Logger::log(LogLevel::Info, "Loaded config file " + path.string(), "config");
    return cfg;
}

void validate_config(const Config& cfg) {
    if (cfg.compress_quality < 1 || cfg.compress_quality > 100) {
        throw ConfigurationError("compress_quality must be between 1 and 100, got "
                                 + std::to_string(cfg.compress_quality));
    }
    if (cfg.threads < 1) {
        throw ConfigurationError("threads must be at least 1");
    }
    if (cfg.backup && cfg.backup_folder.empty()) {
        throw ConfigurationError("backup_folder must not be empty when backup is enabled");
    }
    if (cfg.save_summary_to_csv && cfg.summary_filename.empty()) {
        throw ConfigurationError("summary_filename must not be empty when save_summary_to_csv is enabled");
    }
    if (cfg.lang_code.empty()) {
        throw ConfigurationError("lang_code must not be empty");
    }
}

std::filesystem::path prepare_output_folders(const Config& cfg, const std::filesystem::path& root) {
    std::error_code ec;

    const std::filesystem::path backup_dir(cfg.backup_folder);
    if (cfg.backup && backup_dir.is_absolute()) {
        std::filesystem::create_directories(backup_dir, ec);
        if (ec) {
            throw ConfigurationError("cannot create backup folder " + backup_dir.string() + ": " + ec.message());
        }
    }

    if (!cfg.save_summary_to_csv) return {};

    const auto summary_dir = root / cfg.summary_folder;
    std::filesystem::create_directories(summary_dir, ec);
    if (ec) {
        throw ConfigurationError("cannot create summary folder " + summary_dir.string() + ": " + ec.message());
    }
    return summary_dir;
}

} // namespace shrink
