#ifndef SHRINK_CONFIG_YAML_HPP
#define SHRINK_CONFIG_YAML_HPP

#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <string>
#include <vector>

namespace YAML {

template<>
struct convert<shrink::Config> {
    static Node encode(const shrink::Config& rhs) {
        Node node;
        node["path"] = rhs.path;
        node["compress_quality"] = rhs.compress_quality;
        node["backup"] = rhs.backup;
        node["backup_folder"] = rhs.backup_folder;
        node["original_suffix"] = rhs.original_suffix;
        node["skip_suffix"] = rhs.skip_suffix;
        node["skip_original"] = rhs.skip_original;
        node["skip_skip"] = rhs.skip_skip;
        node["case_insensitive_suffixes"] = rhs.case_insensitive_suffixes;
        node["print_image_reduced"] = rhs.print_image_reduced;
        node["print_summary"] = rhs.print_summary;
        node["save_summary_to_csv"] = rhs.save_summary_to_csv;
        node["summary_folder"] = rhs.summary_folder;
        node["summary_filename"] = rhs.summary_filename;
        node["lang_code"] = rhs.lang_code;
        node["language_dir"] = rhs.language_dir;
        node["threads"] = rhs.threads;
        node["recursive"] = rhs.recursive;
        return node;
    }

    // absent keys keep whatever rhs already holds
    static bool decode(const Node& node, shrink::Config& rhs) {
        if (!node.IsMap()) return false;
        if (node["path"] && !node["path"].IsNull()) rhs.path = node["path"].as<std::string>();
        if (node["compress_quality"]) rhs.compress_quality = node["compress_quality"].as<int>();
        if (node["backup"]) rhs.backup = node["backup"].as<bool>();
        if (node["backup_folder"]) rhs.backup_folder = node["backup_folder"].as<std::string>();
        if (node["original_suffix"]) rhs.original_suffix = node["original_suffix"].as<std::string>();
        if (node["skip_suffix"]) rhs.skip_suffix = node["skip_suffix"].as<std::string>();
        if (node["skip_original"]) rhs.skip_original = node["skip_original"].as<bool>();
        if (node["skip_skip"]) rhs.skip_skip = node["skip_skip"].as<bool>();
        if (node["case_insensitive_suffixes"])
            rhs.case_insensitive_suffixes = node["case_insensitive_suffixes"].as<bool>();
        if (node["print_image_reduced"]) rhs.print_image_reduced = node["print_image_reduced"].as<bool>();
        if (node["print_summary"]) rhs.print_summary = node["print_summary"].as<bool>();
        if (node["save_summary_to_csv"]) rhs.save_summary_to_csv = node["save_summary_to_csv"].as<bool>();
        if (node["summary_folder"]) rhs.summary_folder = node["summary_folder"].as<std::string>();
        if (node["summary_filename"]) rhs.summary_filename = node["summary_filename"].as<std::string>();
        if (node["lang_code"]) rhs.lang_code = node["lang_code"].as<std::string>();
        if (node["language_dir"]) rhs.language_dir = node["language_dir"].as<std::string>();
        if (node["threads"]) rhs.threads = node["threads"].as<unsigned>();
        if (node["recursive"]) rhs.recursive = node["recursive"].as<bool>();
        return true;
    }
};

} // namespace YAML

namespace shrink {

/// Config keys absent from @p node, in declaration order; they keep their defaults.
std::vector<std::string> missing_config_keys(const YAML::Node& node);

} // namespace shrink

#endif // SHRINK_CONFIG_YAML_HPP
