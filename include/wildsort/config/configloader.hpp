#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <wildsort/core/errors.hpp>
#include <wildsort/config/taxonomy.hpp>
#include <wildsort/config/thresholdconfig.hpp>

namespace wildsort {

using label_map_t = std::map<int, std::string>;

struct app_config {
    std::optional<std::string> source_path;
    label_map_t names;
    taxonomy tax;
    threshold_config thresholds;
};

inline std::string label_for(const label_map_t &names, int species_id)
{
    auto it = names.find(species_id);
    if (it != names.end())
        return it->second;

    return fmt::format("class_{}", species_id);
}

namespace detail {

template <typename T>
void read_optional(const YAML::Node &node, const char *key, std::optional<T> &out)
{
    if (const YAML::Node value = node[key])
        out = value.as<T>();
}

inline std::shared_ptr<spdlog::logger> config_logger()
{
    static std::shared_ptr<spdlog::logger> logger = spdlog::default_logger()->clone("wildsort.config");
    return logger;
}

}

// class id -> name. Accepts the mapping form ({0: Wolf}) and the list form ([Wolf, Deer]).
inline label_map_t parse_names(const YAML::Node &node)
{
    label_map_t names;
    if (!node)
        return names;

    try {
        if (node.IsSequence()) {
            for (std::size_t i = 0; i < node.size(); ++i)
                names[static_cast<int>(i)] = node[i].as<std::string>();
        } else if (node.IsMap()) {
            for (const auto &entry : node)
                names[entry.first.as<int>()] = entry.second.as<std::string>();
        } else {
            throw configuration_error("'names' must be a mapping or a list");
        }
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Invalid 'names' section: {}", e.what()));
    }

    return names;
}

inline taxonomy parse_taxonomy(const YAML::Node &node)
{
    if (!node || !node.IsMap())
        throw configuration_error("'taxonomy' must be a mapping of category -> species list");

    taxonomy tax;
    try {
        for (const auto &entry : node) {
            const std::string category = entry.first.as<std::string>();
            std::vector<std::string> species;
            if (entry.second.IsSequence())
                species = entry.second.as<std::vector<std::string>>();
            else if (!entry.second.IsNull())
                throw configuration_error(fmt::format("Category '{}' must list its species", category));

            tax.add_category(category, species);
        }
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Invalid 'taxonomy' section: {}", e.what()));
    }

    const std::vector<std::string> duplicates = tax.duplicate_species();
    if (!duplicates.empty())
        detail::config_logger()->warn("Species listed under several categories, the first category wins: {}",
                                      fmt::join(duplicates, ", "));

    return tax;
}

inline threshold_config parse_thresholds(const YAML::Node &node)
{
    threshold_config config;
    if (!node)
        return config;

    if (!node.IsMap())
        throw configuration_error("'processing' must be a mapping");

    try {
        detail::read_optional(node, "confidence_threshold", config.confidence_threshold);
        detail::read_optional(node, "dominant_species_threshold", config.dominant_species_threshold);
        detail::read_optional(node, "max_species_transitions", config.max_species_transitions);
        detail::read_optional(node, "consecutive_empty_frames", config.consecutive_empty_frames);
        detail::read_optional(node, "max_unreadable_frames", config.max_unreadable_frames);
        detail::read_optional(node, "image_confidence_threshold", config.image_confidence_threshold);
        detail::read_optional(node, "image_min_detections", config.image_min_detections);
        detail::read_optional(node, "image_multi_species_threshold", config.image_multi_species_threshold);
        detail::read_optional(node, "image_unsorted_min_confidence", config.image_unsorted_min_confidence);
        detail::read_optional(node, "image_unsorted_max_confidence", config.image_unsorted_max_confidence);

        if (const YAML::Node mode = node["mode"])
            config.mode = threshold_config::modeForString(mode.as<std::string>());
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Invalid 'processing' section: {}", e.what()));
    }

    return config;
}

inline app_config parse_config(const YAML::Node &root)
{
    if (!root || !root.IsMap())
        throw configuration_error("Configuration must be a YAML mapping");

    if (!root["taxonomy"])
        throw configuration_error("Configuration missing 'taxonomy' section");

    app_config config;
    config.names = parse_names(root["names"]);
    config.tax = parse_taxonomy(root["taxonomy"]);
    config.thresholds = parse_thresholds(root["processing"]);

    return config;
}

inline app_config load_config(const std::filesystem::path &path)
{
    if (!std::filesystem::exists(path))
        throw configuration_error(fmt::format("Configuration file {} does not exist", path.string()));

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception &e) {
        throw configuration_error(fmt::format("Could not parse {}: {}", path.string(), e.what()));
    }

    app_config config = parse_config(root);
    config.source_path = std::filesystem::absolute(path).lexically_normal().string();

    detail::config_logger()->info("Loaded {} labels and {} categories ({} species) from {}",
                                  config.names.size(), config.tax.categories().size(),
                                  config.tax.species_count(), config.source_path.value());
    return config;
}

}
