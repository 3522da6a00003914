#include "config.hpp"
#include "util.hpp"
#include <filesystem>

#include <yaml-cpp/yaml.h>

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // namespace

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    std::error_code ec;
    if (config_file.empty() || !std::filesystem::exists(config_file, ec)) {
        return config;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(config_file);

        if (yaml["server"]) {
            const auto& server = yaml["server"];
            read_value(server, "host", config.server.host);
            read_value(server, "port", config.server.port);
        }

        if (yaml["artifacts"]) {
            const auto& artifacts = yaml["artifacts"];
            read_value(artifacts, "base_dir", config.artifacts.base_dir);
            read_value(artifacts, "catalog_file", config.artifacts.catalog_file);
            read_value(artifacts, "catalog_fallback_file", config.artifacts.catalog_fallback_file);
            read_value(artifacts, "similarity_map_file", config.artifacts.similarity_map_file);
            read_value(artifacts, "dimension_hint_file", config.artifacts.dimension_hint_file);
            read_value(artifacts, "ann_index_file", config.artifacts.ann_index_file);
            read_value(artifacts, "default_dimension", config.artifacts.default_dimension);
        }

        if (yaml["recommend"]) {
            const auto& recommend = yaml["recommend"];
            read_value(recommend, "default_k", config.recommend.default_k);
            read_value(recommend, "max_k", config.recommend.max_k);
            read_value(recommend, "candidate_limit", config.recommend.candidate_limit);
        }

        if (yaml["logging"]) {
            read_value(yaml["logging"], "level", config.log_level);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error loading configuration " + config_file + ": " + e.what());
    }

    validate_config(config);
    return config;
}

void validate_config(const Config& config) {
    if (config.server.port == 0) {
        throw ConfigError("server.port must be positive");
    }
    if (config.artifacts.base_dir.empty()) {
        throw ConfigError("artifacts.base_dir must not be empty");
    }
    if (config.artifacts.catalog_file.empty() || config.artifacts.ann_index_file.empty()) {
        throw ConfigError("artifacts.catalog_file and artifacts.ann_index_file must not be empty");
    }
    if (config.artifacts.default_dimension <= 0) {
        throw ConfigError("artifacts.default_dimension must be positive, got " +
                          std::to_string(config.artifacts.default_dimension));
    }
    if (config.recommend.max_k <= 0) {
        throw ConfigError("recommend.max_k must be positive, got " +
                          std::to_string(config.recommend.max_k));
    }
    if (config.recommend.default_k < 1 || config.recommend.default_k > config.recommend.max_k) {
        throw ConfigError("recommend.default_k must be within [1, " +
                          std::to_string(config.recommend.max_k) + "], got " +
                          std::to_string(config.recommend.default_k));
    }
    if (config.recommend.candidate_limit <= 0) {
        throw ConfigError("recommend.candidate_limit must be positive, got " +
                          std::to_string(config.recommend.candidate_limit));
    }
    LogLevel level;
    if (!parse_log_level(config.log_level, level)) {
        throw ConfigError("logging.level must be DEBUG, INFO, WARN or ERROR, got " + config.log_level);
    }
}
