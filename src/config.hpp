#pragma once

#include "artifact_io.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
};

struct RecommendConfig {
    int default_k = 5;
    int max_k = 15;
    int candidate_limit = 30;
};

struct Config {
    ServerConfig server;
    ArtifactConfig artifacts;
    RecommendConfig recommend;
    std::string log_level = "INFO";
    std::string config_file;
};

// Load configuration from a YAML file. A missing file yields the defaults;
// an unreadable or invalid one throws ConfigError.
Config load_config(const std::string& config_file = "config.yaml");

// Throws ConfigError describing the first invalid value.
void validate_config(const Config& config);
