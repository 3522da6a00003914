// simrec: similar-product recommendation service
#include "artifact_io.hpp"
#include "config.hpp"
#include "recommendation_service.hpp"
#include "server.hpp"
#include "util.hpp"
#include <string>

int main(int argc, char** argv) {
    std::string config_path = argc >= 2 ? argv[1] : "config.yaml";

    Config config;
    try {
        config = load_config(config_path);
        if (argc >= 3) {
            int port = std::stoi(argv[2]);
            if (port <= 0 || port > 65535) {
                throw ConfigError("port must be within [1, 65535], got " + std::string(argv[2]));
            }
            config.server.port = static_cast<uint16_t>(port);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    LogLevel level = LogLevel::Info;
    parse_log_level(config.log_level, level);
    set_log_level(level);

    LOG_INFO("Loading artifacts from " + config.artifacts.base_dir);
    ArtifactBundle bundle = load_artifacts(config.artifacts);

    if (!bundle.has_catalog()) {
        LOG_ERROR(config.artifacts.catalog_file + " not found in " + config.artifacts.base_dir +
                  " (" + bundle.catalog_table.detail + "); cannot serve recommendations");
        return 1;
    }

    try {
        RecommendationService service(bundle, config.recommend.candidate_limit);
        Server server(service, config);
        return server.run() ? 0 : 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Startup failed: ") + e.what());
        return 1;
    }
}
