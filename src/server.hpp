#pragma once

#include <string>
#include "config.hpp"
#include "recommendation_service.hpp"
#include "util.hpp"

namespace httplib {
struct Request;
struct Response;
class Server;
}

class Server {
public:
    Server(const RecommendationService& service, const Config& config);
    // Blocks serving requests. Returns false if the address cannot be bound.
    bool run();
    
    // Route handlers  
    void handle_healthz(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_search(const httplib::Request& req, httplib::Response& res);
    void handle_product(const httplib::Request& req, httplib::Response& res);
    void handle_recommend(const httplib::Request& req, httplib::Response& res);
    void handle_root(const httplib::Request& req, httplib::Response& res);

private:
    const RecommendationService& service_;
    ServerConfig server_config_;
    RecommendConfig recommend_config_;
    LatencyTracker latency_tracker_;
    QPSTracker qps_tracker_;
    UptimeTracker uptime_tracker_;

    void send_error(httplib::Response& res, int status, const std::string& code,
                    const std::string& message) const;
};
