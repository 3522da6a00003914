#include "server.hpp"
#include <algorithm>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace {

// Request input is echoed back; invalid UTF-8 is replaced with U+FFFD.
std::string json_body(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json record_json(const ProductRecord& record) {
    nlohmann::json j;
    j["id"] = record.id;
    j["title"] = record.title;
    j["attributes"] = record.attributes;
    return j;
}

// Reads an optional integer query parameter. Returns false with `error`
// set when the value is present but not an integer.
bool int_param(const httplib::Request& req, const char* name, int fallback,
               int& out, std::string& error) {
    if (!req.has_param(name)) {
        out = fallback;
        return true;
    }
    const std::string raw = req.get_param_value(name);
    try {
        size_t consumed = 0;
        out = std::stoi(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
        return true;
    } catch (const std::exception&) {
        error = std::string(name) + " must be an integer, got: '" + raw + "'";
        return false;
    }
}

} // namespace

Server::Server(const RecommendationService& service, const Config& config)
    : service_(service),
      server_config_(config.server),
      recommend_config_(config.recommend),
      latency_tracker_(), qps_tracker_(), uptime_tracker_() {}

void Server::send_error(httplib::Response& res, int status, const std::string& code, const std::string& message) const {
    res.status = status;
    nlohmann::json error_response;
    error_response["error"]["code"] = code;
    error_response["error"]["message"] = message;
    res.set_content(json_body(error_response), "application/json");
}

void Server::handle_healthz(const httplib::Request&, httplib::Response& res) {
    res.set_content("ok", "text/plain");
}

void Server::handle_stats(const httplib::Request&, httplib::Response& res) {
    SourceSummary sources = service_.sources();

    nlohmann::json response;
    response["status"] = "ready";
    response["catalog_size"] = sources.catalog_size;
    response["dim"] = sources.dimension;
    response["similarity_map"]["loaded"] = sources.similarity_map;
    response["similarity_map"]["entries"] = sources.similarity_map_entries;
    response["ann_index"]["loaded"] = sources.ann_index;
    response["ann_index"]["items"] = sources.ann_items;
    response["max_k"] = recommend_config_.max_k;
    response["uptime_sec"] = static_cast<int>(uptime_tracker_.get_uptime_sec());
    response["qps_1m"] = qps_tracker_.get_qps();
    response["latency_ms"]["p50"] = latency_tracker_.percentile(50.0);
    response["latency_ms"]["p95"] = latency_tracker_.percentile(95.0);
    response["latency_ms"]["p99"] = latency_tracker_.percentile(99.0);
    
    res.set_content(json_body(response), "application/json");
}

void Server::handle_search(const httplib::Request& req, httplib::Response& res) {
    try {
        const std::string query = req.get_param_value("q");
        const int max_limit = service_.candidate_limit();

        int limit = 0;
        std::string error;
        if (!int_param(req, "limit", max_limit, limit, error)) {
            send_error(res, 400, "INVALID_FIELD", error);
            return;
        }
        if (limit <= 0) {
            send_error(res, 400, "INVALID_VALUE", "limit must be greater than 0, got: " + std::to_string(limit));
            return;
        }
        limit = std::min(limit, max_limit);

        std::vector<ProductRecord> matches = service_.find_candidates(query, limit);

        nlohmann::json products = nlohmann::json::array();
        for (const auto& record : matches) {
            products.push_back(record_json(record));
        }

        nlohmann::json response;
        response["query"] = query;
        response["products"] = products;
        if (matches.empty()) {
            response["message"] = "No products found for that search.";
        }
        res.set_content(json_body(response), "application/json");

    } catch (const std::exception& e) {
        LOG_ERROR("Search request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_product(const httplib::Request& req, httplib::Response& res) {
    try {
        const std::string id = req.matches.size() > 1 ? req.matches[1].str() : std::string();

        const ProductRecord* record = service_.catalog().lookup(id);

        nlohmann::json response;
        response["id"] = id;
        response["title"] = service_.title_of(id);
        response["found"] = record != nullptr;
        response["attributes"] = record ? record->attributes : nlohmann::json::object();

        res.set_content(json_body(response), "application/json");

    } catch (const std::exception& e) {
        LOG_ERROR("Product request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_recommend(const httplib::Request& req, httplib::Response& res) {
    try {
        if (!req.has_param("id")) {
            send_error(res, 400, "MISSING_FIELD", "Missing required field: id");
            return;
        }
        const std::string id = req.get_param_value("id");

        int k = 0;
        std::string error;
        if (!int_param(req, "k", recommend_config_.default_k, k, error)) {
            send_error(res, 400, "INVALID_FIELD", error);
            return;
        }
        if (k < 1 || k > recommend_config_.max_k) {
            send_error(res, 400, "INVALID_VALUE",
                       "k must be within [1, " + std::to_string(recommend_config_.max_k) +
                       "], got: " + std::to_string(k));
            return;
        }

        Timer timer;

        RecommendationSource source = RecommendationSource::None;
        std::vector<ProductRecord> recommendations = service_.recommend(id, k, &source);

        double latency = timer.elapsed_ms();

        // Record metrics
        latency_tracker_.record(latency);
        qps_tracker_.record();

        // Build response
        nlohmann::json response;
        nlohmann::json items = nlohmann::json::array();

        int rank = 1;
        for (const auto& record : recommendations) {
            nlohmann::json item = record_json(record);
            item["rank"] = rank++;
            items.push_back(item);
        }

        response["product"]["id"] = id;
        response["product"]["title"] = service_.title_of(id);
        response["k"] = k;
        response["source"] = source_name(source);
        response["recommendations"] = items;
        if (recommendations.empty()) {
            response["message"] = "No similar items found.";
        }
        response["latency_ms"] = latency;

        res.set_content(json_body(response), "application/json");

        log_recommendation(latency, id, k, recommendations.size(), source_name(source));

    } catch (const std::exception& e) {
        LOG_ERROR("Recommend request failed: " + std::string(e.what()));
        send_error(res, 500, "INTERNAL_ERROR", "Internal error: " + std::string(e.what()));
    }
}

void Server::handle_root(const httplib::Request&, httplib::Response& res) {
    std::string html = "<html><body><h2>simrec</h2>"
                       "<p>Endpoints: <code>/healthz</code>, <code>/stats</code>, "
                       "<code>/products?q=</code>, <code>/products/{id}</code>, "
                       "<code>/recommend?id=&amp;k=</code></p>"
                       "</body></html>";
    res.set_content(html, "text/html");
}

bool Server::run() {
    httplib::Server svr;
    
    svr.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        handle_healthz(req, res);
    });
    
    svr.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        handle_stats(req, res);
    });
    
    svr.Get("/products", [this](const httplib::Request& req, httplib::Response& res) {
        handle_search(req, res);
    });

    svr.Get(R"(/products/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_product(req, res);
    });
    
    svr.Get("/recommend", [this](const httplib::Request& req, httplib::Response& res) {
        handle_recommend(req, res);
    });
    
    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_root(req, res);
    });
    
    std::cout << "[simrec] starting server on " << server_config_.host << ":" << server_config_.port << std::endl;
    if (!svr.listen(server_config_.host.c_str(), server_config_.port)) {
        LOG_ERROR("Failed to listen on " + server_config_.host + ":" + std::to_string(server_config_.port));
        return false;
    }
    return true;
}
