#include "util.hpp"
#include <atomic>
#include <cctype>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

int level_rank(const std::string& level) {
    if (level == "DEBUG") return static_cast<int>(LogLevel::Debug);
    if (level == "WARN") return static_cast<int>(LogLevel::Warn);
    if (level == "ERROR") return static_cast<int>(LogLevel::Error);
    return static_cast<int>(LogLevel::Info);
}

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += ' ';
                } else {
                    out += c;
                }
        }
    }
    return out;
}

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string upper;
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "DEBUG") { out = LogLevel::Debug; return true; }
    if (upper == "INFO") { out = LogLevel::Info; return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::Warn; return true; }
    if (upper == "ERROR") { out = LogLevel::Error; return true; }
    return false;
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

void log(const std::string& level, const std::string& message) {
    if (level_rank(level) < g_log_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::stringstream ss;
    ss << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << level << "] " << message;
    
    std::cout << ss.str() << std::endl;
}

void log_recommendation(double latency_ms, const std::string& product_id, int k,
                        size_t returned, const std::string& source) {
    std::stringstream ss;
    ss << "{"
       << "\"lat_ms\":" << std::fixed << std::setprecision(2) << latency_ms << ","
       << "\"id\":\"" << json_escape(product_id) << "\","
       << "\"k\":" << k << ","
       << "\"returned\":" << returned << ","
       << "\"source\":\"" << source << "\""
       << "}";
    log("INFO", ss.str());
}
