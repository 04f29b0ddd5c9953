/**
 * @file logging.hpp
 * @brief JSON-lines logging to std::clog.
 *
 * Each entry is one JSON object per line:
 * @code
 *   {"domain":"parser","level":"warn","message":"duplicate_seat_name",
 *    "player":"Hero","timestamp":"2025-01-01T16:38:15Z"}
 * @endcode
 *
 * There is no global verbosity switch. Callers that only log under a
 * diagnostics flag check their own KnockoutConfig before calling log_debug().
 */

#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace kotrack {

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%FT%TZ");
    return ss.str();
}

inline void log_entry(const char* level, const std::string& domain,
                      const std::string& message, const nlohmann::json& fields) {
    nlohmann::json entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            entry[it.key()] = it.value();
        }
    }
    std::clog << entry.dump() << std::endl;
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_entry("warn", domain, message, fields);
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_entry("debug", domain, message, fields);
}

} // namespace kotrack
