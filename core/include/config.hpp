#pragma once

#include <string>
#include <chrono>
#include <nlohmann/json.hpp>

namespace core {

    using json = nlohmann::json;

    // Runtime settings for the chart engine. Defaults match the dashboard backend.
    struct EngineConfig {
        std::string api_base_url = "http://localhost:8000";
        std::string intraday_timeframe = "5min";
        std::string eod_timeframe = "1day";
        int bar_limit = 2000;
        std::chrono::milliseconds request_timeout{15000};
        std::chrono::seconds refresh_interval{300};
        std::chrono::seconds market_status_poll_interval{300};
        int fetch_worker_threads = 2;

        std::string log_file = "chart_engine";
        std::string console_log_level = "info";
        std::string file_log_level = "debug";
    };

    // Builds a config from a JSON object; keys that are absent keep their defaults.
    // Throws ConfigException on wrong types or invalid values.
    EngineConfig configFromJson(const json& config_json);

    // Reads the JSON file at `path` (empty path = defaults), then applies the
    // CHART_API_BASE_URL, CHART_REFRESH_SECONDS and CHART_REQUEST_TIMEOUT_MS
    // environment overrides. Throws ConfigException.
    EngineConfig loadConfig(const std::string& path = "");

    // Throws ConfigException if a value is out of range
    void validateConfig(const EngineConfig& config);

} // namespace core
