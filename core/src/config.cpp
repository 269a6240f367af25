#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace core {

    namespace {

        template<typename T>
        void readOptional(const json& config_json, const char* key, T& target) {
            if (!config_json.contains(key)) {
                return;
            }
            try {
                target = config_json.at(key).get<T>();
            } catch (const json::exception& e) {
                throw ConfigException(fmt::format("Config key '{}' has the wrong type: {}", key, e.what()));
            }
        }

        long envAsPositiveLong(const char* name, const std::string& value) {
            try {
                std::size_t consumed = 0;
                long parsed = std::stol(value, &consumed);
                if (consumed != value.size() || parsed <= 0) {
                    throw std::invalid_argument("not a positive integer");
                }
                return parsed;
            } catch (const std::exception&) {
                throw ConfigException(fmt::format("Environment variable {}='{}' is not a positive integer", name, value));
            }
        }

        void applyEnvironmentOverrides(EngineConfig& config) {
            auto logger = logging::getLogger();
            if (const char* base_url = std::getenv("CHART_API_BASE_URL")) {
                config.api_base_url = base_url;
                logger->info("API base URL overridden from CHART_API_BASE_URL: {}", config.api_base_url);
            }
            if (const char* refresh = std::getenv("CHART_REFRESH_SECONDS")) {
                config.refresh_interval = std::chrono::seconds(envAsPositiveLong("CHART_REFRESH_SECONDS", refresh));
                logger->info("Refresh interval overridden from CHART_REFRESH_SECONDS: {}s", config.refresh_interval.count());
            }
            if (const char* timeout = std::getenv("CHART_REQUEST_TIMEOUT_MS")) {
                config.request_timeout = std::chrono::milliseconds(envAsPositiveLong("CHART_REQUEST_TIMEOUT_MS", timeout));
                logger->info("Request timeout overridden from CHART_REQUEST_TIMEOUT_MS: {}ms", config.request_timeout.count());
            }
        }

    } // namespace

    EngineConfig configFromJson(const json& config_json) {
        if (!config_json.is_object()) {
            throw ConfigException("Engine config must be a JSON object");
        }

        EngineConfig config;
        readOptional(config_json, "api_base_url", config.api_base_url);
        readOptional(config_json, "intraday_timeframe", config.intraday_timeframe);
        readOptional(config_json, "eod_timeframe", config.eod_timeframe);
        readOptional(config_json, "bar_limit", config.bar_limit);
        readOptional(config_json, "fetch_worker_threads", config.fetch_worker_threads);
        readOptional(config_json, "log_file", config.log_file);
        readOptional(config_json, "console_log_level", config.console_log_level);
        readOptional(config_json, "file_log_level", config.file_log_level);

        long long timeout_ms = config.request_timeout.count();
        readOptional(config_json, "request_timeout_ms", timeout_ms);
        config.request_timeout = std::chrono::milliseconds(timeout_ms);

        long long refresh_s = config.refresh_interval.count();
        readOptional(config_json, "refresh_interval_seconds", refresh_s);
        config.refresh_interval = std::chrono::seconds(refresh_s);

        long long poll_s = config.market_status_poll_interval.count();
        readOptional(config_json, "market_status_poll_seconds", poll_s);
        config.market_status_poll_interval = std::chrono::seconds(poll_s);

        validateConfig(config);
        return config;
    }

    EngineConfig loadConfig(const std::string& path) {
        auto logger = logging::getLogger();
        EngineConfig config;

        if (!path.empty()) {
            logger->info("Loading engine config from: {}", path);
            std::ifstream ifs(path);
            if (!ifs.is_open()) {
                throw ConfigException(fmt::format("Failed to open config file: {}", path));
            }
            json config_json;
            try {
                config_json = json::parse(ifs);
            } catch (const json::parse_error& e) {
                throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
            }
            config = configFromJson(config_json);
        } else {
            logger->debug("No config file given, using built-in defaults.");
        }

        applyEnvironmentOverrides(config);
        validateConfig(config);
        return config;
    }

    void validateConfig(const EngineConfig& config) {
        if (config.api_base_url.empty()) {
            throw ConfigException("api_base_url must not be empty");
        }
        if (config.intraday_timeframe.empty() || config.eod_timeframe.empty()) {
            throw ConfigException("Timeframe names must not be empty");
        }
        if (config.bar_limit <= 0) {
            throw ConfigException(fmt::format("bar_limit must be positive, got {}", config.bar_limit));
        }
        if (config.request_timeout.count() <= 0) {
            throw ConfigException("request_timeout_ms must be positive");
        }
        if (config.refresh_interval.count() <= 0) {
            throw ConfigException("refresh_interval_seconds must be positive");
        }
        if (config.market_status_poll_interval.count() <= 0) {
            throw ConfigException("market_status_poll_seconds must be positive");
        }
        if (config.fetch_worker_threads <= 0) {
            throw ConfigException("fetch_worker_threads must be positive");
        }
    }

} // namespace core
