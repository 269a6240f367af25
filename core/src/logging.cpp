#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> engine_logger;
        std::mutex logger_mutex;

        constexpr const char* kLoggerName = "ChartEngine";
        constexpr const char* kLogDirectory = "logs";
        // Fetch workers log too, so the thread id is part of every line
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [t%t] %v";
        constexpr std::size_t kMaxFileBytes = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;

        // One file per day: repeated CLI runs on the same day share it
        std::string dailyLogPath(const std::string& base_name, std::string& notes) {
            std::filesystem::path dir(kLogDirectory);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                notes += fmt::format("Cannot create '{}' ({}), logging to the working directory. ", kLogDirectory, ec.message());
                dir = ".";
            }

            std::time_t now = std::time(nullptr);
            std::tm local_tm = {};
            #ifdef _WIN32
                localtime_s(&local_tm, &now);
            #else
                localtime_r(&now, &local_tm);
            #endif
            char day[16];
            std::strftime(day, sizeof(day), "%Y%m%d", &local_tm);
            return (dir / fmt::format("{}_{}.log", base_name, day)).string();
        }

        std::shared_ptr<spdlog::logger> makeConsoleFallback() {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            auto fallback = spdlog::stderr_color_mt(kLoggerName);
            fallback->set_pattern(kPattern);
            fallback->set_level(spdlog::level::warn);
            return fallback;
        }

    } // namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        std::string notes;

        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            console_level = file_level = level_from_string(env_level);
            notes += fmt::format("SPDLOG_LEVEL={} overrides configured levels. ", env_level);
        }

        try {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kPattern);

            const std::string log_file_path = dailyLogPath(base_log_filename, notes);
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file_path, kMaxFileBytes, kMaxFiles);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kPattern);

            // A console fallback may already be registered under the same name
            spdlog::drop(kLoggerName);
            std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
            engine_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            engine_logger->set_level(std::min(console_level, file_level));
            engine_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(engine_logger);

            engine_logger->info("Chart engine logging to console ({}) and {} ({})",
                                spdlog::level::to_string_view(console_level), log_file_path,
                                spdlog::level::to_string_view(file_level));
            if (!notes.empty()) {
                engine_logger->warn("{}", notes);
            }
        } catch (const spdlog::spdlog_ex& ex) {
            // File sink unusable: keep logging to the console
            std::cerr << "Log file setup failed, console only: " << ex.what() << std::endl;
            engine_logger = makeConsoleFallback();
            engine_logger->set_level(console_level);
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (!engine_logger) {
            engine_logger = makeConsoleFallback();
        }
        return engine_logger;
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        static const std::unordered_map<std::string, spdlog::level::level_enum> kLevels = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"err", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off},
        };

        std::string key = level_str;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = kLevels.find(key);
        if (it == kLevels.end()) {
            std::cerr << "Unknown log level '" << level_str << "', using info." << std::endl;
            return spdlog::level::info;
        }
        return it->second;
    }

} // namespace logging
} // namespace core
