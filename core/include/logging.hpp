#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Sets up the "ChartEngine" logger: console plus logs/<base>_<YYYYMMDD>.log.
    // SPDLOG_LEVEL, when set, replaces both levels. Safe to call again.
    void initialize(const std::string& base_log_filename = "chart_engine",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Get the globally configured logger.
    // Falls back to a console-only logger when initialize() was never called
    // (library use, unit tests).
    std::shared_ptr<spdlog::logger>& getLogger();

    // "debug", "WARN", "error"... Unknown names give info.
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
