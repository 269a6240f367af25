// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>
#include <csignal>
#include <chrono>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "chart_api_client.hpp"
#include "rest_bar_source.hpp"
#include "bar_store.hpp"
#include "asio_interval_timer.hpp"
#include "chart_series_facade.hpp"
#include "market_hours.hpp"

namespace {

    struct CliOptions {
        std::string config_path;
        std::string symbol;
        core::DisplayWindow window = core::DisplayWindow::OneDay;
        bool watch = false;
    };

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " [--config FILE] [--watch] SYMBOL [1D|5D|1M|6M|1Y|YTD|5Y]" << std::endl;
    }

    CliOptions parseArguments(int argc, char* argv[]) {
        CliOptions options;
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--config needs a file path");
                }
                options.config_path = argv[++i];
            } else if (arg == "--watch") {
                options.watch = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }
        if (positional.empty() || positional.size() > 2) {
            throw std::invalid_argument("Expected SYMBOL and an optional WINDOW");
        }
        options.symbol = positional[0];
        if (positional.size() == 2) {
            options.window = core::windowFromString(positional[1]);
        }
        return options;
    }

    std::string formatOverlay(const std::optional<double>& value) {
        return value ? fmt::format("{:.4f}", *value) : std::string("-");
    }

    void logSummary(const std::shared_ptr<spdlog::logger>& logger, const chart::SeriesView& view) {
        logger->info("{} {}: {} bars, lookback {}, avg volume {}{}",
                     view.symbol, core::toString(view.window), view.series.size(), view.lookback_period,
                     view.avg_volume ? fmt::format("{:.0f}", *view.avg_volume) : std::string("n/a"),
                     view.error ? " (error: " + *view.error + ")" : std::string());
        if (view.last_updated) {
            logger->info("Last updated: {}", core::utils::timestampToString(*view.last_updated));
        }
        if (view.series.empty()) {
            return;
        }
        const core::AnnotatedBar& last = view.series.back();
        logger->info("Last bar {} O={:.2f} H={:.2f} L={:.2f} C={:.2f} V={:.0f}",
                     last.bar.date, last.bar.open, last.bar.high, last.bar.low, last.bar.close, last.bar.volume);
        logger->info("  SMA={} EMA={} WMA={} DEMA={} TEMA={}",
                     formatOverlay(last.indicators.sma), formatOverlay(last.indicators.ema),
                     formatOverlay(last.indicators.wma), formatOverlay(last.indicators.dema),
                     formatOverlay(last.indicators.tema));
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        CliOptions options;
        try {
            options = parseArguments(argc, argv);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            printUsage(argv[0]);
            return 2;
        }

        // --- Configuration & Logging ---
        core::EngineConfig config = core::loadConfig(options.config_path);
        core::logging::initialize(config.log_file,
                                  core::logging::level_from_string(config.console_log_level),
                                  core::logging::level_from_string(config.file_log_level));
        logger = core::logging::getLogger();
        logger->info("Chart engine CLI starting: symbol={}, window={}, watch={}",
                     options.symbol, core::toString(options.window), options.watch);

        // --- Event loop & components ---
        boost::asio::io_context io_context;
        auto work_guard = boost::asio::make_work_guard(io_context);

        data::RestBarSource bar_source(io_context, config);
        data::BarStore bar_store(bar_source);
        chart::AsioIntervalTimer refresh_timer(io_context);
        chart::ChartSeriesFacade facade(bar_store, refresh_timer, config);

        // Market status is polled beside the chart and fed in as a plain flag
        data::ChartApiClient status_client(config);
        boost::asio::thread_pool status_worker(1);
        chart::AsioIntervalTimer status_timer(io_context);

        auto poll_market_status = [&]() {
            boost::asio::post(status_worker, [&]() {
                bool market_open = false;
                try {
                    market_open = status_client.getMarketOpen();
                } catch (const core::ChartEngineException& e) {
                    market_open = chart::MarketHours::isRegularSession(std::chrono::system_clock::now());
                    logger->warn("Market status unavailable ({}); regular-session clock says {}",
                                 e.what(), market_open ? "open" : "closed");
                }
                boost::asio::post(io_context, [&facade, &logger, market_open]() {
                    logger->debug("Market open: {}", market_open);
                    facade.setMarketOpen(market_open);
                });
            });
        };

        auto stop = [&]() {
            status_timer.cancel();
            facade.shutdown();
            work_guard.reset();
            io_context.stop();
        };

        facade.setUpdateListener([&](const data::FetchOutcome& outcome) {
            if (facade.isLoading()) {
                return;
            }
            logSummary(logger, facade.currentView());
            if (!options.watch) {
                stop();
            } else if (outcome.status == data::FetchStatus::Failed) {
                logger->warn("Waiting for the next refresh after failed {} fetch.", core::toString(outcome.resolution));
            }
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            logger->info("Received signal {}, shutting down.", signal_number);
            stop();
        });

        if (options.watch) {
            poll_market_status();
            status_timer.start(std::chrono::duration_cast<std::chrono::milliseconds>(config.market_status_poll_interval),
                               poll_market_status);
        }

        // First render: symbol + window arrive as events
        facade.getSeries(options.symbol, options.window);
        io_context.run();

        signals.cancel();
        status_worker.join();
        bar_source.shutdown();
        logger->info("Chart engine CLI finished.");

    } catch (const core::ChartEngineException& ex) {
        std::cerr << "Chart Engine Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Chart Engine Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
