#include "rest_bar_source.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <boost/asio/post.hpp>

namespace data {

RestBarSource::RestBarSource(boost::asio::io_context& io_context, const core::EngineConfig& config)
    : io_context_(io_context),
      client_(config),
      workers_(static_cast<std::size_t>(config.fetch_worker_threads))
{
    core::logging::getLogger()->debug("RestBarSource started with {} worker threads.", config.fetch_worker_threads);
}

RestBarSource::~RestBarSource() {
    shutdown();
}

void RestBarSource::shutdown() {
    workers_.join();
}

void RestBarSource::fetchBars(const std::string& symbol,
                              core::Resolution resolution,
                              FetchCallback on_complete)
{
    boost::asio::post(workers_, [this, symbol, resolution, on_complete = std::move(on_complete)]() mutable {
        auto logger = core::logging::getLogger();
        FetchResult result;
        try {
            result = FetchResult::success(symbol, resolution, client_.getChartBars(symbol, resolution));
        } catch (const core::ChartEngineException& e) {
            logger->error("Fetching {} bars for {} failed: {}", core::toString(resolution), symbol, e.what());
            result = FetchResult::failure(symbol, resolution, e.what());
        } catch (const std::exception& e) {
            logger->error("Unexpected error fetching {} bars for {}: {}", core::toString(resolution), symbol, e.what());
            result = FetchResult::failure(symbol, resolution, e.what());
        }

        // Back onto the event loop thread
        boost::asio::post(io_context_, [on_complete = std::move(on_complete), result = std::move(result)]() mutable {
            on_complete(std::move(result));
        });
    });
}

} // namespace data
