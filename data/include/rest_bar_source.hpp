#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "bar_source.hpp"
#include "chart_api_client.hpp"
#include "config.hpp"

namespace data {

// IBarSource backed by the REST backend.
// Blocking HTTP calls run on a small worker pool; results are posted back to
// the event loop so the cache is only ever touched from one thread.
class RestBarSource : public IBarSource {
public:
    RestBarSource(boost::asio::io_context& io_context, const core::EngineConfig& config);
    ~RestBarSource() override;

    RestBarSource(const RestBarSource&) = delete;
    RestBarSource& operator=(const RestBarSource&) = delete;

    void fetchBars(const std::string& symbol,
                   core::Resolution resolution,
                   FetchCallback on_complete) override;

    // Waits for in-flight requests; their completions are still posted
    void shutdown();

private:
    boost::asio::io_context& io_context_;
    ChartApiClient client_;
    boost::asio::thread_pool workers_;
};

} // namespace data
