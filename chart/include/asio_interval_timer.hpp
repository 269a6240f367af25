#pragma once

#include <cstdint>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "interval_timer.hpp"

namespace chart {

// IntervalTimer on a boost::asio::steady_timer. Must be used from the thread
// running the io_context.
class AsioIntervalTimer : public IntervalTimer {
public:
    explicit AsioIntervalTimer(boost::asio::io_context& io_context);
    ~AsioIntervalTimer() override;

    AsioIntervalTimer(const AsioIntervalTimer&) = delete;
    AsioIntervalTimer& operator=(const AsioIntervalTimer&) = delete;

    void start(std::chrono::milliseconds interval, Callback on_fire) override;
    void cancel() override;
    bool isActive() const override { return active_; }

private:
    void arm(std::uint64_t generation);

    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_{0};
    Callback on_fire_;
    bool active_ = false;
    // A handler already queued when cancel() ran carries a stale generation
    std::uint64_t generation_ = 0;
    // Handlers that outlive the timer object see an expired token
    std::shared_ptr<bool> alive_;
};

} // namespace chart
