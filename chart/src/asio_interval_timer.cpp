#include "asio_interval_timer.hpp"
#include "logging.hpp"

namespace chart {

AsioIntervalTimer::AsioIntervalTimer(boost::asio::io_context& io_context)
    : timer_(io_context),
      alive_(std::make_shared<bool>(true))
{
}

AsioIntervalTimer::~AsioIntervalTimer() {
    cancel();
}

void AsioIntervalTimer::start(std::chrono::milliseconds interval, Callback on_fire) {
    cancel();
    interval_ = interval;
    on_fire_ = std::move(on_fire);
    active_ = true;
    arm(generation_);
}

void AsioIntervalTimer::cancel() {
    ++generation_;
    if (active_) {
        timer_.cancel();
    }
    active_ = false;
    on_fire_ = nullptr;
}

void AsioIntervalTimer::arm(std::uint64_t generation) {
    timer_.expires_after(interval_);
    std::weak_ptr<bool> alive = alive_;
    timer_.async_wait([this, alive, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || alive.expired()) {
            return;
        }
        if (generation != generation_ || !active_) {
            return;
        }
        if (ec) {
            core::logging::getLogger()->warn("Interval timer error: {}", ec.message());
            return;
        }
        // Re-arm first so the callback may cancel or restart the timer
        arm(generation);
        Callback on_fire = on_fire_;
        if (on_fire) {
            on_fire();
        }
    });
}

} // namespace chart
