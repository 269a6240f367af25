#include "refresh_scheduler.hpp"
#include "range_selector.hpp"
#include "logging.hpp"

namespace chart {

std::string toString(RefreshScheduler::State state) {
    return state == RefreshScheduler::State::Scheduled ? "Scheduled" : "Idle";
}

RefreshScheduler::RefreshScheduler(IntervalTimer& timer, std::chrono::milliseconds interval, TickHandler on_tick)
    : timer_(timer), interval_(interval), on_tick_(std::move(on_tick))
{
}

RefreshScheduler::~RefreshScheduler() {
    shutdown();
}

void RefreshScheduler::onSymbolChanged(const std::string& symbol) {
    if (shut_down_) return;
    symbol_ = symbol;
    // New symbol: the old interval belongs to the old symbol, always restart
    reschedule(true);
}

void RefreshScheduler::onWindowChanged(core::DisplayWindow window) {
    if (shut_down_) return;
    window_ = window;
    reschedule(false);
}

void RefreshScheduler::onMarketOpenChanged(bool market_open) {
    if (shut_down_) return;
    market_open_ = market_open;
    reschedule(false);
}

void RefreshScheduler::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    timer_.cancel();
    if (state_ != State::Idle) {
        core::logging::getLogger()->debug("RefreshScheduler: {} -> Idle (shutdown)", toString(state_));
    }
    state_ = State::Idle;
}

bool RefreshScheduler::shouldSchedule() const {
    return !symbol_.empty() && market_open_ && RangeSelector::isIntraday(window_);
}

void RefreshScheduler::reschedule(bool force_restart) {
    const bool wanted = shouldSchedule();
    const State previous = state_;

    if (wanted && state_ == State::Scheduled && !force_restart) {
        return; // Already ticking for this symbol
    }

    timer_.cancel();
    state_ = State::Idle;

    if (wanted) {
        timer_.start(interval_, [this]() {
            ++ticks_;
            core::logging::getLogger()->debug("RefreshScheduler tick #{} for {}", ticks_, symbol_);
            if (on_tick_) {
                on_tick_();
            }
        });
        state_ = State::Scheduled;
    }

    if (previous != state_ || force_restart) {
        core::logging::getLogger()->debug("RefreshScheduler: {} -> {} (symbol='{}', window={}, market_open={})",
                                          toString(previous), toString(state_), symbol_,
                                          core::toString(window_), market_open_);
    }
}

} // namespace chart
