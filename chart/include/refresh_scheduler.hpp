#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "datatypes.hpp"
#include "interval_timer.hpp"

namespace chart {

    // Decides when intraday bars are re-fetched on a timer.
    //
    // Scheduled iff a symbol is set, the market is open and the window is
    // intraday. The timer is cancelled before any new one is started, so at
    // most one interval is ever active.
    class RefreshScheduler {
    public:
        enum class State { Idle, Scheduled };

        using TickHandler = std::function<void()>;

        RefreshScheduler(IntervalTimer& timer, std::chrono::milliseconds interval, TickHandler on_tick);
        ~RefreshScheduler();

        RefreshScheduler(const RefreshScheduler&) = delete;
        RefreshScheduler& operator=(const RefreshScheduler&) = delete;

        // --- Events ---
        void onSymbolChanged(const std::string& symbol);
        void onWindowChanged(core::DisplayWindow window);
        void onMarketOpenChanged(bool market_open);
        // Teardown: cancels synchronously, later events are ignored
        void shutdown();

        State state() const { return state_; }
        std::size_t ticks() const { return ticks_; }

    private:
        bool shouldSchedule() const;
        // Cancels and, if wanted, starts a fresh interval
        void reschedule(bool force_restart);

        IntervalTimer& timer_;
        std::chrono::milliseconds interval_;
        TickHandler on_tick_;

        std::string symbol_;
        core::DisplayWindow window_ = core::DisplayWindow::OneDay;
        bool market_open_ = false;
        bool shut_down_ = false;

        State state_ = State::Idle;
        std::size_t ticks_ = 0;
    };

    std::string toString(RefreshScheduler::State state);

} // namespace chart
