#pragma once

#include <chrono>
#include <functional>

namespace chart {

    // Repeating timer owned by a single scheduler.
    // start() replaces any running interval; cancel() is synchronous: once it
    // returns the callback never runs again.
    class IntervalTimer {
    public:
        using Callback = std::function<void()>;

        virtual ~IntervalTimer() = default;

        virtual void start(std::chrono::milliseconds interval, Callback on_fire) = 0;
        virtual void cancel() = 0;
        virtual bool isActive() const = 0;
    };

} // namespace chart
