#pragma once

#include <functional>
#include <string>
#include <utility>
#include "datatypes.hpp"

namespace data {

    // Result of one network fetch, success or FetchError
    struct FetchResult {
        std::string symbol;
        core::Resolution resolution = core::Resolution::Intraday;
        bool ok = false;
        core::BarSeries bars;   // Oldest first, only meaningful when ok
        std::string error;      // Only meaningful when !ok

        static FetchResult success(std::string symbol, core::Resolution resolution, core::BarSeries bars) {
            FetchResult result;
            result.symbol = std::move(symbol);
            result.resolution = resolution;
            result.ok = true;
            result.bars = std::move(bars);
            return result;
        }

        static FetchResult failure(std::string symbol, core::Resolution resolution, std::string error) {
            FetchResult result;
            result.symbol = std::move(symbol);
            result.resolution = resolution;
            result.error = std::move(error);
            return result;
        }
    };

    using FetchCallback = std::function<void(FetchResult)>;

    // Asynchronous supplier of raw bars.
    // Implementations must invoke `on_complete` exactly once, on the engine's
    // event-loop thread, and never from inside fetchBars() itself.
    class IBarSource {
    public:
        virtual ~IBarSource() = default;

        virtual void fetchBars(const std::string& symbol,
                               core::Resolution resolution,
                               FetchCallback on_complete) = 0;
    };

} // namespace data
