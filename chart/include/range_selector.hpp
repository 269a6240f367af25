#pragma once

#include <optional>
#include "datatypes.hpp"

namespace chart {

    // Maps a display window to the cache it reads and the history it shows
    class RangeSelector {
    public:
        // OneDay/FiveDay read intraday bars, everything else end-of-day bars
        static core::Resolution resolutionFor(core::DisplayWindow window);
        static bool isIntraday(core::DisplayWindow window);

        // Earliest timestamp kept for `window` at time `now`, in local calendar terms.
        // std::nullopt for FiveYear (whole cache).
        static std::optional<core::Timestamp> cutoffFor(core::DisplayWindow window, core::Timestamp now);

        // Bars with timestamp >= cutoff, input order preserved
        static core::BarSeries select(const core::BarSeries& bars, core::DisplayWindow window, core::Timestamp now);
    };

} // namespace chart
