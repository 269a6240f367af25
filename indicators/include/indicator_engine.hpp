#pragma once

#include "datatypes.hpp"
#include "moving_average.hpp"

namespace indicators {

    // Attaches the five chart overlays to a bar sequence.
    // Stateless: every call recomputes from scratch.
    class IndicatorEngine {
    public:
        // Lookback period used by the chart for each display window
        static int lookbackPeriodFor(core::DisplayWindow window);

        // One AnnotatedBar per input bar, same order.
        // Throws std::invalid_argument for period < 2.
        static core::TimeSeries<core::AnnotatedBar> annotate(const core::BarSeries& bars,
                                                             int period,
                                                             ChainFill fill = ChainFill::ZeroFill);
    };

} // namespace indicators
