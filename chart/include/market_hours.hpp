#pragma once

#include "datatypes.hpp"

namespace chart {

    // US equity regular session, used when /market/status cannot be reached.
    class MarketHours {
    public:
        // Weekday and 09:30 <= New York time <= 16:00. Exchange holidays are not known.
        static bool isRegularSession(core::Timestamp now);
    };

} // namespace chart
