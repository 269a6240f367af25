#pragma once

#include <string>
#include "datatypes.hpp"

namespace data {

    // Turns a /chart response body into chronological bars.
    //
    // The backend sends most-recent-first; the result is always oldest-first.
    // Missing, null or non-numeric OHLCV fields become 0 (logged once per payload).
    // Elements without a parseable "date" are skipped.
    // Throws core::ParseException when the body is not a JSON array.
    core::BarSeries parseBars(const std::string& json_text);

} // namespace data
