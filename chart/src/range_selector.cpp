#include "range_selector.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iterator>

namespace chart {

core::Resolution RangeSelector::resolutionFor(core::DisplayWindow window) {
    return isIntraday(window) ? core::Resolution::Intraday : core::Resolution::EndOfDay;
}

bool RangeSelector::isIntraday(core::DisplayWindow window) {
    return window == core::DisplayWindow::OneDay || window == core::DisplayWindow::FiveDay;
}

std::optional<core::Timestamp> RangeSelector::cutoffFor(core::DisplayWindow window, core::Timestamp now) {
    const core::Timestamp today = core::utils::startOfDay(now);

    switch (window) {
        case core::DisplayWindow::OneDay:
            return today;
        case core::DisplayWindow::FiveDay:
            // 7 calendar days covers 5 trading days across a weekend
            return core::utils::addCalendarDays(today, -7);
        case core::DisplayWindow::OneMonth:
            return core::utils::addCalendarMonths(today, -1);
        case core::DisplayWindow::SixMonth:
            return core::utils::addCalendarMonths(today, -6);
        case core::DisplayWindow::OneYear:
            return core::utils::addCalendarYears(today, -1);
        case core::DisplayWindow::YearToDate:
            return core::utils::startOfYear(now);
        case core::DisplayWindow::FiveYear:
            return std::nullopt;
    }
    return std::nullopt;
}

core::BarSeries RangeSelector::select(const core::BarSeries& bars, core::DisplayWindow window, core::Timestamp now) {
    const auto cutoff = cutoffFor(window, now);
    if (!cutoff) {
        return bars;
    }

    core::BarSeries selected;
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(selected),
                 [&cutoff](const core::Bar& bar) { return bar.timestamp >= *cutoff; });
    return selected;
}

} // namespace chart
