#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <memory>   // For shared snapshots
#include <optional> // For indicator values that need more history

namespace core {

    // Using system_clock for time points, bars come from wall-clock date strings
    using Timestamp = std::chrono::system_clock::time_point;

    // One OHLCV observation. Built once by the parser and never mutated afterwards.
    struct Bar {
        Timestamp timestamp;
        std::string date; // Date string as delivered by the backend
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;

        // Charts read the close as "price"
        double price() const { return close; }

        bool operator<(const Bar& other) const {
            return timestamp < other.timestamp;
        }
    };

    enum class Resolution {
        Intraday,  // 5-minute bars
        EndOfDay   // One bar per trading day
    };

    // User-selected chart range
    enum class DisplayWindow {
        OneDay,
        FiveDay,
        OneMonth,
        SixMonth,
        OneYear,
        YearToDate,
        FiveYear
    };

    // Per-bar overlay values. std::nullopt means "not enough history yet".
    struct IndicatorSet {
        std::optional<double> sma;
        std::optional<double> ema;
        std::optional<double> wma;
        std::optional<double> dema;
        std::optional<double> tema;
    };

    struct AnnotatedBar {
        Bar bar;
        IndicatorSet indicators;
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    using BarSeries = TimeSeries<Bar>;
    // Immutable snapshot handed out by the cache
    using BarSeriesPtr = std::shared_ptr<const BarSeries>;
    // Indicator output aligned 1:1 with its input
    using OptionalSeries = TimeSeries<std::optional<double>>;

    // --- Enum helpers ---
    std::string toString(Resolution resolution);
    std::string toString(DisplayWindow window);

    // Accepts the dashboard labels: "1D", "5D", "1M", "6M", "1Y", "YTD", "5Y"
    // Throws std::invalid_argument for anything else.
    DisplayWindow windowFromString(const std::string& label);

} // namespace core
