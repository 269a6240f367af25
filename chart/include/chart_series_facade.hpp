#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "bar_store.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include "interval_timer.hpp"
#include "moving_average.hpp"
#include "refresh_scheduler.hpp"

namespace chart {

    // What a price chart draws
    struct ChartSeries {
        core::TimeSeries<core::AnnotatedBar> series;
        std::optional<double> avg_volume;   // Mean volume of `series`, nullopt when empty
        int lookback_period = 0;
    };

    // ChartSeries plus the loading state around it
    struct SeriesView : ChartSeries {
        std::string symbol;
        core::DisplayWindow window = core::DisplayWindow::OneDay;
        bool is_loading = false;
        std::optional<std::string> error;
        std::optional<core::Timestamp> last_updated;
        // Unfiltered caches for the active symbol (may be null)
        core::BarSeriesPtr raw_intraday;
        core::BarSeriesPtr raw_end_of_day;
    };

    // Drives one chart: reacts to symbol / window / market-open events,
    // keeps the BarStore fed and composes the series the chart consumes.
    // All methods run on the event-loop thread and never throw.
    class ChartSeriesFacade {
    public:
        using Clock = std::function<core::Timestamp()>;
        using UpdateListener = std::function<void(const data::FetchOutcome&)>;

        ChartSeriesFacade(data::BarStore& store,
                          IntervalTimer& timer,
                          const core::EngineConfig& config,
                          Clock clock = nullptr,
                          indicators::ChainFill chain_fill = indicators::ChainFill::ZeroFill);
        ~ChartSeriesFacade();

        ChartSeriesFacade(const ChartSeriesFacade&) = delete;
        ChartSeriesFacade& operator=(const ChartSeriesFacade&) = delete;

        // --- Events ---
        void setSymbol(const std::string& symbol);
        void setWindow(core::DisplayWindow window);
        void setMarketOpen(bool market_open);
        // Fetches the current window's resolution now, whatever the scheduler is doing
        void refetch();
        // Chart torn down: timer cancelled, late fetch results ignored
        void shutdown();

        // Applies the three inputs as events, then composes from the cache.
        // Missing data is requested and shows up once it lands.
        ChartSeries build(const std::string& symbol, core::DisplayWindow window,
                          core::Timestamp now, bool market_open);

        // Engine-facing entry point: build() at clock() plus loading state
        SeriesView getSeries(const std::string& symbol, core::DisplayWindow window);
        // View of the current symbol/window without raising events
        SeriesView currentView() const;

        // Pure composition over whatever is cached for `symbol`
        ChartSeries compose(const std::string& symbol, core::DisplayWindow window, core::Timestamp now) const;

        // Called after every fetch this facade issued has settled
        void setUpdateListener(UpdateListener listener) { listener_ = std::move(listener); }

        const RefreshScheduler& scheduler() const { return scheduler_; }
        const std::string& symbol() const { return symbol_; }
        core::DisplayWindow window() const { return window_; }
        bool isLoading() const;
        const std::optional<std::string>& error() const { return error_; }

    private:
        enum class FetchTrigger { SymbolChange, FirstAccess, Manual, Timer };
        static const char* triggerName(FetchTrigger trigger);
        static std::size_t slot(core::Resolution resolution);


        void issueFetch(core::Resolution resolution, FetchTrigger trigger);
        void onFetchSettled(const data::FetchOutcome& outcome, FetchTrigger trigger);
        void fetchIfMissing(core::Resolution resolution);

        data::BarStore& store_;
        RefreshScheduler scheduler_;
        Clock clock_;
        indicators::ChainFill chain_fill_;
        UpdateListener listener_;

        std::string symbol_;
        core::DisplayWindow window_ = core::DisplayWindow::OneDay;
        bool market_open_ = false;
        bool shut_down_ = false;

        // Unsettled requests per (symbol, resolution)
        std::map<std::pair<std::string, core::Resolution>, int> pending_;
        // A request was issued for this resolution since the symbol became active
        std::array<bool, 2> attempted_ = {false, false};
        std::optional<std::string> error_;

        std::shared_ptr<bool> alive_;
    };

} // namespace chart
