#include "chart_series_facade.hpp"
#include "indicator_engine.hpp"
#include "logging.hpp"
#include "range_selector.hpp"

#include <chrono>
#include <numeric>

namespace chart {

ChartSeriesFacade::ChartSeriesFacade(data::BarStore& store,
                                     IntervalTimer& timer,
                                     const core::EngineConfig& config,
                                     Clock clock,
                                     indicators::ChainFill chain_fill)
    : store_(store),
      scheduler_(timer,
                 std::chrono::duration_cast<std::chrono::milliseconds>(config.refresh_interval),
                 [this]() { issueFetch(core::Resolution::Intraday, FetchTrigger::Timer); }),
      clock_(clock ? std::move(clock) : Clock([]{ return std::chrono::system_clock::now(); })),
      chain_fill_(chain_fill),
      alive_(std::make_shared<bool>(true))
{
}

ChartSeriesFacade::~ChartSeriesFacade() {
    shutdown();
}

void ChartSeriesFacade::setSymbol(const std::string& symbol) {
    if (shut_down_) return;

    if (symbol == symbol_) {
        // Same symbol: only a resolution never loaded for it needs a request
        fetchIfMissing(RangeSelector::resolutionFor(window_));
        return;
    }

    core::logging::getLogger()->info("Chart symbol changed: '{}' -> '{}'", symbol_, symbol);
    symbol_ = symbol;
    error_.reset();
    attempted_ = {false, false};
    store_.setActiveSymbol(symbol_);
    scheduler_.onSymbolChanged(symbol_);

    if (symbol_.empty()) {
        return;
    }

    // Both resolutions up front so a later window switch does not wait
    issueFetch(core::Resolution::Intraday, FetchTrigger::SymbolChange);
    issueFetch(core::Resolution::EndOfDay, FetchTrigger::SymbolChange);
}

void ChartSeriesFacade::setWindow(core::DisplayWindow window) {
    if (shut_down_) return;

    if (window != window_) {
        window_ = window;
        scheduler_.onWindowChanged(window_);
    }
    fetchIfMissing(RangeSelector::resolutionFor(window_));
}

void ChartSeriesFacade::setMarketOpen(bool market_open) {
    if (shut_down_ || market_open == market_open_) return;
    market_open_ = market_open;
    scheduler_.onMarketOpenChanged(market_open_);
}

void ChartSeriesFacade::refetch() {
    if (shut_down_ || symbol_.empty()) return;
    error_.reset();
    issueFetch(RangeSelector::resolutionFor(window_), FetchTrigger::Manual);
}

void ChartSeriesFacade::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    scheduler_.shutdown();
    // Nothing issued for this chart may land in the cache any more
    store_.setActiveSymbol("");
    alive_.reset();
    core::logging::getLogger()->debug("ChartSeriesFacade for '{}' shut down", symbol_);
}

ChartSeries ChartSeriesFacade::build(const std::string& symbol, core::DisplayWindow window,
                                     core::Timestamp now, bool market_open)
{
    if (symbol != symbol_ && !shut_down_) {
        // Window first so the symbol change fetches and schedules with the right one
        if (window != window_) {
            window_ = window;
            scheduler_.onWindowChanged(window_);
        }
        setMarketOpen(market_open);
        setSymbol(symbol);
    } else {
        setWindow(window);
        setMarketOpen(market_open);
    }
    return compose(symbol, window, now);
}

SeriesView ChartSeriesFacade::getSeries(const std::string& symbol, core::DisplayWindow window) {
    build(symbol, window, clock_(), market_open_);
    return currentView();
}

SeriesView ChartSeriesFacade::currentView() const {
    SeriesView view;
    static_cast<ChartSeries&>(view) = compose(symbol_, window_, clock_());
    view.symbol = symbol_;
    view.window = window_;
    view.is_loading = isLoading();
    view.error = error_;
    view.last_updated = store_.lastUpdated();
    view.raw_intraday = store_.get(symbol_, core::Resolution::Intraday);
    view.raw_end_of_day = store_.get(symbol_, core::Resolution::EndOfDay);
    return view;
}

ChartSeries ChartSeriesFacade::compose(const std::string& symbol, core::DisplayWindow window,
                                       core::Timestamp now) const
{
    ChartSeries result;
    result.lookback_period = indicators::IndicatorEngine::lookbackPeriodFor(window);

    core::BarSeriesPtr cached = store_.get(symbol, RangeSelector::resolutionFor(window));
    if (!cached) {
        return result;
    }

    core::BarSeries filtered = RangeSelector::select(*cached, window, now);

    try {
        result.series = indicators::IndicatorEngine::annotate(filtered, result.lookback_period, chain_fill_);
    } catch (const std::exception& e) {
        // Bars are still worth drawing without overlays
        core::logging::getLogger()->error("Indicator calculation failed for {} ({}): {}",
                                          symbol, core::toString(window), e.what());
        result.series.clear();
        for (const auto& bar : filtered) {
            result.series.push_back(core::AnnotatedBar{bar, core::IndicatorSet{}});
        }
    }

    if (!filtered.empty()) {
        const double total_volume = std::accumulate(filtered.begin(), filtered.end(), 0.0,
            [](double sum, const core::Bar& bar) { return sum + bar.volume; });
        result.avg_volume = total_volume / static_cast<double>(filtered.size());
    }
    return result;
}

std::size_t ChartSeriesFacade::slot(core::Resolution resolution) {
    return resolution == core::Resolution::Intraday ? 0 : 1;
}

const char* ChartSeriesFacade::triggerName(FetchTrigger trigger) {
    switch (trigger) {
        case FetchTrigger::SymbolChange: return "symbol change";
        case FetchTrigger::FirstAccess:  return "first access";
        case FetchTrigger::Manual:       return "manual refetch";
        case FetchTrigger::Timer:        return "timer";
    }
    return "unknown";
}

bool ChartSeriesFacade::isLoading() const {
    for (const auto& entry : pending_) {
        if (entry.first.first == symbol_ && entry.second > 0) {
            return true;
        }
    }
    return false;
}

void ChartSeriesFacade::fetchIfMissing(core::Resolution resolution) {
    if (symbol_.empty()) return;
    // One automatic attempt per activation; after a failure only refetch() or a tick retries
    if (!attempted_[slot(resolution)] && store_.needsFetch(symbol_, resolution)) {
        issueFetch(resolution, FetchTrigger::FirstAccess);
    }
}

void ChartSeriesFacade::issueFetch(core::Resolution resolution, FetchTrigger trigger) {
    if (shut_down_ || symbol_.empty()) return;

    core::logging::getLogger()->debug("Fetching {} bars for {} ({})",
                                      core::toString(resolution), symbol_, triggerName(trigger));
    ++pending_[std::make_pair(symbol_, resolution)];
    attempted_[slot(resolution)] = true;

    std::weak_ptr<bool> alive = alive_;
    store_.fetch(symbol_, resolution, [this, alive, trigger](const data::FetchOutcome& outcome) {
        if (alive.expired()) {
            return;
        }
        onFetchSettled(outcome, trigger);
    });
}

void ChartSeriesFacade::onFetchSettled(const data::FetchOutcome& outcome, FetchTrigger trigger) {
    const auto key = std::make_pair(outcome.symbol, outcome.resolution);
    auto it = pending_.find(key);
    if (it != pending_.end() && --it->second <= 0) {
        pending_.erase(it);
    }

    if (outcome.symbol == symbol_ && outcome.status == data::FetchStatus::Failed) {
        if (trigger == FetchTrigger::Timer) {
            // Background refresh: the chart keeps showing the last good bars
            core::logging::getLogger()->warn("Scheduled refresh for {} failed: {}", outcome.symbol, outcome.error);
        } else {
            error_ = outcome.error;
        }
    }

    if (listener_) {
        listener_(outcome);
    }
}

} // namespace chart
