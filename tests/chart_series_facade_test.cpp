#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "bar_store.hpp"
#include "chart_series_facade.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

using chart::ChartSeriesFacade;
using core::DisplayWindow;
using core::Resolution;
using core::utils::makeLocalTime;
using namespace std::chrono_literals;

namespace {

    class ChartSeriesFacadeTest : public ::testing::Test {
    protected:
        ChartSeriesFacadeTest()
            : now_(makeLocalTime(2026, 3, 11, 14, 0)),
              store_(source_, [this] { return now_; }),
              facade_(store_, timer_, config_, [this] { return now_; })
        {
            facade_.setUpdateListener([this](const data::FetchOutcome& outcome) { outcomes_.push_back(outcome); });
        }

        // Settles both requests issued by a symbol change
        void loadBoth(const std::string& symbol) {
            source_.succeed(symbol, Resolution::Intraday,
                            test_support::intradayBars(makeLocalTime(2026, 3, 11, 9, 30), 15, 187.25));
            source_.succeed(symbol, Resolution::EndOfDay,
                            test_support::dailyBars(makeLocalTime(2026, 3, 11), 60, 100.0));
        }

        core::Timestamp now_;
        core::EngineConfig config_;
        test_support::FakeBarSource source_;
        data::BarStore store_;
        test_support::ManualIntervalTimer timer_;
        ChartSeriesFacade facade_;
        std::vector<data::FetchOutcome> outcomes_;
    };

} // namespace

TEST_F(ChartSeriesFacadeTest, SymbolChangeFetchesBothResolutions) {
    const auto view = facade_.getSeries("AAPL", DisplayWindow::OneMonth);

    EXPECT_EQ(source_.countPending("AAPL", Resolution::Intraday), 1u);
    EXPECT_EQ(source_.countPending("AAPL", Resolution::EndOfDay), 1u);
    EXPECT_TRUE(view.is_loading);
    EXPECT_TRUE(view.series.empty());
    EXPECT_FALSE(view.avg_volume);
    EXPECT_EQ(view.lookback_period, 10);
    EXPECT_EQ(view.symbol, "AAPL");
}

TEST_F(ChartSeriesFacadeTest, WindowSwitchDoesNotRefetchLoadedResolution) {
    facade_.getSeries("AAPL", DisplayWindow::OneDay);
    loadBoth("AAPL");

    facade_.getSeries("AAPL", DisplayWindow::OneYear);
    facade_.getSeries("AAPL", DisplayWindow::FiveDay);

    EXPECT_EQ(source_.total_requests, 2u);
    EXPECT_TRUE(source_.pending.empty());
}

TEST_F(ChartSeriesFacadeTest, WindowSwitchWhileLoadingDoesNotDuplicateRequest) {
    facade_.getSeries("AAPL", DisplayWindow::OneDay);
    facade_.getSeries("AAPL", DisplayWindow::OneYear);

    EXPECT_EQ(source_.total_requests, 2u);
}

TEST_F(ChartSeriesFacadeTest, InsufficientIntradayBarsHaveNoOverlays) {
    facade_.getSeries("AAPL", DisplayWindow::OneDay);
    loadBoth("AAPL");

    const auto view = facade_.getSeries("AAPL", DisplayWindow::OneDay);

    EXPECT_FALSE(view.is_loading);
    EXPECT_EQ(view.lookback_period, 20);
    ASSERT_EQ(view.series.size(), 15u);
    for (const auto& point : view.series) {
        EXPECT_FALSE(point.indicators.sma);
        EXPECT_FALSE(point.indicators.ema);
        EXPECT_FALSE(point.indicators.wma);
        EXPECT_FALSE(point.indicators.dema);
        EXPECT_FALSE(point.indicators.tema);
    }
}

TEST_F(ChartSeriesFacadeTest, AverageVolumeCoversDisplayedBarsOnly) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);

    auto bars = test_support::dailyBars(makeLocalTime(2026, 3, 11), 60, 100.0, 1000.0);
    const auto cutoff = makeLocalTime(2026, 2, 11);
    for (auto& bar : bars) {
        if (bar.timestamp < cutoff) bar.volume = 50000.0;
    }
    source_.succeed("AAPL", Resolution::EndOfDay, bars);

    const auto view = facade_.getSeries("AAPL", DisplayWindow::OneMonth);

    // Feb 11 .. Mar 11 2026
    ASSERT_EQ(view.series.size(), 29u);
    EXPECT_EQ(view.series.front().bar.timestamp, cutoff);
    ASSERT_TRUE(view.avg_volume);
    EXPECT_DOUBLE_EQ(*view.avg_volume, 1000.0);
    ASSERT_NE(view.raw_end_of_day, nullptr);
    EXPECT_EQ(view.raw_end_of_day->size(), 60u);
    // Intraday still in flight
    EXPECT_EQ(view.raw_intraday, nullptr);
    EXPECT_EQ(view.last_updated, now_);
}

TEST_F(ChartSeriesFacadeTest, FlatEndOfDayPriceGivesFlatOverlays) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);
    source_.succeed("AAPL", Resolution::EndOfDay,
                    test_support::dailyBars(makeLocalTime(2026, 3, 11), 29, 100.0));

    const auto series = facade_.build("AAPL", DisplayWindow::OneMonth, now_, false).series;

    ASSERT_EQ(series.size(), 29u);
    for (std::size_t i = 9; i < series.size(); ++i) {
        EXPECT_NEAR(*series[i].indicators.sma, 100.0, 1e-9);
        EXPECT_NEAR(*series[i].indicators.ema, 100.0, 1e-9);
        EXPECT_NEAR(*series[i].indicators.wma, 100.0, 1e-9);
    }
}

TEST_F(ChartSeriesFacadeTest, LateResponseForPreviousSymbolNeverShows) {
    facade_.getSeries("A", DisplayWindow::OneDay);
    facade_.getSeries("B", DisplayWindow::OneDay);

    source_.succeed("A", Resolution::Intraday,
                    test_support::intradayBars(makeLocalTime(2026, 3, 11, 9, 30), 10, 1.0));

    auto view = facade_.getSeries("B", DisplayWindow::OneDay);
    EXPECT_EQ(view.symbol, "B");
    EXPECT_TRUE(view.series.empty());
    EXPECT_TRUE(view.is_loading);
    EXPECT_EQ(store_.get("B", Resolution::Intraday), nullptr);
    EXPECT_EQ(store_.get("A", Resolution::Intraday), nullptr);

    source_.succeed("B", Resolution::Intraday,
                    test_support::intradayBars(makeLocalTime(2026, 3, 11, 9, 30), 4, 2.0));

    view = facade_.getSeries("B", DisplayWindow::OneDay);
    ASSERT_EQ(view.series.size(), 4u);
    for (const auto& point : view.series) {
        EXPECT_DOUBLE_EQ(point.bar.close, 2.0);
    }
}

TEST_F(ChartSeriesFacadeTest, FailureIsSurfacedAndClearedByRefetch) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);
    source_.fail("AAPL", Resolution::EndOfDay, "HTTP 500");

    auto view = facade_.currentView();
    ASSERT_TRUE(view.error);
    EXPECT_EQ(*view.error, "HTTP 500");

    facade_.refetch();
    EXPECT_FALSE(facade_.error());
    EXPECT_EQ(source_.countPending("AAPL", Resolution::EndOfDay), 1u);
    EXPECT_EQ(source_.countPending("AAPL", Resolution::Intraday), 1u);
}

TEST_F(ChartSeriesFacadeTest, FailureKeepsLastGoodBars) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);
    loadBoth("AAPL");

    facade_.refetch();
    source_.fail("AAPL", Resolution::EndOfDay, "timeout");

    const auto view = facade_.currentView();
    EXPECT_EQ(view.series.size(), 29u);
    EXPECT_TRUE(view.error);
    EXPECT_FALSE(view.is_loading);
}

TEST_F(ChartSeriesFacadeTest, RawCachesAreUnfiltered) {
    facade_.getSeries("AAPL", DisplayWindow::OneDay);
    source_.succeed("AAPL", Resolution::Intraday,
                    test_support::intradayBars(makeLocalTime(2026, 3, 10, 9, 30), 100, 187.25));

    const auto view = facade_.getSeries("AAPL", DisplayWindow::OneDay);

    ASSERT_NE(view.raw_intraday, nullptr);
    EXPECT_EQ(view.raw_intraday->size(), 100u);
    // Mar 10 09:30 + 99 * 5 min ends Mar 10 17:45, so nothing falls on Mar 11
    EXPECT_TRUE(view.series.empty());
    EXPECT_EQ(view.raw_end_of_day, nullptr);
}

TEST_F(ChartSeriesFacadeTest, FailedFetchIsNotRetriedOnRedraw) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);
    loadBoth("AAPL");

    facade_.getSeries("MSFT", DisplayWindow::OneMonth);
    source_.succeed("MSFT", Resolution::Intraday,
                    test_support::intradayBars(makeLocalTime(2026, 3, 11, 9, 30), 5, 400.0));
    source_.fail("MSFT", Resolution::EndOfDay, "HTTP 503");
    const std::size_t requests_before = source_.total_requests;

    for (int frame = 0; frame < 3; ++frame) {
        const auto view = facade_.getSeries("MSFT", DisplayWindow::OneMonth);
        EXPECT_FALSE(view.is_loading);
        ASSERT_TRUE(view.error);
        EXPECT_EQ(*view.error, "HTTP 503");
    }
    facade_.setWindow(DisplayWindow::SixMonth);
    facade_.setSymbol("MSFT");

    EXPECT_EQ(source_.total_requests, requests_before);

    // Only an explicit refetch tries again
    facade_.refetch();
    EXPECT_EQ(source_.total_requests, requests_before + 1);
    EXPECT_EQ(source_.countPending("MSFT", Resolution::EndOfDay), 1u);
}

TEST_F(ChartSeriesFacadeTest, NewActivationRetriesFailedResolution) {
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);
    source_.succeed("AAPL", Resolution::Intraday, {});
    source_.fail("AAPL", Resolution::EndOfDay, "timeout");

    facade_.getSeries("MSFT", DisplayWindow::OneMonth);
    facade_.getSeries("AAPL", DisplayWindow::OneMonth);

    EXPECT_EQ(source_.countPending("AAPL", Resolution::EndOfDay), 1u);
    EXPECT_EQ(source_.countPending("AAPL", Resolution::Intraday), 1u);
}

TEST_F(ChartSeriesFacadeTest, RefetchTargetsCurrentWindowResolution) {
    facade_.getSeries("AAPL", DisplayWindow::FiveDay);
    loadBoth("AAPL");

    facade_.refetch();

    EXPECT_EQ(source_.countPending("AAPL", Resolution::Intraday), 1u);
    EXPECT_EQ(source_.countPending("AAPL", Resolution::EndOfDay), 0u);
    EXPECT_TRUE(facade_.isLoading());
}

TEST_F(ChartSeriesFacadeTest, TimerRefreshesIntradayOnlyWhileMarketOpen) {
    facade_.build("AAPL", DisplayWindow::OneDay, now_, true);
    loadBoth("AAPL");
    EXPECT_EQ(facade_.scheduler().state(), chart::RefreshScheduler::State::Scheduled);

    timer_.advance(5min);

    EXPECT_EQ(source_.countPending("AAPL", Resolution::Intraday), 1u);
    EXPECT_EQ(source_.countPending("AAPL", Resolution::EndOfDay), 0u);

    // Background failures are logged, not shown
    source_.fail("AAPL", Resolution::Intraday, "HTTP 502");
    EXPECT_FALSE(facade_.error());
}

TEST_F(ChartSeriesFacadeTest, NoTimerRefreshWhileMarketClosed) {
    facade_.build("AAPL", DisplayWindow::OneDay, now_, false);
    loadBoth("AAPL");

    timer_.advance(10min);

    EXPECT_EQ(timer_.fires, 0u);
    EXPECT_EQ(source_.total_requests, 2u);
}

TEST_F(ChartSeriesFacadeTest, MarketCloseStopsRefreshes) {
    facade_.build("AAPL", DisplayWindow::OneDay, now_, true);
    loadBoth("AAPL");

    facade_.setMarketOpen(false);
    timer_.advance(15min);

    EXPECT_FALSE(timer_.isActive());
    EXPECT_EQ(source_.total_requests, 2u);
}

TEST_F(ChartSeriesFacadeTest, ListenerSeesEverySettledFetch) {
    facade_.getSeries("AAPL", DisplayWindow::OneDay);
    loadBoth("AAPL");

    ASSERT_EQ(outcomes_.size(), 2u);
    EXPECT_EQ(outcomes_[0].status, data::FetchStatus::Applied);
    EXPECT_EQ(outcomes_[1].status, data::FetchStatus::Applied);
}

TEST_F(ChartSeriesFacadeTest, ShutdownIgnoresLateResults) {
    facade_.build("AAPL", DisplayWindow::OneDay, now_, true);
    facade_.shutdown();

    EXPECT_FALSE(timer_.isActive());
    loadBoth("AAPL");

    EXPECT_TRUE(outcomes_.empty());
    EXPECT_EQ(store_.get("AAPL", Resolution::Intraday), nullptr);

    facade_.getSeries("MSFT", DisplayWindow::OneDay);
    EXPECT_EQ(source_.total_requests, 2u);
}
