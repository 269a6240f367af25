#include "indicator_engine.hpp"
#include "logging.hpp"

#include <array>
#include <memory>

namespace indicators {

int IndicatorEngine::lookbackPeriodFor(core::DisplayWindow window) {
    switch (window) {
        case core::DisplayWindow::OneDay:
        case core::DisplayWindow::FiveDay:
            return 20;  // 100 minutes of 5-minute bars
        case core::DisplayWindow::OneMonth:
            return 10;
        case core::DisplayWindow::SixMonth:
        case core::DisplayWindow::YearToDate:
            return 20;
        case core::DisplayWindow::OneYear:
            return 50;
        case core::DisplayWindow::FiveYear:
            return 200;
    }
    return 20;
}

core::TimeSeries<core::AnnotatedBar> IndicatorEngine::annotate(const core::BarSeries& bars,
                                                               int period,
                                                               ChainFill fill)
{
    auto logger = core::logging::getLogger();

    // Constructing the indicators validates the period even for empty input
    std::array<std::unique_ptr<IIndicator>, 5> overlays = {
        std::make_unique<MovingAverageIndicator>(MovingAverageType::SMA, period, fill),
        std::make_unique<MovingAverageIndicator>(MovingAverageType::EMA, period, fill),
        std::make_unique<MovingAverageIndicator>(MovingAverageType::WMA, period, fill),
        std::make_unique<MovingAverageIndicator>(MovingAverageType::DEMA, period, fill),
        std::make_unique<MovingAverageIndicator>(MovingAverageType::TEMA, period, fill),
    };

    core::TimeSeries<core::AnnotatedBar> annotated;
    if (bars.empty()) {
        return annotated;
    }

    core::TimeSeries<double> close_prices;
    close_prices.reserve(bars.size());
    for (const auto& bar : bars) {
        close_prices.push_back(bar.close);
    }

    for (auto& overlay : overlays) {
        overlay->calculate(close_prices);
    }

    const auto& sma = overlays[0]->getResult();
    const auto& ema = overlays[1]->getResult();
    const auto& wma = overlays[2]->getResult();
    const auto& dema = overlays[3]->getResult();
    const auto& tema = overlays[4]->getResult();

    annotated.reserve(bars.size());
    for (std::size_t i = 0; i < bars.size(); ++i) {
        core::AnnotatedBar point;
        point.bar = bars[i];
        point.indicators.sma = sma[i];
        point.indicators.ema = ema[i];
        point.indicators.wma = wma[i];
        point.indicators.dema = dema[i];
        point.indicators.tema = tema[i];
        annotated.push_back(std::move(point));
    }

    logger->trace("Annotated {} bars with period {}", annotated.size(), period);
    return annotated;
}

} // namespace indicators
