#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

    enum class MovingAverageType {
        SMA,  // Simple
        EMA,  // Exponential, seeded with the SMA of the first k values
        WMA,  // Linear weights 1..k, newest bar weighted k
        DEMA, // 2*EMA1 - EMA2
        TEMA  // 3*EMA1 - 3*EMA2 + EMA3
    };

    // How an undefined slot of one EMA pass is fed into the next (DEMA/TEMA only)
    enum class ChainFill {
        ZeroFill,  // Undefined slots enter the next pass as 0
        Propagate  // Next pass starts at the first defined slot
    };

    std::string toString(MovingAverageType type);

    // --- Pure functions, output has the same length as `prices` ---
    // All throw std::invalid_argument for period < 2 and
    // core::IndicatorCalculationException if TA-Lib reports an error.
    core::OptionalSeries simpleMovingAverage(const core::TimeSeries<double>& prices, int period);
    core::OptionalSeries exponentialMovingAverage(const core::TimeSeries<double>& prices, int period);
    core::OptionalSeries weightedMovingAverage(const core::TimeSeries<double>& prices, int period);
    core::OptionalSeries doubleExponentialMovingAverage(const core::TimeSeries<double>& prices, int period,
                                                        ChainFill fill = ChainFill::ZeroFill);
    core::OptionalSeries tripleExponentialMovingAverage(const core::TimeSeries<double>& prices, int period,
                                                        ChainFill fill = ChainFill::ZeroFill);

    class MovingAverageIndicator : public IIndicator {
    public:
        MovingAverageIndicator(MovingAverageType type, int period, ChainFill fill = ChainFill::ZeroFill);
        ~MovingAverageIndicator() override = default;

        std::string getName() const override;
        int getPeriod() const override;
        void calculate(const core::TimeSeries<double>& prices) override;
        const core::OptionalSeries& getResult() const override;

    private:
        const MovingAverageType type_;
        const int period_;
        const ChainFill fill_;
        std::string name_;           // e.g. "EMA(20)"
        core::OptionalSeries results_;
    };

} // namespace indicators
