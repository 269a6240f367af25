#include "moving_average.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // TA-Lib C API header
#include <stdexcept>
#include <vector>

namespace indicators {

namespace {

    // Shared signature of TA_SMA / TA_EMA / TA_WMA
    using TaMovingAverageFn = TA_RetCode (*)(int, int, const double[], int, int*, int*, double[]);

    void validatePeriod(int period) {
        // TA-Lib accepts 2..100000 for every moving average used here
        if (period < 2) {
            throw std::invalid_argument(fmt::format("Moving average period must be at least 2, got {}", period));
        }
    }

    // Runs one TA-Lib pass and re-aligns its compact output to the input length
    core::OptionalSeries runTaMovingAverage(const char* ta_name,
                                            TaMovingAverageFn ta_fn,
                                            int lookback,
                                            const core::TimeSeries<double>& values,
                                            int period)
    {
        core::OptionalSeries aligned(values.size());
        if (lookback < 0) {
            throw core::IndicatorCalculationException(
                fmt::format("{} lookback returned an unexpected value: {}", ta_name, lookback));
        }
        if (values.size() <= static_cast<std::size_t>(lookback)) {
            // Not enough data to calculate anything
            return aligned;
        }

        std::vector<double> output(values.size() - static_cast<std::size_t>(lookback));
        int out_begin_idx = 0;
        int out_nb_element = 0;

        TA_RetCode ret_code = ta_fn(
            0,                                   // startIdx
            static_cast<int>(values.size()) - 1, // endIdx
            values.data(),                       // inReal
            period,                              // optInTimePeriod
            &out_begin_idx,                      // outBegIdx
            &out_nb_element,                     // outNBElement
            output.data()                        // outReal
        );

        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(
                fmt::format("TA-Lib {} failed for period {} with error code: {}", ta_name, period, static_cast<int>(ret_code)));
        }
        if (out_begin_idx != lookback) {
            core::logging::getLogger()->warn("{} out_begin_idx ({}) does not match lookback ({}).",
                                             ta_name, out_begin_idx, lookback);
        }

        for (int i = 0; i < out_nb_element; ++i) {
            aligned[static_cast<std::size_t>(out_begin_idx + i)] = output[static_cast<std::size_t>(i)];
        }
        return aligned;
    }

    // EMA over an already-computed pass (EMA of EMA)
    core::OptionalSeries chainedEma(const core::OptionalSeries& input, int period, ChainFill fill) {
        if (fill == ChainFill::ZeroFill) {
            core::TimeSeries<double> filled;
            filled.reserve(input.size());
            for (const auto& value : input) {
                filled.push_back(value.value_or(0.0));
            }
            return exponentialMovingAverage(filled, period);
        }

        // Propagate: the pass only sees the defined tail of its input
        core::OptionalSeries aligned(input.size());
        std::size_t first_defined = 0;
        while (first_defined < input.size() && !input[first_defined].has_value()) {
            ++first_defined;
        }
        if (first_defined == input.size()) {
            return aligned;
        }

        core::TimeSeries<double> tail;
        tail.reserve(input.size() - first_defined);
        for (std::size_t i = first_defined; i < input.size(); ++i) {
            // A gap after the first defined value cannot come out of an EMA pass
            tail.push_back(input[i].value_or(0.0));
        }

        core::OptionalSeries tail_ema = exponentialMovingAverage(tail, period);
        for (std::size_t i = 0; i < tail_ema.size(); ++i) {
            aligned[first_defined + i] = tail_ema[i];
        }
        return aligned;
    }

} // namespace

std::string toString(MovingAverageType type) {
    switch (type) {
        case MovingAverageType::SMA:  return "SMA";
        case MovingAverageType::EMA:  return "EMA";
        case MovingAverageType::WMA:  return "WMA";
        case MovingAverageType::DEMA: return "DEMA";
        case MovingAverageType::TEMA: return "TEMA";
    }
    return "MA";
}

core::OptionalSeries simpleMovingAverage(const core::TimeSeries<double>& prices, int period) {
    validatePeriod(period);
    return runTaMovingAverage("TA_SMA", &TA_SMA, TA_SMA_Lookback(period), prices, period);
}

core::OptionalSeries exponentialMovingAverage(const core::TimeSeries<double>& prices, int period) {
    validatePeriod(period);
    // Default compatibility mode seeds with the SMA of the first `period` values
    return runTaMovingAverage("TA_EMA", &TA_EMA, TA_EMA_Lookback(period), prices, period);
}

core::OptionalSeries weightedMovingAverage(const core::TimeSeries<double>& prices, int period) {
    validatePeriod(period);
    return runTaMovingAverage("TA_WMA", &TA_WMA, TA_WMA_Lookback(period), prices, period);
}

core::OptionalSeries doubleExponentialMovingAverage(const core::TimeSeries<double>& prices, int period,
                                                    ChainFill fill)
{
    core::OptionalSeries ema1 = exponentialMovingAverage(prices, period);
    core::OptionalSeries ema2 = chainedEma(ema1, period, fill);

    core::OptionalSeries dema(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (ema1[i] && ema2[i]) {
            dema[i] = 2.0 * *ema1[i] - *ema2[i];
        }
    }
    return dema;
}

core::OptionalSeries tripleExponentialMovingAverage(const core::TimeSeries<double>& prices, int period,
                                                    ChainFill fill)
{
    core::OptionalSeries ema1 = exponentialMovingAverage(prices, period);
    core::OptionalSeries ema2 = chainedEma(ema1, period, fill);
    core::OptionalSeries ema3 = chainedEma(ema2, period, fill);

    core::OptionalSeries tema(prices.size());
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (ema1[i] && ema2[i] && ema3[i]) {
            tema[i] = 3.0 * *ema1[i] - 3.0 * *ema2[i] + *ema3[i];
        }
    }
    return tema;
}

// --- MovingAverageIndicator ---

MovingAverageIndicator::MovingAverageIndicator(MovingAverageType type, int period, ChainFill fill)
    : type_(type), period_(period), fill_(fill)
{
    validatePeriod(period_);
    name_ = fmt::format("{}({})", toString(type_), period_);
    core::logging::getLogger()->trace("MovingAverageIndicator created: Name='{}'", name_);
}

std::string MovingAverageIndicator::getName() const {
    return name_;
}

int MovingAverageIndicator::getPeriod() const {
    return period_;
}

const core::OptionalSeries& MovingAverageIndicator::getResult() const {
    return results_;
}

void MovingAverageIndicator::calculate(const core::TimeSeries<double>& prices) {
    core::logging::getLogger()->trace("Calculating {} over {} prices...", name_, prices.size());
    switch (type_) {
        case MovingAverageType::SMA:
            results_ = simpleMovingAverage(prices, period_);
            break;
        case MovingAverageType::EMA:
            results_ = exponentialMovingAverage(prices, period_);
            break;
        case MovingAverageType::WMA:
            results_ = weightedMovingAverage(prices, period_);
            break;
        case MovingAverageType::DEMA:
            results_ = doubleExponentialMovingAverage(prices, period_, fill_);
            break;
        case MovingAverageType::TEMA:
            results_ = tripleExponentialMovingAverage(prices, period_, fill_);
            break;
    }
}

} // namespace indicators
