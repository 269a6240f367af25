#pragma once

#include "datatypes.hpp" // Needs TimeSeries, OptionalSeries
#include <string>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(20)", "TEMA(50)")
    virtual std::string getName() const = 0;

    // Lookback period k: number of trailing bars one output value spans
    virtual int getPeriod() const = 0;

    // Calculate the indicator over a close-price sequence.
    // The result is stored internally.
    virtual void calculate(const core::TimeSeries<double>& prices) = 0;

    // Calculated results, aligned 1:1 with the last input.
    // Slots without enough history hold std::nullopt.
    virtual const core::OptionalSeries& getResult() const = 0;
};

} // namespace indicators
