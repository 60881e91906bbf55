#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <map>
#include <string>
#include <vector>

namespace indicators {

// Output series keyed by the name they are attached to bars under (e.g. "MACD_signal")
using IndicatorOutputs = std::map<std::string, core::TimeSeries<double>>;

class IIndicator {
public:
    virtual ~IIndicator() = default; // Virtual destructor is important for interfaces!

    // Get the name of the indicator (e.g., "SMA(25)", "MACD(12,26,9)")
    virtual std::string getName() const = 0;

    // Number of leading input candles consumed before the first valid output.
    // Output element k belongs to input candle k + getLookback().
    virtual int getLookback() const = 0;

    // Calculate the indicator on closing prices and store the outputs internally.
    // Throws core::IndicatorCalculationException when TA-Lib reports an error.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Every output series has input.size() - getLookback() elements (none if the input is too short)
    virtual const IndicatorOutputs& getResults() const = 0;
};

// Closing prices in TA-Lib's input layout
std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input);

} // namespace indicators
