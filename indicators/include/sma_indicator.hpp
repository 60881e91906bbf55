#pragma once

#include "indicators.hpp" // Base interface
#include <string>

namespace indicators {

// Simple moving average of the close, attached as "SMA_<period>"
class SmaIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the SMA
    explicit SmaIndicator(int period);

    // Override methods from IIndicator
    virtual ~SmaIndicator() override = default; // Use override keyword

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const IndicatorOutputs& getResults() const override;

    const std::string& getOutputName() const { return output_name_; }

private:
    const int period_;          // SMA period (e.g., 25, 75)
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // Indicator name (e.g., "SMA(25)")
    std::string output_name_;   // Bar key (e.g., "SMA_25")
    IndicatorOutputs results_;
};

} // namespace indicators
