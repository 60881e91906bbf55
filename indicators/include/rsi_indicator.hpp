#pragma once

#include "indicators.hpp" // Use short path
#include <string>

namespace indicators {

class RsiIndicator : public IIndicator {
public:
    // Constructor: Requires the period for the RSI and the bar key to attach it under
    explicit RsiIndicator(int period, std::string output_name = "RSI");

    // Override methods from IIndicator
    virtual ~RsiIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const IndicatorOutputs& getResults() const override;

private:
    const int period_;
    int lookback_;
    std::string name_;
    std::string output_name_;
    IndicatorOutputs results_;
};

} // namespace indicators
