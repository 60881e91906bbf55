#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// MACD line, signal line and histogram, attached as "MACD", "MACD_signal", "MACD_histogram"
class MacdIndicator : public IIndicator {
public:
    MacdIndicator(int fast_period = 12, int slow_period = 26, int signal_period = 9);

    virtual ~MacdIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const IndicatorOutputs& getResults() const override;

    static constexpr const char* kMacd = "MACD";
    static constexpr const char* kSignal = "MACD_signal";
    static constexpr const char* kHistogram = "MACD_histogram";

private:
    const int fast_period_;
    const int slow_period_;
    const int signal_period_;
    int lookback_;
    std::string name_;
    IndicatorOutputs results_;
};

} // namespace indicators
