#pragma once

#include "indicators.hpp"
#include <string>

namespace indicators {

// Bollinger Bands over an SMA, attached as "BB_upper", "BB_middle", "BB_lower"
class BollingerIndicator : public IIndicator {
public:
    BollingerIndicator(int period = 20, double num_std_dev = 2.0);

    virtual ~BollingerIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const IndicatorOutputs& getResults() const override;

    static constexpr const char* kUpper = "BB_upper";
    static constexpr const char* kMiddle = "BB_middle";
    static constexpr const char* kLower = "BB_lower";

private:
    const int period_;
    const double num_std_dev_;
    int lookback_;
    std::string name_;
    IndicatorOutputs results_;
};

} // namespace indicators
