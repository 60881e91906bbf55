#pragma once

#include "indicators.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace indicators {

    struct SignalSettings {
        std::vector<int> sma_periods{5, 25, 75};
        int rsi_period = 14;
        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;
        int bollinger_period = 20;
        double bollinger_std_dev = 2.0;

        // Missing fields keep their defaults; bad types raise core::ConfigurationException
        static SignalSettings fromJson(const nlohmann::json& config);
    };

    // --- SignalProvider ---
    // Turns a candle series into bars carrying every configured indicator.
    // Each value only uses candles up to its own bar. Bars inside an indicator's
    // lookback carry the key without a value.
    class SignalProvider {
    public:
        explicit SignalProvider(SignalSettings settings = SignalSettings{});

        core::TimeSeries<core::Bar> buildBars(const core::TimeSeries<core::Candle>& candles) const;

        // Keys attached to every bar, e.g. "SMA_25", "RSI", "MACD_histogram", "BB_lower"
        std::vector<std::string> indicatorNames() const;

        const SignalSettings& getSettings() const { return settings_; }

    private:
        SignalSettings settings_;

        std::vector<std::unique_ptr<IIndicator>> createIndicators() const;
    };

} // namespace indicators
