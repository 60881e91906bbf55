#include "signal_provider.hpp"
#include "sma_indicator.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <mutex>
#include <stdexcept>

namespace indicators {

namespace {

    void ensureTaLibInitialized() {
        static std::once_flag once;
        std::call_once(once, [] {
            TA_RetCode ret_code = TA_Initialize();
            if (ret_code != TA_SUCCESS) {
                throw core::IndicatorCalculationException(
                    fmt::format("TA_Initialize failed with code {}", static_cast<int>(ret_code)));
            }
        });
    }

} // anonymous namespace

SignalSettings SignalSettings::fromJson(const nlohmann::json& config) {
    SignalSettings settings;
    if (!config.is_object()) {
        throw core::ConfigurationException("Indicator settings must be a JSON object.");
    }
    try {
        settings.sma_periods = config.value("sma_periods", settings.sma_periods);
        settings.rsi_period = config.value("rsi_period", settings.rsi_period);
        settings.macd_fast = config.value("macd_fast", settings.macd_fast);
        settings.macd_slow = config.value("macd_slow", settings.macd_slow);
        settings.macd_signal = config.value("macd_signal", settings.macd_signal);
        settings.bollinger_period = config.value("bollinger_period", settings.bollinger_period);
        settings.bollinger_std_dev = config.value("bollinger_std_dev", settings.bollinger_std_dev);
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigurationException(fmt::format("Invalid indicator settings: {}", e.what()));
    }
    return settings;
}

SignalProvider::SignalProvider(SignalSettings settings)
    : settings_(std::move(settings))
{
    // Constructing the indicators once validates every period up front
    createIndicators();
}

std::vector<std::unique_ptr<IIndicator>> SignalProvider::createIndicators() const {
    std::vector<std::unique_ptr<IIndicator>> created;
    try {
        for (int period : settings_.sma_periods) {
            created.push_back(std::make_unique<SmaIndicator>(period));
        }
        created.push_back(std::make_unique<RsiIndicator>(settings_.rsi_period));
        created.push_back(std::make_unique<MacdIndicator>(settings_.macd_fast, settings_.macd_slow, settings_.macd_signal));
        created.push_back(std::make_unique<BollingerIndicator>(settings_.bollinger_period, settings_.bollinger_std_dev));
    } catch (const std::invalid_argument& e) {
        throw core::ConfigurationException(fmt::format("Invalid indicator settings: {}", e.what()));
    }
    return created;
}

std::vector<std::string> SignalProvider::indicatorNames() const {
    std::vector<std::string> names;
    for (int period : settings_.sma_periods) {
        names.push_back(fmt::format("SMA_{}", period));
    }
    names.push_back("RSI");
    names.push_back(MacdIndicator::kMacd);
    names.push_back(MacdIndicator::kSignal);
    names.push_back(MacdIndicator::kHistogram);
    names.push_back(BollingerIndicator::kUpper);
    names.push_back(BollingerIndicator::kMiddle);
    names.push_back(BollingerIndicator::kLower);
    return names;
}

core::TimeSeries<core::Bar> SignalProvider::buildBars(const core::TimeSeries<core::Candle>& candles) const {
    ensureTaLibInitialized();
    auto logger = core::logging::getLogger();

    core::TimeSeries<core::Bar> bars;
    bars.reserve(candles.size());
    for (const auto& candle : candles) {
        core::Bar bar;
        static_cast<core::Candle&>(bar) = candle;
        bars.push_back(std::move(bar));
    }

    for (auto& indicator : createIndicators()) {
        indicator->calculate(candles);
        const std::size_t lookback = static_cast<std::size_t>(indicator->getLookback());

        for (const auto& output : indicator->getResults()) {
            const std::string& key = output.first;
            const core::TimeSeries<double>& values = output.second;
            for (std::size_t i = 0; i < bars.size(); ++i) {
                core::IndicatorValue value;
                if (i >= lookback && i - lookback < values.size()) {
                    value = values[i - lookback];
                }
                bars[i].indicators[key] = value;
            }
        }
        logger->debug("Attached {} (lookback {}) to {} bars.", indicator->getName(), lookback, bars.size());
    }
    return bars;
}

} // namespace indicators
