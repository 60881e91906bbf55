#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>
#include <memory>

namespace strategy_engine {

    // --- SignalStrategy ---
    // Base for the built-in single-signal strategies: one buy condition checked while flat,
    // one sell condition checked while holding. Undefined indicators make both conditions false.
    class SignalStrategy : public IStrategy {
    public:
        virtual ~SignalStrategy() override = default;

        std::string getName() const override { return name_; }
        const std::vector<std::string>& getRequiredIndicatorNames() const override { return required_indicator_names_; }
        core::Action decide(const HistoryView& history, const core::PortfolioState& state) const override;

        const ICondition& getBuyCondition() const { return *buy_condition_; }
        const ICondition& getSellCondition() const { return *sell_condition_; }

    protected:
        SignalStrategy(std::string name,
                       std::unique_ptr<ICondition> buy_condition,
                       std::unique_ptr<ICondition> sell_condition,
                       std::string buy_reason,
                       std::string sell_reason);

    private:
        std::string name_;
        std::vector<std::string> required_indicator_names_;
        std::unique_ptr<ICondition> buy_condition_;
        std::unique_ptr<ICondition> sell_condition_;
        std::string buy_reason_;
        std::string sell_reason_;
    };

    // Golden cross / dead cross of two moving averages
    class MovingAverageCrossStrategy : public SignalStrategy {
    public:
        MovingAverageCrossStrategy(std::string name = "ma_cross",
                                   std::string fast_indicator = "SMA_25",
                                   std::string slow_indicator = "SMA_75");
    };

    // Mean reversion on RSI: buy oversold, sell overbought
    class RsiReversionStrategy : public SignalStrategy {
    public:
        RsiReversionStrategy(std::string name = "rsi",
                             double oversold = 35.0,
                             double overbought = 65.0,
                             std::string rsi_indicator = "RSI");
    };

    // MACD histogram crossing the zero line (MACD line crossing its signal line)
    class MacdCrossStrategy : public SignalStrategy {
    public:
        explicit MacdCrossStrategy(std::string name = "macd",
                                   std::string histogram_indicator = "MACD_histogram");
    };

    // Close touching the lower band buys, touching the upper band sells
    class BollingerBandStrategy : public SignalStrategy {
    public:
        BollingerBandStrategy(std::string name = "bollinger",
                              std::string lower_band_indicator = "BB_lower",
                              std::string upper_band_indicator = "BB_upper");
    };

} // namespace strategy_engine
