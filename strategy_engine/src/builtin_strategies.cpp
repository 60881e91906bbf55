#include "builtin_strategies.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "price_indicator_condition.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

SignalStrategy::SignalStrategy(std::string name,
                               std::unique_ptr<ICondition> buy_condition,
                               std::unique_ptr<ICondition> sell_condition,
                               std::string buy_reason,
                               std::string sell_reason)
    : name_(std::move(name)),
      buy_condition_(std::move(buy_condition)),
      sell_condition_(std::move(sell_condition)),
      buy_reason_(std::move(buy_reason)),
      sell_reason_(std::move(sell_reason))
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (!buy_condition_ || !sell_condition_) {
        throw std::invalid_argument(fmt::format("Strategy '{}' needs both a buy and a sell condition.", name_));
    }

    buy_condition_->collectIndicatorNames(required_indicator_names_);
    sell_condition_->collectIndicatorNames(required_indicator_names_);
    // Conditions may share an indicator (e.g. both sides read RSI)
    std::vector<std::string> unique_names;
    for (const auto& indicator_name : required_indicator_names_) {
        if (std::find(unique_names.begin(), unique_names.end(), indicator_name) == unique_names.end()) {
            unique_names.push_back(indicator_name);
        }
    }
    required_indicator_names_ = std::move(unique_names);
}

core::Action SignalStrategy::decide(const HistoryView& history, const core::PortfolioState& state) const {
    if (state.isFlat()) {
        if (buy_condition_->evaluate(history)) {
            return core::Action::buy(buy_reason_);
        }
    } else if (sell_condition_->evaluate(history)) {
        return core::Action::sell(sell_reason_);
    }
    return core::Action::hold();
}


MovingAverageCrossStrategy::MovingAverageCrossStrategy(std::string name,
                                                       std::string fast_indicator,
                                                       std::string slow_indicator)
    : SignalStrategy(std::move(name),
                     std::make_unique<IndicatorCrossCondition>(fast_indicator, CrossType::CrossesAbove, slow_indicator),
                     std::make_unique<IndicatorCrossCondition>(fast_indicator, CrossType::CrossesBelow, slow_indicator),
                     "golden cross",
                     "dead cross")
{
}

RsiReversionStrategy::RsiReversionStrategy(std::string name,
                                           double oversold,
                                           double overbought,
                                           std::string rsi_indicator)
    : SignalStrategy(std::move(name),
                     std::make_unique<IndicatorCondition>(rsi_indicator, ComparisonOp::LTE, oversold),
                     std::make_unique<IndicatorCondition>(rsi_indicator, ComparisonOp::GTE, overbought),
                     fmt::format("RSI oversold (<= {})", oversold),
                     fmt::format("RSI overbought (>= {})", overbought))
{
    if (!(oversold < overbought)) {
        throw std::invalid_argument(fmt::format("RSI oversold level {} must be below overbought level {}.",
                                                oversold, overbought));
    }
}

MacdCrossStrategy::MacdCrossStrategy(std::string name, std::string histogram_indicator)
    : SignalStrategy(std::move(name),
                     std::make_unique<IndicatorCrossCondition>(histogram_indicator, CrossType::CrossesAbove, 0.0),
                     std::make_unique<IndicatorCrossCondition>(histogram_indicator, CrossType::CrossesBelow, 0.0),
                     "MACD bullish cross",
                     "MACD bearish cross")
{
}

BollingerBandStrategy::BollingerBandStrategy(std::string name,
                                             std::string lower_band_indicator,
                                             std::string upper_band_indicator)
    : SignalStrategy(std::move(name),
                     std::make_unique<PriceIndicatorCondition>(PriceField::Close, ComparisonOp::LTE, lower_band_indicator),
                     std::make_unique<PriceIndicatorCondition>(PriceField::Close, ComparisonOp::GTE, upper_band_indicator),
                     "close at lower band",
                     "close at upper band")
{
}

} // namespace strategy_engine
