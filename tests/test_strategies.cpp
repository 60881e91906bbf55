#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "and_condition.hpp"
#include "builtin_strategies.hpp"
#include "composite_strategy.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "or_condition.hpp"
#include "price_indicator_condition.hpp"
#include "rule.hpp"
#include "rule_strategy.hpp"
#include "test_helpers.hpp"

using namespace strategy_engine;
using test_helpers::ConstantStrategy;
using test_helpers::makeBar;

namespace {

    core::PortfolioState flatState() {
        core::PortfolioState state;
        state.cash = 1000.0;
        return state;
    }

    core::PortfolioState holdingState() {
        core::PortfolioState state;
        state.cash = 0.0;
        state.position_quantity = 10;
        state.average_entry_price = 100.0;
        state.entry_index = 0;
        return state;
    }

    // Two bars carrying the given values for one indicator
    core::TimeSeries<core::Bar> twoBars(const std::string& name, core::IndicatorValue previous, core::IndicatorValue current) {
        return {makeBar(0, 100, 100, {{name, previous}}), makeBar(1, 100, 100, {{name, current}})};
    }

    std::unique_ptr<IRule> makeRule(const std::string& name, double threshold, core::Action action) {
        return std::make_unique<Rule>(name, std::make_unique<IndicatorCondition>("RSI", ComparisonOp::LT, threshold), action);
    }

} // namespace

TEST(HistoryViewTest, ExposesOnlyTheVisibleBars) {
    const core::TimeSeries<core::Bar> bars{makeBar(0, 1, 1), makeBar(1, 2, 2), makeBar(2, 3, 3)};
    const HistoryView view(bars, 2);

    EXPECT_EQ(view.size(), 2u);
    EXPECT_EQ(view.currentIndex(), 1u);
    EXPECT_DOUBLE_EQ(view.current().close, 2.0);
    ASSERT_NE(view.previous(), nullptr);
    EXPECT_DOUBLE_EQ(view.previous()->close, 1.0);
    EXPECT_THROW(view.at(2), std::out_of_range);
    EXPECT_THROW(HistoryView(bars, 4), std::out_of_range);
    EXPECT_EQ(HistoryView(bars, 1).previous(), nullptr);
}

TEST(ConditionTest, IndicatorComparisonIsFalseWhenUndefined) {
    const IndicatorCondition condition("RSI", ComparisonOp::LTE, 30.0);

    const auto defined = twoBars("RSI", 50.0, 25.0);
    EXPECT_TRUE(condition.evaluate(HistoryView(defined, 2)));
    EXPECT_FALSE(condition.evaluate(HistoryView(defined, 1)));

    const auto undefined = twoBars("RSI", 25.0, std::nullopt);
    EXPECT_FALSE(condition.evaluate(HistoryView(undefined, 2)));
    EXPECT_EQ(condition.describe(), "RSI <= 30");
}

TEST(ConditionTest, IndicatorAgainstIndicator) {
    const IndicatorCondition condition("SMA_5", ComparisonOp::GT, "SMA_25");
    const core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10, {{"SMA_5", 11.0}, {"SMA_25", 10.0}})};
    EXPECT_TRUE(condition.evaluate(HistoryView(bars, 1)));

    std::vector<std::string> names;
    condition.collectIndicatorNames(names);
    EXPECT_EQ(names, (std::vector<std::string>{"SMA_5", "SMA_25"}));
    EXPECT_THROW(IndicatorCondition("SMA_5", ComparisonOp::GT, std::string("SMA_5")), std::invalid_argument);
}

TEST(ConditionTest, CrossNeedsTheThresholdToBeCrossed) {
    const IndicatorCrossCondition above("MACD_histogram", CrossType::CrossesAbove, 0.0);

    const auto crossing = twoBars("MACD_histogram", -0.5, 0.2);
    EXPECT_TRUE(above.evaluate(HistoryView(crossing, 2)));
    EXPECT_FALSE(above.evaluate(HistoryView(crossing, 1)));

    const auto touching = twoBars("MACD_histogram", 0.0, 0.0);
    EXPECT_FALSE(above.evaluate(HistoryView(touching, 2)));

    const auto from_zero = twoBars("MACD_histogram", 0.0, 0.1);
    EXPECT_TRUE(above.evaluate(HistoryView(from_zero, 2)));

    const auto undefined_previous = twoBars("MACD_histogram", std::nullopt, 0.2);
    EXPECT_FALSE(above.evaluate(HistoryView(undefined_previous, 2)));

    const IndicatorCrossCondition below("MACD_histogram", CrossType::CrossesBelow, 0.0);
    const auto falling = twoBars("MACD_histogram", 0.3, -0.1);
    EXPECT_TRUE(below.evaluate(HistoryView(falling, 2)));
}

TEST(ConditionTest, PriceAgainstIndicator) {
    const PriceIndicatorCondition condition(PriceField::Close, ComparisonOp::LTE, "BB_lower");
    const core::TimeSeries<core::Bar> bars{
        makeBar(0, 100, 95, {{"BB_lower", 96.0}}),
        makeBar(1, 100, 97, {{"BB_lower", 96.0}}),
        makeBar(2, 100, 90, {{"BB_lower", std::nullopt}})};
    EXPECT_TRUE(condition.evaluate(HistoryView(bars, 1)));
    EXPECT_FALSE(condition.evaluate(HistoryView(bars, 2)));
    EXPECT_FALSE(condition.evaluate(HistoryView(bars, 3)));
}

TEST(ConditionTest, AndOrCombine) {
    const core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10, {{"RSI", 25.0}, {"SMA_5", 9.0}})};
    const HistoryView view(bars, 1);

    std::vector<std::unique_ptr<ICondition>> both;
    both.push_back(std::make_unique<IndicatorCondition>("RSI", ComparisonOp::LT, 30.0));
    both.push_back(std::make_unique<IndicatorCondition>("SMA_5", ComparisonOp::GT, 10.0));
    const AndCondition and_condition(std::move(both));
    EXPECT_FALSE(and_condition.evaluate(view));

    std::vector<std::unique_ptr<ICondition>> either;
    either.push_back(std::make_unique<IndicatorCondition>("RSI", ComparisonOp::LT, 30.0));
    either.push_back(std::make_unique<IndicatorCondition>("SMA_5", ComparisonOp::GT, 10.0));
    const OrCondition or_condition(std::move(either));
    EXPECT_TRUE(or_condition.evaluate(view));

    std::vector<std::string> names;
    or_condition.collectIndicatorNames(names);
    EXPECT_EQ(names.size(), 2u);

    EXPECT_THROW(AndCondition(std::vector<std::unique_ptr<ICondition>>{}), std::invalid_argument);
}

TEST(RuleTest, RejectsDegenerateRules) {
    EXPECT_THROW(makeRule("", 30.0, core::Action::buy()), std::invalid_argument);
    EXPECT_THROW(makeRule("hold", 30.0, core::Action::hold()), std::invalid_argument);
    EXPECT_THROW(makeRule("big", 30.0, core::Action::buy("", 1.5)), std::invalid_argument);
    EXPECT_THROW(Rule("null", nullptr, core::Action::buy()), std::invalid_argument);
}

TEST(RuleTest, ReasonDefaultsToTheRuleName) {
    const auto bars = twoBars("RSI", 50.0, 20.0);
    const auto rule = makeRule("oversold", 30.0, core::Action::buy());
    const core::Action action = rule->evaluate(HistoryView(bars, 2));
    EXPECT_EQ(action.type, core::ActionType::Buy);
    EXPECT_EQ(action.reason, "oversold");
    EXPECT_TRUE(rule->evaluate(HistoryView(bars, 1)).isHold());
}

TEST(RuleStrategyTest, FirstTriggeredEntryRuleWins) {
    std::vector<std::unique_ptr<IRule>> entry;
    entry.push_back(makeRule("first", 30.0, core::Action::buy("first", 0.5)));
    entry.push_back(makeRule("second", 40.0, core::Action::buy("second")));
    std::vector<std::unique_ptr<IRule>> exit;
    exit.push_back(makeRule("exit", 50.0, core::Action::sell("exit")));
    const RuleStrategy strategy("rules", std::move(entry), std::move(exit));

    const auto bars = twoBars("RSI", 50.0, 20.0);
    const HistoryView view(bars, 2);

    const core::Action entry_action = strategy.decide(view, flatState());
    EXPECT_EQ(entry_action.reason, "first");
    ASSERT_TRUE(entry_action.fraction.has_value());
    EXPECT_DOUBLE_EQ(*entry_action.fraction, 0.5);

    // Holding: only exit rules are consulted
    const core::Action exit_action = strategy.decide(view, holdingState());
    EXPECT_EQ(exit_action.type, core::ActionType::Sell);
    EXPECT_EQ(exit_action.reason, "exit");

    EXPECT_EQ(strategy.getRequiredIndicatorNames(), (std::vector<std::string>{"RSI"}));
}

TEST(RuleStrategyTest, NeedsAnEntryRule) {
    EXPECT_THROW(RuleStrategy("empty", {}, {}), std::invalid_argument);
}

TEST(BuiltinStrategyTest, MovingAverageCrossGatesOnPosition) {
    const MovingAverageCrossStrategy strategy("ma", "SMA_5", "SMA_25");
    const core::TimeSeries<core::Bar> up{
        makeBar(0, 10, 10, {{"SMA_5", 9.0}, {"SMA_25", 10.0}}),
        makeBar(1, 10, 10, {{"SMA_5", 11.0}, {"SMA_25", 10.0}})};
    const HistoryView view(up, 2);

    const core::Action buy = strategy.decide(view, flatState());
    EXPECT_EQ(buy.type, core::ActionType::Buy);
    EXPECT_EQ(buy.reason, "golden cross");
    EXPECT_TRUE(strategy.decide(view, holdingState()).isHold());

    const core::TimeSeries<core::Bar> down{
        makeBar(0, 10, 10, {{"SMA_5", 11.0}, {"SMA_25", 10.0}}),
        makeBar(1, 10, 10, {{"SMA_5", 9.0}, {"SMA_25", 10.0}})};
    const core::Action sell = strategy.decide(HistoryView(down, 2), holdingState());
    EXPECT_EQ(sell.type, core::ActionType::Sell);
    EXPECT_EQ(sell.reason, "dead cross");

    EXPECT_EQ(strategy.getRequiredIndicatorNames(), (std::vector<std::string>{"SMA_5", "SMA_25"}));
}

TEST(BuiltinStrategyTest, RsiReversionThresholds) {
    const RsiReversionStrategy strategy;
    const core::TimeSeries<core::Bar> bars{
        makeBar(0, 10, 10, {{"RSI", 35.0}}),
        makeBar(1, 10, 10, {{"RSI", 50.0}}),
        makeBar(2, 10, 10, {{"RSI", 65.0}}),
        makeBar(3, 10, 10, {{"RSI", std::nullopt}})};

    EXPECT_EQ(strategy.decide(HistoryView(bars, 1), flatState()).type, core::ActionType::Buy);
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 2), flatState()).isHold());
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 3), flatState()).isHold());
    EXPECT_EQ(strategy.decide(HistoryView(bars, 3), holdingState()).type, core::ActionType::Sell);
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 4), flatState()).isHold());
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 4), holdingState()).isHold());

    EXPECT_EQ(strategy.getRequiredIndicatorNames(), (std::vector<std::string>{"RSI"}));
    EXPECT_THROW(RsiReversionStrategy("bad", 70.0, 30.0), std::invalid_argument);
}

TEST(BuiltinStrategyTest, BollingerBandTouches) {
    const BollingerBandStrategy strategy;
    const core::TimeSeries<core::Bar> bars{
        makeBar(0, 100, 90, {{"BB_lower", 91.0}, {"BB_upper", 110.0}}),
        makeBar(1, 100, 111, {{"BB_lower", 91.0}, {"BB_upper", 110.0}})};

    EXPECT_EQ(strategy.decide(HistoryView(bars, 1), flatState()).type, core::ActionType::Buy);
    EXPECT_EQ(strategy.decide(HistoryView(bars, 2), holdingState()).type, core::ActionType::Sell);
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 2), flatState()).isHold());
}

TEST(BuiltinStrategyTest, MacdHistogramZeroCross) {
    const MacdCrossStrategy strategy;
    const auto bars = twoBars("MACD_histogram", -0.2, 0.4);
    const core::Action action = strategy.decide(HistoryView(bars, 2), flatState());
    EXPECT_EQ(action.type, core::ActionType::Buy);
    EXPECT_EQ(action.reason, "MACD bullish cross");
}

TEST(CompositeStrategyTest, HigherScoreWinsWhenBothSidesQualify) {
    std::vector<CompositeStrategy::Component> components;
    components.push_back({std::make_unique<ConstantStrategy>("bull", core::Action::buy()), 0.6});
    components.push_back({std::make_unique<ConstantStrategy>("bear", core::Action::sell()), 0.4});
    const CompositeStrategy strategy("vote", std::move(components), 0.4, 0.4);

    const core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10)};
    const core::Action action = strategy.decide(HistoryView(bars, 1), flatState());
    EXPECT_EQ(action.type, core::ActionType::Buy);
    EXPECT_EQ(action.reason, "vote buy 0.60 (bull)");
}

TEST(CompositeStrategyTest, ExactTieHolds) {
    std::vector<CompositeStrategy::Component> components;
    components.push_back({std::make_unique<ConstantStrategy>("bull", core::Action::buy()), 0.5});
    components.push_back({std::make_unique<ConstantStrategy>("bear", core::Action::sell()), 0.5});
    const CompositeStrategy strategy("vote", std::move(components), 0.4, 0.4);

    const core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10)};
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 1), flatState()).isHold());
}

TEST(CompositeStrategyTest, ScoreBelowThresholdHolds) {
    std::vector<CompositeStrategy::Component> components;
    components.push_back({std::make_unique<ConstantStrategy>("bull", core::Action::buy()), 0.3});
    components.push_back({std::make_unique<ConstantStrategy>("idle", core::Action::hold()), 0.7});
    const CompositeStrategy strategy("vote", std::move(components), 0.4, 0.4);

    const core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10)};
    EXPECT_TRUE(strategy.decide(HistoryView(bars, 1), flatState()).isHold());
}

TEST(CompositeStrategyTest, ComboPresetCollectsEveryIndicator) {
    const auto combo = makeComboStrategy();
    EXPECT_EQ(combo->getName(), "combo");
    EXPECT_EQ(combo->componentCount(), 4u);
    const std::vector<std::string> expected{"RSI", "SMA_25", "SMA_75", "MACD_histogram", "BB_lower", "BB_upper"};
    EXPECT_EQ(combo->getRequiredIndicatorNames(), expected);
}

TEST(CompositeStrategyTest, RejectsBadWeightsAndThresholds) {
    std::vector<CompositeStrategy::Component> zero_weight;
    zero_weight.push_back({std::make_unique<ConstantStrategy>("bull", core::Action::buy()), 0.0});
    EXPECT_THROW(CompositeStrategy("vote", std::move(zero_weight), 0.4, 0.4), std::invalid_argument);

    std::vector<CompositeStrategy::Component> components;
    components.push_back({std::make_unique<ConstantStrategy>("bull", core::Action::buy()), 1.0});
    EXPECT_THROW(CompositeStrategy("vote", std::move(components), 0.0, 0.4), std::invalid_argument);
}
