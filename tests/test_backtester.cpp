#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <memory>

#include "backtester.hpp"
#include "batch_runner.hpp"
#include "builtin_strategies.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using namespace backtester;
using test_helpers::makeBar;
using test_helpers::makeBars;
using test_helpers::ScriptedStrategy;

namespace {

    // Ten bars where SMA_2 crosses above SMA_4 on bar 4 and back below on bar 8
    core::TimeSeries<core::Bar> crossoverBars() {
        const std::vector<double> closes{10, 10, 10, 10, 11, 12, 13, 12, 10, 9};
        const std::vector<core::IndicatorValue> fast{std::nullopt, 10, 10, 10, 10.5, 11.5, 12.5, 12.5, 11, 9.5};
        const std::vector<core::IndicatorValue> slow{std::nullopt, std::nullopt, std::nullopt, 10, 10.25,
                                                     10.75, 11.5, 12, 11.75, 11};
        core::TimeSeries<core::Bar> bars = makeBars(closes);
        for (std::size_t i = 0; i < bars.size(); ++i) {
            bars[i].indicators["SMA_2"] = fast[i];
            bars[i].indicators["SMA_4"] = slow[i];
        }
        return bars;
    }

    BacktestConfig allInConfig(double cash) {
        BacktestConfig config;
        config.initial_cash = cash;
        config.sizing_policy = SizingPolicy::AllIn;
        return config;
    }

    void expectEquityIdentity(const BacktestResult& result, const core::TimeSeries<core::Bar>& bars) {
        ASSERT_EQ(result.equity_curve.size(), bars.size());
        for (std::size_t i = 0; i < bars.size(); ++i) {
            const core::EquityPoint& point = result.equity_curve[i];
            EXPECT_EQ(point.timestamp, bars[i].timestamp);
            EXPECT_GE(point.cash, 0.0);
            EXPECT_GE(point.position_quantity, 0);
            EXPECT_DOUBLE_EQ(point.position_value, static_cast<double>(point.position_quantity) * bars[i].close);
            EXPECT_DOUBLE_EQ(point.equity, point.cash + point.position_value);
        }
    }

} // namespace

TEST(BacktesterTest, MovingAverageCrossTradesOnceEachWay) {
    const auto bars = crossoverBars();
    BacktestConfig config;
    config.initial_cash = 1000000.0;
    const Backtester engine(config);
    const strategy_engine::MovingAverageCrossStrategy strategy("ma", "SMA_2", "SMA_4");

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 2u);
    EXPECT_TRUE(result.trade_log.rejected.empty());

    const core::Trade& buy = result.trade_log.trades[0];
    EXPECT_EQ(buy.side, core::TradeSide::Buy);
    EXPECT_EQ(buy.signal_index, 4u);
    EXPECT_EQ(buy.fill_index, 5u);
    EXPECT_DOUBLE_EQ(buy.fill_price, bars[5].open);
    EXPECT_EQ(buy.quantity, 86363); // floor(0.95 * 1,000,000 / 11)
    EXPECT_EQ(buy.reason, "golden cross");
    EXPECT_FALSE(buy.realized_pnl.has_value());

    const core::Trade& sell = result.trade_log.trades[1];
    EXPECT_EQ(sell.side, core::TradeSide::Sell);
    EXPECT_EQ(sell.signal_index, 8u);
    EXPECT_EQ(sell.fill_index, 9u);
    EXPECT_DOUBLE_EQ(sell.fill_price, bars[9].open);
    EXPECT_EQ(sell.quantity, buy.quantity);
    EXPECT_EQ(sell.entry_index, 5u);
    ASSERT_TRUE(sell.holding_bars.has_value());
    EXPECT_EQ(*sell.holding_bars, 4u);
    ASSERT_TRUE(sell.realized_pnl.has_value());
    EXPECT_DOUBLE_EQ(*sell.realized_pnl, (sell.fill_price - buy.fill_price) * static_cast<double>(sell.quantity));

    EXPECT_EQ(result.final_position, 0);
    EXPECT_DOUBLE_EQ(result.final_cash, 1000000.0 + *sell.realized_pnl);
    expectEquityIdentity(result, bars);
}

TEST(BacktesterTest, RealizedPnlIncludesBothCosts) {
    const auto bars = crossoverBars();
    BacktestConfig config;
    config.cost_model = CostModel::Both;
    config.fixed_fee = 5.0;
    config.proportional_rate = 0.001;
    const Backtester engine(config);
    const strategy_engine::MovingAverageCrossStrategy strategy("ma", "SMA_2", "SMA_4");

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 2u);
    const core::Trade& buy = result.trade_log.trades[0];
    const core::Trade& sell = result.trade_log.trades[1];
    EXPECT_NEAR(buy.cost, 5.0 + 0.001 * buy.fill_price * static_cast<double>(buy.quantity), 1e-6);
    EXPECT_NEAR(sell.cost, 5.0 + 0.001 * sell.fill_price * static_cast<double>(sell.quantity), 1e-6);
    // The buy budget covers the cost as well
    EXPECT_LE(buy.fill_price * static_cast<double>(buy.quantity) + buy.cost, 0.95 * config.initial_cash + 1e-6);
    ASSERT_TRUE(sell.realized_pnl.has_value());
    EXPECT_NEAR(*sell.realized_pnl,
                (sell.fill_price - buy.fill_price) * static_cast<double>(sell.quantity) - buy.cost - sell.cost,
                1e-6);
    EXPECT_NEAR(result.final_cash, config.initial_cash + *sell.realized_pnl, 1e-6);
    expectEquityIdentity(result, bars);
}

TEST(BacktesterTest, SellWhileFlatIsRejectedNotTraded) {
    const auto bars = makeBars({100, 101, 102, 103, 104});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{2, core::Action::sell("exit")}});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    const core::RejectedAction& rejected = result.trade_log.rejected[0];
    EXPECT_EQ(rejected.reason, core::RejectionReason::NoPosition);
    EXPECT_EQ(rejected.bar_index, 2u);
    EXPECT_EQ(rejected.timestamp, bars[2].timestamp);
    EXPECT_EQ(rejected.action.type, core::ActionType::Sell);
    for (const auto& point : result.equity_curve) {
        EXPECT_DOUBLE_EQ(point.equity, 1000.0);
    }
}

TEST(BacktesterTest, AllHoldKeepsEquityAtInitialCash) {
    const auto bars = makeBars({50, 55, 45, 60});
    const Backtester engine(allInConfig(2500.0));
    const ScriptedStrategy strategy({});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    EXPECT_TRUE(result.trade_log.rejected.empty());
    ASSERT_EQ(result.equity_curve.size(), bars.size());
    for (const auto& point : result.equity_curve) {
        EXPECT_DOUBLE_EQ(point.equity, 2500.0);
        EXPECT_EQ(point.position_quantity, 0);
    }
    EXPECT_EQ(result.bar_count, bars.size());
}

TEST(BacktesterTest, IdenticalInputsGiveIdenticalResults) {
    const auto bars = crossoverBars();
    const Backtester engine{BacktestConfig{}};
    const strategy_engine::MovingAverageCrossStrategy strategy("ma", "SMA_2", "SMA_4");

    const BacktestResult first = engine.run(bars, strategy);
    const BacktestResult second = engine.run(bars, strategy);

    ASSERT_EQ(first.trade_log.trades.size(), second.trade_log.trades.size());
    for (std::size_t i = 0; i < first.trade_log.trades.size(); ++i) {
        EXPECT_EQ(first.trade_log.trades[i].fill_index, second.trade_log.trades[i].fill_index);
        EXPECT_EQ(first.trade_log.trades[i].quantity, second.trade_log.trades[i].quantity);
        EXPECT_EQ(first.trade_log.trades[i].fill_price, second.trade_log.trades[i].fill_price);
    }
    ASSERT_EQ(first.equity_curve.size(), second.equity_curve.size());
    for (std::size_t i = 0; i < first.equity_curve.size(); ++i) {
        EXPECT_EQ(first.equity_curve[i].equity, second.equity_curve[i].equity);
    }
}

TEST(BacktesterTest, TruncatingFutureBarsDoesNotChangeThePast) {
    const auto bars = crossoverBars();
    const Backtester engine{BacktestConfig{}};
    const strategy_engine::MovingAverageCrossStrategy strategy("ma", "SMA_2", "SMA_4");
    const BacktestResult full = engine.run(bars, strategy);

    for (std::size_t k = 1; k <= bars.size(); ++k) {
        const core::TimeSeries<core::Bar> prefix(bars.begin(), bars.begin() + static_cast<std::ptrdiff_t>(k));
        const BacktestResult truncated = engine.run(prefix, strategy);

        ASSERT_EQ(truncated.equity_curve.size(), k);
        for (std::size_t i = 0; i < k; ++i) {
            EXPECT_DOUBLE_EQ(truncated.equity_curve[i].equity, full.equity_curve[i].equity) << "k=" << k << " i=" << i;
        }
        std::size_t filled_in_prefix = 0;
        for (const auto& trade : full.trade_log.trades) {
            if (trade.fill_index < k) filled_in_prefix++;
        }
        EXPECT_EQ(truncated.trade_log.trades.size(), filled_in_prefix) << "k=" << k;
    }
}

TEST(BacktesterTest, DecisionOnFinalBarIsRejected) {
    const auto bars = makeBars({10, 11, 12});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{2, core::Action::buy("late")}});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    EXPECT_EQ(result.trade_log.rejected[0].reason, core::RejectionReason::NoFillBar);
    EXPECT_EQ(result.trade_log.rejected[0].bar_index, 2u);
}

TEST(BacktesterTest, SameClosePolicyFillsAtTheNextBarsClose) {
    auto bars = makeBars({10, 20, 30});
    BacktestConfig config = allInConfig(1000.0);
    config.fill_policy = FillPolicy::SameClose;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    const core::Trade& buy = result.trade_log.trades[0];
    EXPECT_EQ(buy.signal_index, 0u);
    EXPECT_EQ(buy.fill_index, 1u);
    EXPECT_DOUBLE_EQ(buy.fill_price, bars[1].close);
    EXPECT_EQ(buy.quantity, 50);
    expectEquityIdentity(result, bars);
}

TEST(BacktesterTest, NextOpenPolicyFillsAtTheNextBarsOpen) {
    core::TimeSeries<core::Bar> bars{makeBar(0, 10, 10), makeBar(1, 25, 20), makeBar(2, 20, 30)};
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(result.trade_log.trades[0].fill_price, 25.0);
    EXPECT_EQ(result.trade_log.trades[0].quantity, 40);
}

TEST(BacktesterTest, CloseAtEndLiquidatesOnTheFinalClose) {
    const auto bars = makeBars({10, 10, 12, 15});
    BacktestConfig config = allInConfig(1000.0);
    config.close_at_end = true;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 2u);
    const core::Trade& exit = result.trade_log.trades[1];
    EXPECT_EQ(exit.side, core::TradeSide::Sell);
    EXPECT_EQ(exit.reason, "close at end");
    EXPECT_EQ(exit.fill_index, 3u);
    EXPECT_DOUBLE_EQ(exit.fill_price, 15.0);
    EXPECT_EQ(exit.quantity, 100);
    EXPECT_EQ(result.final_position, 0);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().equity, 1500.0);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().cash, 1500.0);
}

TEST(BacktesterTest, OpenPositionIsMarkedToMarketWithoutCloseAtEnd) {
    const auto bars = makeBars({10, 10, 12, 15});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_EQ(result.final_position, 100);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().position_value, 1500.0);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().equity, 1500.0);
    expectEquityIdentity(result, bars);
}

TEST(BacktesterTest, FixedFeeReducesTheShareCount) {
    const auto bars = makeBars({100, 100, 100});
    BacktestConfig config = allInConfig(1000.0);
    config.cost_model = CostModel::FixedFee;
    config.fixed_fee = 10.0;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_EQ(result.trade_log.trades[0].quantity, 9);
    EXPECT_DOUBLE_EQ(result.trade_log.trades[0].cost, 10.0);
    EXPECT_DOUBLE_EQ(result.final_cash, 90.0);
}

TEST(BacktesterTest, ActionFractionOverridesTheSizingPolicy) {
    const auto bars = makeBars({100, 100, 100});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{0, core::Action::buy("half", 0.5)}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_EQ(result.trade_log.trades[0].quantity, 5);
}

TEST(BacktesterTest, FixedQuantitySizing) {
    const auto bars = makeBars({100, 100, 100});
    BacktestConfig config;
    config.initial_cash = 1000.0;
    config.sizing_policy = SizingPolicy::FixedQuantity;
    config.fixed_quantity = 3;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_EQ(result.trade_log.trades[0].quantity, 3);
    EXPECT_DOUBLE_EQ(result.final_cash, 700.0);
}

TEST(BacktesterTest, UnaffordableBuyIsRejectedAsInsufficientCash) {
    const auto bars = makeBars({100, 100, 100});
    BacktestConfig config;
    config.initial_cash = 1000.0;
    config.sizing_policy = SizingPolicy::FixedQuantity;
    config.fixed_quantity = 11;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    EXPECT_EQ(result.trade_log.rejected[0].reason, core::RejectionReason::InsufficientCash);
    EXPECT_EQ(result.trade_log.rejected[0].bar_index, 0u);
    EXPECT_DOUBLE_EQ(result.final_cash, 1000.0);
}

TEST(BacktesterTest, BuyThatCannotAffordOneShareIsRejected) {
    const auto bars = makeBars({5000, 5000, 5000});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    EXPECT_EQ(result.trade_log.rejected[0].reason, core::RejectionReason::InsufficientCash);
}

TEST(BacktesterTest, ShareCountIsCappedAtNearZeroPrices) {
    const auto bars = makeBars({1e-12, 1e-12, 1e-12});
    const Backtester engine(allInConfig(1e6));
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    EXPECT_EQ(result.trade_log.trades[0].quantity, 1000000000000000LL);
    EXPECT_TRUE(result.trade_log.rejected.empty());
    EXPECT_GE(result.equity_curve.back().cash, 0.0);
}

TEST(BacktesterTest, PartialSellRoundsDown) {
    const auto bars = makeBars({100, 100, 100, 100, 100});
    BacktestConfig config;
    config.initial_cash = 1000.0;
    config.sizing_policy = SizingPolicy::FixedQuantity;
    config.fixed_quantity = 9;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}, {1, core::Action::sell("trim", 0.5)}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 2u);
    EXPECT_EQ(result.trade_log.trades[1].quantity, 4);
    EXPECT_EQ(result.final_position, 5);
}

TEST(BacktesterTest, SellFractionRoundingToZeroIsRejected) {
    const auto bars = makeBars({100, 100, 100, 100});
    BacktestConfig config;
    config.initial_cash = 1000.0;
    config.sizing_policy = SizingPolicy::FixedQuantity;
    config.fixed_quantity = 5;
    const Backtester engine(config);
    const ScriptedStrategy strategy({{0, core::Action::buy("in")}, {1, core::Action::sell("trim", 0.1)}});

    const BacktestResult result = engine.run(bars, strategy);

    ASSERT_EQ(result.trade_log.trades.size(), 1u);
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    EXPECT_EQ(result.trade_log.rejected[0].reason, core::RejectionReason::ZeroQuantity);
    EXPECT_EQ(result.final_position, 5);
}

TEST(BacktesterTest, FractionOutsideUnitIntervalIsRejected) {
    const auto bars = makeBars({100, 100, 100});
    const Backtester engine(allInConfig(1000.0));
    const ScriptedStrategy strategy({{0, core::Action::buy("greedy", 1.5)}});

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    ASSERT_EQ(result.trade_log.rejected.size(), 1u);
    EXPECT_EQ(result.trade_log.rejected[0].reason, core::RejectionReason::InvalidFraction);
}

TEST(BacktesterTest, InvalidConfigIsRejectedAtConstruction) {
    BacktestConfig config;
    config.initial_cash = 0.0;
    EXPECT_THROW(Backtester{config}, core::ConfigurationException);

    config.initial_cash = 1000.0;
    config.sizing_fraction = 1.5;
    EXPECT_THROW(Backtester{config}, core::ConfigurationException);
}

TEST(BacktesterTest, EmptyBarSequenceIsADataError) {
    const Backtester engine{BacktestConfig{}};
    const ScriptedStrategy strategy({});
    EXPECT_THROW(engine.run({}, strategy), core::DataIntegrityException);
}

TEST(BacktesterTest, NonIncreasingTimestampsAreADataError) {
    auto bars = makeBars({10, 11, 12});
    bars[2].timestamp = bars[1].timestamp;
    const Backtester engine{BacktestConfig{}};
    const ScriptedStrategy strategy({});
    EXPECT_THROW(engine.run(bars, strategy), core::DataIntegrityException);
}

TEST(BacktesterTest, NonPositivePriceIsADataError) {
    auto bars = makeBars({10, 11, 12});
    bars[1].close = 0.0;
    const Backtester engine{BacktestConfig{}};
    const ScriptedStrategy strategy({});
    EXPECT_THROW(engine.run(bars, strategy), core::DataIntegrityException);

    bars[1].close = std::nan("");
    EXPECT_THROW(engine.run(bars, strategy), core::DataIntegrityException);
}

TEST(BacktesterTest, MissingRequiredIndicatorIsAConfigurationError) {
    const auto bars = makeBars({10, 11, 12});
    const Backtester engine{BacktestConfig{}};
    const strategy_engine::RsiReversionStrategy strategy;
    EXPECT_THROW(engine.run(bars, strategy), core::ConfigurationException);
}

TEST(BacktesterTest, UndefinedIndicatorsOnlyYieldHold) {
    auto bars = makeBars({10, 11, 12, 13});
    for (auto& bar : bars) {
        bar.indicators["RSI"] = std::nullopt;
    }
    const Backtester engine{BacktestConfig{}};
    const strategy_engine::RsiReversionStrategy strategy;

    const BacktestResult result = engine.run(bars, strategy);

    EXPECT_TRUE(result.trade_log.trades.empty());
    EXPECT_TRUE(result.trade_log.rejected.empty());
}

TEST(BatchRunnerTest, FailedRunDoesNotStopTheOthers) {
    const auto bars = crossoverBars();
    const Backtester engine{BacktestConfig{}};

    std::vector<std::unique_ptr<strategy_engine::IStrategy>> strategies;
    strategies.push_back(std::make_unique<strategy_engine::MovingAverageCrossStrategy>("ma", "SMA_2", "SMA_4"));
    strategies.push_back(std::make_unique<strategy_engine::RsiReversionStrategy>("rsi"));
    strategies.push_back(std::make_unique<ScriptedStrategy>(std::map<std::size_t, core::Action>{}, "idle"));

    const std::vector<BatchEntry> entries = BatchRunner::compare(engine, bars, strategies);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].strategy_name, "ma");
    EXPECT_TRUE(entries[0].succeeded());
    ASSERT_TRUE(entries[0].report.has_value());
    EXPECT_EQ(entries[0].report->closing_trades, 1);
    ASSERT_TRUE(entries[0].report->buy_and_hold_return.has_value());
    EXPECT_DOUBLE_EQ(*entries[0].report->buy_and_hold_return, 9.0 / 10.0 - 1.0);

    EXPECT_EQ(entries[1].strategy_name, "rsi");
    EXPECT_FALSE(entries[1].succeeded());
    EXPECT_FALSE(entries[1].error.empty());

    EXPECT_TRUE(entries[2].succeeded());
    EXPECT_DOUBLE_EQ(entries[2].result->equity_curve.back().equity, engine.getConfig().initial_cash);
}

TEST(BatchRunnerTest, ConcurrentRunsMatchSequentialRuns) {
    const auto bars = crossoverBars();
    const Backtester engine{BacktestConfig{}};

    std::vector<std::unique_ptr<strategy_engine::IStrategy>> strategies;
    for (int i = 0; i < 4; ++i) {
        strategies.push_back(std::make_unique<strategy_engine::MovingAverageCrossStrategy>(
            "ma_" + std::to_string(i), "SMA_2", "SMA_4"));
    }
    const BacktestResult sequential = engine.run(bars, *strategies.front());

    const std::vector<BatchEntry> entries = BatchRunner::compare(engine, bars, strategies);

    ASSERT_EQ(entries.size(), strategies.size());
    for (const auto& entry : entries) {
        ASSERT_TRUE(entry.succeeded());
        ASSERT_EQ(entry.result->equity_curve.size(), sequential.equity_curve.size());
        EXPECT_DOUBLE_EQ(entry.result->final_cash, sequential.final_cash);
        EXPECT_EQ(entry.result->trade_log.trades.size(), sequential.trade_log.trades.size());
    }
}
