#include "backtester.hpp"
#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <utility>

namespace backtester {

    constexpr double kMaxOrderShares = 1e15;

    // Decision taken on signal_index, waiting for the next bar to fill
    struct PendingOrder {
        core::Action action;
        std::size_t signal_index = 0;
        core::Timestamp signal_time;
        long long sell_quantity = 0; // Sized at decision time, the position cannot change before the fill
    };

    struct RunContext {
        explicit RunContext(double initial_cash) : portfolio(initial_cash) {}

        Portfolio portfolio;
        core::TradeLog trade_log;
        core::EquityCurve equity_curve;
        std::optional<PendingOrder> pending;

        void reject(std::size_t bar_index, core::Timestamp timestamp, const core::Action& action,
                    core::RejectionReason reason, std::string message) {
            core::logging::getLogger()->warn("Rejected {} from bar {} ({}): {}",
                                             core::toString(action.type), bar_index,
                                             core::toString(reason), message);
            core::RejectedAction rejected;
            rejected.bar_index = bar_index;
            rejected.timestamp = timestamp;
            rejected.action = action;
            rejected.reason = reason;
            rejected.message = std::move(message);
            trade_log.rejected.push_back(std::move(rejected));
        }
    };

    Backtester::Backtester(BacktestConfig config)
        : config_(std::move(config))
    {
        config_.validate();
        core::logging::getLogger()->debug("Backtester initialized: cash {:.2f}, costs {}, fill {}, sizing {}",
                                          config_.initial_cash, toString(config_.cost_model),
                                          toString(config_.fill_policy), toString(config_.sizing_policy));
    }

    void Backtester::validateBars(const core::TimeSeries<core::Bar>& bars,
                                  const std::vector<std::string>& required_indicators) {
        if (bars.empty()) {
            throw core::DataIntegrityException("Bar sequence is empty.");
        }

        for (std::size_t i = 0; i < bars.size(); ++i) {
            const core::Bar& bar = bars[i];
            if (i > 0 && !(bars[i - 1].timestamp < bar.timestamp)) {
                throw core::DataIntegrityException(fmt::format(
                    "Timestamps must be strictly increasing: bar {} ({}) does not follow bar {} ({}).",
                    i, core::utils::timestampToString(bar.timestamp),
                    i - 1, core::utils::timestampToString(bars[i - 1].timestamp)));
            }
            if (!std::isfinite(bar.open) || bar.open <= 0.0 || !std::isfinite(bar.close) || bar.close <= 0.0) {
                throw core::DataIntegrityException(fmt::format(
                    "Bar {} ({}) has an unusable price: open {}, close {}.",
                    i, core::utils::timestampToString(bar.timestamp), bar.open, bar.close));
            }
            for (const auto& name : required_indicators) {
                if (!bar.hasIndicator(name)) {
                    throw core::ConfigurationException(fmt::format(
                        "Required indicator '{}' is missing from bar {} ({}).",
                        name, i, core::utils::timestampToString(bar.timestamp)));
                }
            }
        }
    }

    long long Backtester::buyQuantity(double cash, double price, const std::optional<double>& fraction) const {
        if (!fraction && config_.sizing_policy == SizingPolicy::FixedQuantity) {
            return config_.fixed_quantity;
        }

        double budget = cash;
        if (fraction) {
            budget = *fraction * cash;
        } else if (config_.sizing_policy == SizingPolicy::FixedFraction) {
            budget = config_.sizing_fraction * cash;
        }

        const double fee = config_.transactionCost(0.0);
        const double per_share = price + config_.transactionCost(price) - fee;
        if (budget <= fee || per_share <= 0.0) {
            return 0;
        }

        // Beyond 2^53 doubles stop counting whole shares; the cap also keeps the cast defined
        const double estimate = std::min(std::floor((budget - fee) / per_share), kMaxOrderShares);
        long long quantity = static_cast<long long>(estimate);
        // Rounding can leave the estimate one share over budget
        while (quantity > 0) {
            const double notional = static_cast<double>(quantity) * price;
            if (notional + config_.transactionCost(notional) <= budget) break;
            --quantity;
        }
        return quantity;
    }

    void Backtester::handleDecision(RunContext& ctx, const core::Action& action,
                                    const core::TimeSeries<core::Bar>& bars, std::size_t index) const {
        const core::Bar& bar = bars[index];
        const long long position = ctx.portfolio.getPositionQuantity();

        if (action.type == core::ActionType::Sell && position == 0) {
            ctx.reject(index, bar.timestamp, action, core::RejectionReason::NoPosition,
                       "sell requested with no open position");
            return;
        }
        if (action.fraction && (!std::isfinite(*action.fraction) || *action.fraction <= 0.0 || *action.fraction > 1.0)) {
            ctx.reject(index, bar.timestamp, action, core::RejectionReason::InvalidFraction,
                       fmt::format("fraction {} is outside (0, 1]", *action.fraction));
            return;
        }

        long long sell_quantity = 0;
        if (action.type == core::ActionType::Sell) {
            sell_quantity = action.fraction
                ? static_cast<long long>(std::floor(static_cast<double>(position) * *action.fraction))
                : position;
            if (sell_quantity <= 0) {
                ctx.reject(index, bar.timestamp, action, core::RejectionReason::ZeroQuantity,
                           fmt::format("fraction {} of {} shares rounds down to zero", *action.fraction, position));
                return;
            }
        }

        if (index + 1 >= bars.size()) {
            ctx.reject(index, bar.timestamp, action, core::RejectionReason::NoFillBar,
                       "decision on the final bar has no bar to fill on");
            return;
        }

        PendingOrder order;
        order.action = action;
        order.signal_index = index;
        order.signal_time = bar.timestamp;
        order.sell_quantity = sell_quantity;
        ctx.pending = std::move(order);
        core::logging::getLogger()->trace("Queued {} from bar {} for the next bar.", core::toString(action.type), index);
    }

    void Backtester::executePending(RunContext& ctx, const core::Bar& bar, std::size_t index) const {
        const double price = config_.fill_policy == FillPolicy::NextOpen ? bar.open : bar.close;
        if (ctx.pending->action.type == core::ActionType::Buy) {
            executeBuy(ctx, bar, index, price);
        } else {
            executeSell(ctx, bar, index, price);
        }
        ctx.pending.reset();
    }

    void Backtester::executeBuy(RunContext& ctx, const core::Bar& bar, std::size_t index, double price) const {
        const PendingOrder& order = *ctx.pending;
        const double cash = ctx.portfolio.getCash();
        const long long quantity = buyQuantity(cash, price, order.action.fraction);

        const double notional = static_cast<double>(quantity) * price;
        const double cost = config_.transactionCost(notional);
        if (quantity <= 0 || notional + cost > cash) {
            ctx.reject(order.signal_index, order.signal_time, order.action, core::RejectionReason::InsufficientCash,
                       fmt::format("cash {:.2f} cannot buy {} share(s) at {:.4f} on {}",
                                   cash, quantity > 0 ? quantity : 1, price,
                                   core::utils::timestampToString(bar.timestamp)));
            return;
        }

        core::Trade trade = ctx.portfolio.buy(quantity, price, cost, index, bar.timestamp);
        trade.signal_index = order.signal_index;
        trade.signal_time = order.signal_time;
        trade.reason = order.action.reason;
        ctx.trade_log.trades.push_back(std::move(trade));
    }

    void Backtester::executeSell(RunContext& ctx, const core::Bar& bar, std::size_t index, double price) const {
        const PendingOrder& order = *ctx.pending;
        const double notional = static_cast<double>(order.sell_quantity) * price;
        const double cost = config_.transactionCost(notional);
        if (ctx.portfolio.getCash() + notional - cost < 0.0) {
            ctx.reject(order.signal_index, order.signal_time, order.action, core::RejectionReason::InsufficientCash,
                       fmt::format("selling {} share(s) at {:.4f} does not cover the cost {:.2f}",
                                   order.sell_quantity, price, cost));
            return;
        }

        core::Trade trade = ctx.portfolio.sell(order.sell_quantity, price, cost, index, bar.timestamp);
        trade.signal_index = order.signal_index;
        trade.signal_time = order.signal_time;
        trade.reason = order.action.reason;
        ctx.trade_log.trades.push_back(std::move(trade));
    }

    void Backtester::closeAtEnd(RunContext& ctx, const core::Bar& bar, std::size_t index) const {
        const long long quantity = ctx.portfolio.getPositionQuantity();
        const double notional = static_cast<double>(quantity) * bar.close;
        const double cost = config_.transactionCost(notional);
        const core::Action action = core::Action::sell("close at end");
        if (ctx.portfolio.getCash() + notional - cost < 0.0) {
            ctx.reject(index, bar.timestamp, action, core::RejectionReason::InsufficientCash,
                       "closing the position does not cover its cost");
            return;
        }

        core::Trade trade = ctx.portfolio.sell(quantity, bar.close, cost, index, bar.timestamp);
        trade.signal_index = index;
        trade.signal_time = bar.timestamp;
        trade.reason = action.reason;
        ctx.trade_log.trades.push_back(std::move(trade));
    }

    BacktestResult Backtester::run(const core::TimeSeries<core::Bar>& bars,
                                   const strategy_engine::IStrategy& strategy) const {
        auto logger = core::logging::getLogger();
        const std::string strategy_name = strategy.getName();

        validateBars(bars, strategy.getRequiredIndicatorNames());

        logger->info("Starting backtest of '{}' over {} bars ({} to {}).", strategy_name, bars.size(),
                     core::utils::timestampToString(bars.front().timestamp),
                     core::utils::timestampToString(bars.back().timestamp));

        RunContext ctx(config_.initial_cash);
        ctx.equity_curve.reserve(bars.size());
        const std::size_t last_index = bars.size() - 1;

        // --- Main Event Loop ---
        for (std::size_t i = 0; i < bars.size(); ++i) {
            const core::Bar& bar = bars[i];

            // 1. Fill yesterday's decision
            if (ctx.pending) {
                executePending(ctx, bar, i);
            }

            // 2. Decide on the causal view (bars 0..i)
            strategy_engine::HistoryView history(bars, i + 1);
            core::Action action = strategy.decide(history, ctx.portfolio.getState());
            logger->trace("Bar {} ({}): {} {}", i, core::utils::timestampToString(bar.timestamp),
                          core::toString(action.type), action.reason);

            if (!action.isHold()) {
                handleDecision(ctx, action, bars, i);
            }

            // 3. Optional liquidation on the final bar
            if (i == last_index && config_.close_at_end && ctx.portfolio.getPositionQuantity() > 0) {
                closeAtEnd(ctx, bar, i);
            }

            // 4. Mark to market at the close
            ctx.equity_curve.push_back(ctx.portfolio.markToMarket(bar.timestamp, bar.close));
        }

        BacktestResult result;
        result.strategy_name = strategy_name;
        result.config = config_;
        result.trade_log = std::move(ctx.trade_log);
        result.equity_curve = std::move(ctx.equity_curve);
        result.final_cash = ctx.portfolio.getCash();
        result.final_position = ctx.portfolio.getPositionQuantity();
        result.bar_count = bars.size();

        logger->info("Backtest of '{}' finished: {} trade(s), {} rejected, final equity {:.2f}.",
                     strategy_name, result.trade_log.trades.size(), result.trade_log.rejected.size(),
                     result.equity_curve.back().equity);
        return result;
    }

} // namespace backtester
