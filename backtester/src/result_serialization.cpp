#include "result_serialization.hpp"
#include "utils.hpp"

namespace {

    using nlohmann::json;

    template<typename T>
    json optionalToJson(const std::optional<T>& value) {
        return value ? json(*value) : json(nullptr);
    }

} // anonymous namespace

namespace core {

    void to_json(nlohmann::json& j, const Action& action) {
        j = nlohmann::json{
            {"type", toString(action.type)},
            {"fraction", optionalToJson(action.fraction)},
            {"reason", action.reason}
        };
    }

    void to_json(nlohmann::json& j, const Trade& trade) {
        j = nlohmann::json{
            {"signal_index", trade.signal_index},
            {"signal_time", utils::timestampToString(trade.signal_time)},
            {"fill_index", trade.fill_index},
            {"fill_time", utils::timestampToString(trade.fill_time)},
            {"entry_index", trade.entry_index},
            {"side", toString(trade.side)},
            {"quantity", trade.quantity},
            {"price", trade.fill_price},
            {"cost", trade.cost},
            {"realized_pnl", optionalToJson(trade.realized_pnl)},
            {"holding_bars", optionalToJson(trade.holding_bars)},
            {"reason", trade.reason}
        };
    }

    void to_json(nlohmann::json& j, const RejectedAction& rejected) {
        j = nlohmann::json{
            {"bar_index", rejected.bar_index},
            {"timestamp", utils::timestampToString(rejected.timestamp)},
            {"action", rejected.action},
            {"reason", toString(rejected.reason)},
            {"message", rejected.message}
        };
    }

    void to_json(nlohmann::json& j, const TradeLog& trade_log) {
        j = nlohmann::json{
            {"trades", trade_log.trades},
            {"rejected", trade_log.rejected}
        };
    }

    void to_json(nlohmann::json& j, const EquityPoint& point) {
        j = nlohmann::json{
            {"timestamp", utils::timestampToString(point.timestamp)},
            {"cash", point.cash},
            {"position_quantity", point.position_quantity},
            {"position_value", point.position_value},
            {"equity", point.equity}
        };
    }

} // namespace core

namespace backtester {

    void to_json(nlohmann::json& j, const PerformanceReport& report) {
        j = nlohmann::json{
            {"initial_cash", report.initial_cash},
            {"final_equity", report.final_equity},
            {"total_pnl", report.total_pnl},
            {"total_return", report.total_return},
            {"annualized_return", optionalToJson(report.annualized_return)},
            {"periods", report.periods},
            {"max_drawdown", report.max_drawdown},
            {"max_drawdown_peak_index", optionalToJson(report.max_drawdown_peak_index)},
            {"max_drawdown_trough_index", report.max_drawdown_trough_index},
            {"max_drawdown_duration", report.max_drawdown_duration},
            {"volatility", optionalToJson(report.volatility)},
            {"sharpe_ratio", optionalToJson(report.sharpe_ratio)},
            {"sortino_ratio", optionalToJson(report.sortino_ratio)},
            {"calmar_ratio", optionalToJson(report.calmar_ratio)},
            {"var_95", optionalToJson(report.var_95)},
            {"cvar_95", optionalToJson(report.cvar_95)},
            {"total_executions", report.total_executions},
            {"closing_trades", report.closing_trades},
            {"winning_trades", report.winning_trades},
            {"losing_trades", report.losing_trades},
            {"win_rate", optionalToJson(report.win_rate)},
            {"avg_win", optionalToJson(report.avg_win)},
            {"avg_loss", optionalToJson(report.avg_loss)},
            {"profit_factor", optionalToJson(report.profit_factor)},
            {"payoff_ratio", optionalToJson(report.payoff_ratio)},
            {"expectancy", optionalToJson(report.expectancy)},
            {"expectancy_pct", optionalToJson(report.expectancy_pct)},
            {"best_trade", optionalToJson(report.best_trade)},
            {"worst_trade", optionalToJson(report.worst_trade)},
            {"max_consecutive_wins", report.max_consecutive_wins},
            {"max_consecutive_losses", report.max_consecutive_losses},
            {"avg_holding_bars", optionalToJson(report.avg_holding_bars)},
            {"median_holding_bars", optionalToJson(report.median_holding_bars)},
            {"holding_bars_std", optionalToJson(report.holding_bars_std)},
            {"min_holding_bars", optionalToJson(report.min_holding_bars)},
            {"max_holding_bars", optionalToJson(report.max_holding_bars)},
            {"rejected_actions", report.rejected_actions},
            {"total_months", report.total_months},
            {"winning_months", report.winning_months},
            {"monthly_win_rate", optionalToJson(report.monthly_win_rate)},
            {"avg_monthly_pnl", optionalToJson(report.avg_monthly_pnl)},
            {"best_month", optionalToJson(report.best_month)},
            {"worst_month", optionalToJson(report.worst_month)},
            {"monthly_volatility", optionalToJson(report.monthly_volatility)},
            {"buy_and_hold_return", optionalToJson(report.buy_and_hold_return)},
            {"alpha", optionalToJson(report.alpha)},
            {"beta", optionalToJson(report.beta)},
            {"information_ratio", optionalToJson(report.information_ratio)}
        };
    }

    void to_json(nlohmann::json& j, const BacktestResult& result) {
        j = nlohmann::json{
            {"strategy_name", result.strategy_name},
            {"config", result.config.toJson()},
            {"bar_count", result.bar_count},
            {"final_cash", result.final_cash},
            {"final_position", result.final_position},
            {"trade_log", result.trade_log},
            {"equity_curve", result.equity_curve}
        };
    }

    void to_json(nlohmann::json& j, const BatchEntry& entry) {
        j = nlohmann::json{{"strategy_name", entry.strategy_name}};
        if (entry.succeeded()) {
            j["result"] = *entry.result;
            j["report"] = *entry.report;
        } else {
            j["error"] = entry.error;
        }
    }

} // namespace backtester
