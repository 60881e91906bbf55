#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "datatypes.hpp"
#include "backtester.hpp"

namespace backtester {

    // A metric without a value is undefined (zero or empty denominator)
    using Metric = std::optional<double>;

    // --- Performance Report ---
    // Fractions, not percentages (0.05 == 5%). Read-only once produced.
    struct PerformanceReport {
        double initial_cash = 0.0;
        double final_equity = 0.0;
        double total_pnl = 0.0;
        double total_return = 0.0;
        Metric annualized_return;
        std::size_t periods = 0; // Number of per-bar returns

        // Drawdown
        double max_drawdown = 0.0;
        std::optional<std::size_t> max_drawdown_peak_index; // Empty when the peak is the initial cash, before bar 0
        std::size_t max_drawdown_trough_index = 0;
        std::size_t max_drawdown_duration = 0; // Longest stretch of bars below a prior peak

        // Risk
        Metric volatility;   // Annualized
        Metric sharpe_ratio;
        Metric sortino_ratio;
        Metric calmar_ratio;
        Metric var_95;       // 5th percentile of per-bar returns
        Metric cvar_95;      // Mean of the returns at or below var_95

        // Trades
        int total_executions = 0;
        int closing_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        Metric win_rate;
        Metric avg_win;
        Metric avg_loss;       // Negative number
        Metric profit_factor;  // Gross profit / gross loss
        Metric payoff_ratio;   // avg_win / |avg_loss|
        Metric expectancy;     // Mean realized P&L per closing trade
        Metric expectancy_pct; // expectancy / initial_cash
        Metric best_trade;
        Metric worst_trade;
        int max_consecutive_wins = 0;
        int max_consecutive_losses = 0;
        Metric avg_holding_bars;
        Metric median_holding_bars;
        Metric holding_bars_std;
        Metric min_holding_bars;
        Metric max_holding_bars;
        int rejected_actions = 0;

        // Realized P&L grouped by the calendar month (UTC) of the closing fill
        int total_months = 0;
        int winning_months = 0;
        Metric monthly_win_rate;
        Metric avg_monthly_pnl;
        Metric best_month;
        Metric worst_month;
        Metric monthly_volatility;

        // Benchmark (only when the bars were supplied)
        Metric buy_and_hold_return;
        Metric alpha;
        Metric beta;              // Per-bar equity returns against per-bar close returns
        Metric information_ratio; // Annualized mean active return / tracking error

        // Helper method to log calculated metrics
        void logMetrics(const std::string& title = "Backtest Metrics") const;
    };

    // --- PerformanceAnalyzer ---
    // Stateless: the same inputs always give the same report.
    class PerformanceAnalyzer {
    public:
        explicit PerformanceAnalyzer(double risk_free_rate = 0.001, double periods_per_year = 252.0);

        PerformanceReport analyze(const core::EquityCurve& equity_curve,
                                  const core::TradeLog& trade_log,
                                  double initial_cash) const;

        // Adds the buy-and-hold benchmark when bars is not null
        PerformanceReport analyze(const BacktestResult& result,
                                  const core::TimeSeries<core::Bar>* bars = nullptr) const;

        double getRiskFreeRate() const { return risk_free_rate_; }
        double getPeriodsPerYear() const { return periods_per_year_; }

    private:
        double risk_free_rate_;
        double periods_per_year_;
    };

} // namespace backtester
