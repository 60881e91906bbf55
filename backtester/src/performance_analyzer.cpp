#include "performance_analyzer.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace backtester {

namespace {

    constexpr double kEpsilon = 1e-12;

    double mean(const std::vector<double>& values) {
        double sum = 0.0;
        for (double v : values) sum += v;
        return sum / static_cast<double>(values.size());
    }

    // Population standard deviation
    double stddev(const std::vector<double>& values) {
        const double m = mean(values);
        double sq = 0.0;
        for (double v : values) sq += (v - m) * (v - m);
        return std::sqrt(sq / static_cast<double>(values.size()));
    }

    // Linear interpolation between closest ranks; values must be sorted and non-empty
    double percentile(const std::vector<double>& sorted, double q) {
        const double position = q * static_cast<double>(sorted.size() - 1);
        const auto lower = static_cast<std::size_t>(std::floor(position));
        const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
        const double weight = position - static_cast<double>(lower);
        return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
    }

    double median(std::vector<double> values) {
        std::sort(values.begin(), values.end());
        const std::size_t mid = values.size() / 2;
        return values.size() % 2 == 1 ? values[mid] : (values[mid - 1] + values[mid]) / 2.0;
    }

    std::string formatMetric(const Metric& metric, double scale = 1.0, const char* suffix = "") {
        if (!metric) return "N/A";
        return fmt::format("{:.2f}{}", *metric * scale, suffix);
    }

    void analyzeEquity(PerformanceReport& report, const core::EquityCurve& curve,
                       double risk_free_rate, double periods_per_year) {
        report.final_equity = curve.empty() ? report.initial_cash : curve.back().equity;
        report.total_pnl = report.final_equity - report.initial_cash;
        report.total_return = report.final_equity / report.initial_cash - 1.0;

        // --- Drawdown ---
        double peak = report.initial_cash;
        std::optional<std::size_t> peak_index;
        for (std::size_t i = 0; i < curve.size(); ++i) {
            const double equity = curve[i].equity;
            if (equity >= peak) {
                peak = equity;
                peak_index = i;
                continue;
            }
            const double drawdown = (peak - equity) / peak;
            if (drawdown > report.max_drawdown) {
                report.max_drawdown = drawdown;
                report.max_drawdown_peak_index = peak_index;
                report.max_drawdown_trough_index = i;
            }
            const std::size_t bars_below = peak_index ? i - *peak_index : i + 1;
            report.max_drawdown_duration = std::max(report.max_drawdown_duration, bars_below);
        }

        // --- Per-bar returns ---
        std::vector<double> returns;
        if (curve.size() > 1) returns.reserve(curve.size() - 1);
        for (std::size_t i = 1; i < curve.size(); ++i) {
            const double previous = curve[i - 1].equity;
            if (previous > 0.0) {
                returns.push_back(curve[i].equity / previous - 1.0);
            }
        }
        report.periods = returns.size();

        if (!returns.empty() && report.final_equity > 0.0) {
            report.annualized_return = std::pow(report.final_equity / report.initial_cash,
                                                periods_per_year / static_cast<double>(returns.size())) - 1.0;
        }
        if (returns.empty()) {
            return;
        }

        const double sd = stddev(returns);
        report.volatility = sd * std::sqrt(periods_per_year);

        const double rf_per_period = risk_free_rate / periods_per_year;
        std::vector<double> excess;
        excess.reserve(returns.size());
        double downside_sq = 0.0;
        for (double r : returns) {
            excess.push_back(r - rf_per_period);
            const double shortfall = std::min(r - rf_per_period, 0.0);
            downside_sq += shortfall * shortfall;
        }
        const double mean_excess = mean(excess);

        if (returns.size() >= 2 && sd > kEpsilon) {
            report.sharpe_ratio = mean_excess / sd * std::sqrt(periods_per_year);
        }
        const double downside_dev = std::sqrt(downside_sq / static_cast<double>(returns.size()));
        if (returns.size() >= 2 && sd > kEpsilon && downside_dev > kEpsilon) {
            report.sortino_ratio = mean_excess / downside_dev * std::sqrt(periods_per_year);
        }
        if (report.annualized_return && report.max_drawdown > kEpsilon) {
            report.calmar_ratio = *report.annualized_return / report.max_drawdown;
        }

        // --- Tail risk ---
        std::vector<double> sorted = returns;
        std::sort(sorted.begin(), sorted.end());
        const double var = percentile(sorted, 0.05);
        double tail_sum = 0.0;
        std::size_t tail_count = 0;
        for (double r : sorted) {
            if (r > var) break;
            tail_sum += r;
            tail_count++;
        }
        report.var_95 = var;
        report.cvar_95 = tail_sum / static_cast<double>(tail_count);
    }

    void analyzeTrades(PerformanceReport& report, const core::TradeLog& trade_log) {
        report.total_executions = static_cast<int>(trade_log.trades.size());
        report.rejected_actions = static_cast<int>(trade_log.rejected.size());

        double gross_profit = 0.0;
        double gross_loss = 0.0;
        std::vector<double> holding;
        std::map<std::string, double> monthly_pnl; // Keyed "YYYY-MM", ordered
        int win_streak = 0;
        int loss_streak = 0;

        for (const auto& trade : trade_log.trades) {
            if (!trade.realized_pnl) continue; // Buys open, sells close
            const double pnl = *trade.realized_pnl;
            report.closing_trades++;

            report.best_trade = report.best_trade ? std::max(*report.best_trade, pnl) : pnl;
            report.worst_trade = report.worst_trade ? std::min(*report.worst_trade, pnl) : pnl;

            if (pnl > 0.0) {
                report.winning_trades++;
                gross_profit += pnl;
                win_streak++;
                loss_streak = 0;
            } else if (pnl < 0.0) {
                report.losing_trades++;
                gross_loss += pnl;
                loss_streak++;
                win_streak = 0;
            } else {
                win_streak = 0;
                loss_streak = 0;
            }
            report.max_consecutive_wins = std::max(report.max_consecutive_wins, win_streak);
            report.max_consecutive_losses = std::max(report.max_consecutive_losses, loss_streak);

            if (trade.holding_bars) {
                holding.push_back(static_cast<double>(*trade.holding_bars));
            }
            monthly_pnl[core::utils::timestampToString(trade.fill_time).substr(0, 7)] += pnl;
        }

        if (report.closing_trades > 0) {
            report.win_rate = static_cast<double>(report.winning_trades) / report.closing_trades;
        }
        if (report.winning_trades > 0) {
            report.avg_win = gross_profit / report.winning_trades;
        }
        if (report.losing_trades > 0) {
            report.avg_loss = gross_loss / report.losing_trades;
        }
        if (gross_loss < 0.0) {
            report.profit_factor = gross_profit / -gross_loss;
        }
        if (report.avg_win && report.avg_loss) {
            report.payoff_ratio = *report.avg_win / -*report.avg_loss;
        }
        if (report.closing_trades > 0) {
            report.expectancy = (gross_profit + gross_loss) / report.closing_trades;
            report.expectancy_pct = *report.expectancy / report.initial_cash;
        }

        if (!holding.empty()) {
            report.avg_holding_bars = mean(holding);
            report.median_holding_bars = median(holding);
            report.holding_bars_std = stddev(holding);
            report.min_holding_bars = *std::min_element(holding.begin(), holding.end());
            report.max_holding_bars = *std::max_element(holding.begin(), holding.end());
        }

        // --- Monthly breakdown ---
        if (monthly_pnl.empty()) {
            return;
        }
        std::vector<double> months;
        months.reserve(monthly_pnl.size());
        for (const auto& entry : monthly_pnl) {
            months.push_back(entry.second);
            if (entry.second > 0.0) report.winning_months++;
        }
        report.total_months = static_cast<int>(months.size());
        report.monthly_win_rate = static_cast<double>(report.winning_months) / report.total_months;
        report.avg_monthly_pnl = mean(months);
        report.best_month = *std::max_element(months.begin(), months.end());
        report.worst_month = *std::min_element(months.begin(), months.end());
        report.monthly_volatility = stddev(months);
    }

    // Beta and information ratio against the bars' close-to-close returns
    void analyzeBenchmark(PerformanceReport& report, const core::EquityCurve& curve,
                          const core::TimeSeries<core::Bar>& bars, double periods_per_year) {
        if (curve.size() != bars.size()) {
            return;
        }
        std::vector<double> strategy;
        std::vector<double> market;
        std::vector<double> active;
        for (std::size_t i = 1; i < curve.size(); ++i) {
            if (curve[i - 1].equity <= 0.0 || bars[i - 1].close <= 0.0) continue;
            const double s = curve[i].equity / curve[i - 1].equity - 1.0;
            const double m = bars[i].close / bars[i - 1].close - 1.0;
            strategy.push_back(s);
            market.push_back(m);
            active.push_back(s - m);
        }
        if (strategy.size() < 2) {
            return;
        }

        const double strategy_mean = mean(strategy);
        const double market_mean = mean(market);
        double covariance = 0.0;
        double market_variance = 0.0;
        for (std::size_t i = 0; i < strategy.size(); ++i) {
            covariance += (strategy[i] - strategy_mean) * (market[i] - market_mean);
            market_variance += (market[i] - market_mean) * (market[i] - market_mean);
        }
        if (market_variance / static_cast<double>(market.size()) > kEpsilon) {
            report.beta = covariance / market_variance;
        }

        const double tracking_error = stddev(active);
        if (tracking_error > kEpsilon) {
            report.information_ratio = mean(active) / tracking_error * std::sqrt(periods_per_year);
        }
    }

} // anonymous namespace

PerformanceAnalyzer::PerformanceAnalyzer(double risk_free_rate, double periods_per_year)
    : risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year)
{
    if (!std::isfinite(risk_free_rate_)) {
        throw core::ConfigurationException("Risk-free rate must be finite.");
    }
    if (!std::isfinite(periods_per_year_) || periods_per_year_ <= 0.0) {
        throw core::ConfigurationException(fmt::format("Periods per year must be positive, got {}.", periods_per_year_));
    }
}

PerformanceReport PerformanceAnalyzer::analyze(const core::EquityCurve& equity_curve,
                                               const core::TradeLog& trade_log,
                                               double initial_cash) const {
    if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
        throw core::ConfigurationException(fmt::format("Initial cash must be positive, got {}.", initial_cash));
    }

    PerformanceReport report;
    report.initial_cash = initial_cash;
    analyzeEquity(report, equity_curve, risk_free_rate_, periods_per_year_);
    analyzeTrades(report, trade_log);
    return report;
}

PerformanceReport PerformanceAnalyzer::analyze(const BacktestResult& result,
                                               const core::TimeSeries<core::Bar>* bars) const {
    PerformanceReport report = analyze(result.equity_curve, result.trade_log, result.config.initial_cash);
    if (bars && !bars->empty() && bars->front().close > 0.0) {
        report.buy_and_hold_return = bars->back().close / bars->front().close - 1.0;
        report.alpha = report.total_return - *report.buy_and_hold_return;
        analyzeBenchmark(report, result.equity_curve, *bars, periods_per_year_);
    }
    return report;
}

void PerformanceReport::logMetrics(const std::string& title) const {
    auto logger = core::logging::getLogger();
    logger->info("--- {} ---", title);
    logger->info("Initial Cash: {:.2f}", initial_cash);
    logger->info("Final Equity: {:.2f}", final_equity);
    logger->info("Total PnL: {:.2f}", total_pnl);
    logger->info("Total Return: {:.2f}%", total_return * 100.0);
    logger->info("Annualized Return: {}", formatMetric(annualized_return, 100.0, "%"));
    logger->info("Max Drawdown: {:.2f}% (bars {} -> {}, longest {} bars)", max_drawdown * 100.0,
                 max_drawdown_peak_index ? std::to_string(*max_drawdown_peak_index) : std::string("start"),
                 max_drawdown_trough_index, max_drawdown_duration);
    logger->info("Volatility: {}", formatMetric(volatility, 100.0, "%"));
    logger->info("Sharpe Ratio: {}", formatMetric(sharpe_ratio));
    logger->info("Sortino Ratio: {}", formatMetric(sortino_ratio));
    logger->info("Calmar Ratio: {}", formatMetric(calmar_ratio));
    logger->info("VaR 95 / CVaR 95: {} / {}", formatMetric(var_95, 100.0, "%"), formatMetric(cvar_95, 100.0, "%"));
    logger->info("Total Executions: {}", total_executions);
    logger->info("Closing Trades: {} ({} won, {} lost)", closing_trades, winning_trades, losing_trades);
    logger->info("Win Rate: {}", formatMetric(win_rate, 100.0, "%"));
    logger->info("Profit Factor: {}", formatMetric(profit_factor));
    logger->info("Avg Win PnL: {}", formatMetric(avg_win));
    logger->info("Avg Loss PnL: {}", formatMetric(avg_loss));
    logger->info("Payoff Ratio: {}", formatMetric(payoff_ratio));
    logger->info("Expectancy: {} ({})", formatMetric(expectancy), formatMetric(expectancy_pct, 100.0, "%"));
    logger->info("Best / Worst Trade: {} / {}", formatMetric(best_trade), formatMetric(worst_trade));
    logger->info("Max Consecutive Wins / Losses: {} / {}", max_consecutive_wins, max_consecutive_losses);
    logger->info("Holding Period: avg {} / median {} / std {} / min {} / max {} bars",
                 formatMetric(avg_holding_bars), formatMetric(median_holding_bars), formatMetric(holding_bars_std),
                 formatMetric(min_holding_bars), formatMetric(max_holding_bars));
    logger->info("Rejected Actions: {}", rejected_actions);
    if (total_months > 0) {
        logger->info("Months: {} ({} winning, {})", total_months, winning_months,
                     formatMetric(monthly_win_rate, 100.0, "%"));
        logger->info("Monthly PnL: avg {} / best {} / worst {} / std {}", formatMetric(avg_monthly_pnl),
                     formatMetric(best_month), formatMetric(worst_month), formatMetric(monthly_volatility));
    }
    if (buy_and_hold_return) {
        logger->info("Buy & Hold Return: {}", formatMetric(buy_and_hold_return, 100.0, "%"));
        logger->info("Alpha: {}", formatMetric(alpha, 100.0, "%"));
        logger->info("Beta: {}", formatMetric(beta));
        logger->info("Information Ratio: {}", formatMetric(information_ratio));
    }
    logger->info("------------------------");
}

} // namespace backtester
