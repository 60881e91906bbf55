#pragma once

#include <string>
#include <vector>
#include <cstddef>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "interfaces.hpp"       // Strategy engine interfaces
#include "backtest_config.hpp"

namespace backtester {

    // Everything one run produced. Owned by the caller, never shared between runs.
    struct BacktestResult {
        std::string strategy_name;
        BacktestConfig config;
        core::TradeLog trade_log;
        core::EquityCurve equity_curve; // One point per bar
        double final_cash = 0.0;
        long long final_position = 0;
        std::size_t bar_count = 0;
    };

    struct RunContext; // Per-run mutable state, defined in backtester.cpp

    // --- Backtester ---
    // Simulation engine. Walks the bars in order, shows the strategy only bars [0, t],
    // queues its decision and fills it on bar t+1 under the configured fill policy.
    // run() is const and keeps all mutable state in a per-run context, so one instance
    // can serve concurrent runs.
    class Backtester {
    public:
        // Throws core::ConfigurationException for an invalid config
        explicit Backtester(BacktestConfig config);

        const BacktestConfig& getConfig() const { return config_; }

        // Throws core::DataIntegrityException / core::ConfigurationException before the
        // first bar is simulated; never partially executes.
        BacktestResult run(const core::TimeSeries<core::Bar>& bars,
                           const strategy_engine::IStrategy& strategy) const;

        // Checks timestamp order, usable prices and presence of the required indicator keys
        static void validateBars(const core::TimeSeries<core::Bar>& bars,
                                 const std::vector<std::string>& required_indicators);

    private:
        BacktestConfig config_;

        // --- Private Helper Methods ---
        void handleDecision(RunContext& ctx, const core::Action& action,
                            const core::TimeSeries<core::Bar>& bars, std::size_t index) const;
        void executePending(RunContext& ctx, const core::Bar& bar, std::size_t index) const;
        void executeBuy(RunContext& ctx, const core::Bar& bar, std::size_t index, double price) const;
        void executeSell(RunContext& ctx, const core::Bar& bar, std::size_t index, double price) const;
        void closeAtEnd(RunContext& ctx, const core::Bar& bar, std::size_t index) const;

        // Largest affordable share count for a buy at this price (0 when nothing fits)
        long long buyQuantity(double cash, double price, const std::optional<double>& fraction) const;
    };

} // namespace backtester
