#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backtester.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    // One strategy's outcome in a comparison batch
    struct BatchEntry {
        std::string strategy_name;
        std::optional<BacktestResult> result;   // Empty when the run failed validation
        std::optional<PerformanceReport> report;
        std::string error;                      // Set when result is empty

        bool succeeded() const { return result.has_value(); }
    };

    // --- BatchRunner ---
    // Runs every strategy over the same bars on its own thread. Runs share only the
    // immutable bars and engine; a failing run is reported, the others complete.
    class BatchRunner {
    public:
        static std::vector<BatchEntry> compare(const Backtester& engine,
                                               const core::TimeSeries<core::Bar>& bars,
                                               const std::vector<std::unique_ptr<strategy_engine::IStrategy>>& strategies);
    };

} // namespace backtester
