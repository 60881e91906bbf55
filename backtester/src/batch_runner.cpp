#include "batch_runner.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <functional>
#include <future>
#include <stdexcept>

namespace backtester {

namespace {

    BatchEntry runOne(const Backtester& engine,
                      const core::TimeSeries<core::Bar>& bars,
                      const strategy_engine::IStrategy& strategy) {
        BatchEntry entry;
        entry.strategy_name = strategy.getName();
        try {
            BacktestResult result = engine.run(bars, strategy);
            const BacktestConfig& config = engine.getConfig();
            PerformanceAnalyzer analyzer(config.risk_free_rate, config.periods_per_year);
            entry.report = analyzer.analyze(result, &bars);
            entry.result = std::move(result);
        } catch (const core::BacktestPlatformException& e) {
            core::logging::getLogger()->error("Run of '{}' failed: {}", entry.strategy_name, e.what());
            entry.error = e.what();
        }
        return entry;
    }

} // anonymous namespace

std::vector<BatchEntry> BatchRunner::compare(const Backtester& engine,
                                             const core::TimeSeries<core::Bar>& bars,
                                             const std::vector<std::unique_ptr<strategy_engine::IStrategy>>& strategies) {
    auto logger = core::logging::getLogger();
    logger->info("Comparing {} strategies over {} bars.", strategies.size(), bars.size());

    std::vector<std::future<BatchEntry>> futures;
    futures.reserve(strategies.size());
    for (const auto& strategy : strategies) {
        if (!strategy) {
            throw std::invalid_argument("BatchRunner received a null strategy.");
        }
        futures.push_back(std::async(std::launch::async, runOne,
                                     std::cref(engine), std::cref(bars), std::cref(*strategy)));
    }

    std::vector<BatchEntry> entries;
    entries.reserve(futures.size());
    for (auto& future : futures) {
        entries.push_back(future.get()); // Non-platform exceptions propagate to the caller
    }

    std::size_t failed = 0;
    for (const auto& entry : entries) {
        if (!entry.succeeded()) failed++;
    }
    logger->info("Comparison finished: {} succeeded, {} failed.", entries.size() - failed, failed);
    return entries;
}

} // namespace backtester
