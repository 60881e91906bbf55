// cli/src/main.cpp

// Standard includes
#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "signal_provider.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "batch_runner.hpp"
#include "result_serialization.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/fmt.h>
#include <nlohmann/json.hpp>
#include "ta_libc.h"

namespace {

    using json = nlohmann::json;

    json loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigurationException(fmt::format("Failed to open config file: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigurationException(fmt::format("Failed to parse '{}': {}", path, e.what()));
        }
    }

    std::string requireString(const json& config, const char* key) {
        if (!config.contains(key) || !config[key].is_string()) {
            throw core::ConfigurationException(fmt::format("Run config requires '{}' (string).", key));
        }
        return config[key].get<std::string>();
    }

    // Entries are inline strategy objects or paths to strategy JSON files
    json resolveStrategyConfigs(const json& run_config) {
        if (!run_config.contains("strategies") || !run_config["strategies"].is_array() || run_config["strategies"].empty()) {
            throw core::ConfigurationException("Run config requires 'strategies' (non-empty array).");
        }
        json resolved = json::array();
        for (const auto& entry : run_config["strategies"]) {
            resolved.push_back(entry.is_string() ? loadJsonFile(entry.get<std::string>()) : entry);
        }
        return resolved;
    }

    core::Timestamp parseDate(const std::string& text, const char* key) {
        try {
            return core::utils::stringToTimestamp(text);
        } catch (const std::runtime_error& e) {
            throw core::ConfigurationException(fmt::format("Bad '{}' date '{}': {}", key, text, e.what()));
        }
    }

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("stock_backtester_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Stock Backtester CLI starting...");

        const std::string run_file = argc > 1 ? argv[1] : "config/backtest_run.json";
        logger->info("Loading run config from: {}", run_file);
        const json run_config = loadJsonFile(run_file);
        if (!run_config.is_object()) {
            throw core::ConfigurationException("Run config must be a JSON object.");
        }

        // --- Engine and strategies are validated before touching the data ---
        const backtester::Backtester engine(backtester::BacktestConfig::fromJson(run_config.value("engine", json::object())));
        auto strategies = strategy_engine::StrategyFactory::createStrategies(resolveStrategyConfigs(run_config));

        const indicators::SignalProvider provider(
            indicators::SignalSettings::fromJson(run_config.value("indicators", json::object())));

        // --- Load candles ---
        const std::string db_path = requireString(run_config, "database");
        const std::string instrument = requireString(run_config, "instrument");
        const std::string interval = run_config.value("interval", std::string("day"));
        const core::Timestamp start_ts = parseDate(requireString(run_config, "start"), "start");
        // Include the whole end day
        const core::Timestamp end_ts = parseDate(requireString(run_config, "end"), "end")
                                       + std::chrono::hours(24) - std::chrono::seconds(1);

        data::DatabaseManager db_manager(db_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException(fmt::format("Could not open database '{}'.", db_path));
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Could not initialize schema in '{}'.", db_path));
        }
        core::TimeSeries<core::Candle> candles = db_manager.queryCandles(instrument, interval, start_ts, end_ts);
        db_manager.disconnect();

        if (candles.empty()) {
            throw core::DataLoadException(fmt::format("No candles for {} ({}) in the requested range.", instrument, interval));
        }
        logger->info("Loaded {} candles for {} spanning {} days.", candles.size(), instrument,
                     core::utils::daysBetween(candles.front().timestamp, candles.back().timestamp));

        // --- Attach indicators and compare ---
        const core::TimeSeries<core::Bar> bars = provider.buildBars(candles);
        auto entries = backtester::BatchRunner::compare(engine, bars, strategies);

        json output = {
            {"instrument", instrument},
            {"interval", interval},
            {"start", core::utils::timestampToString(bars.front().timestamp)},
            {"end", core::utils::timestampToString(bars.back().timestamp)},
            {"runs", entries}
        };

        int failed_runs = 0;
        for (const auto& entry : entries) {
            if (entry.succeeded()) {
                entry.report->logMetrics(entry.strategy_name);
            } else {
                failed_runs++;
                logger->error("Strategy '{}' failed: {}", entry.strategy_name, entry.error);
            }
        }

        // --- Write report ---
        const std::string output_path = run_config.value("output", std::string("results/backtest_report.json"));
        const std::filesystem::path output_file(output_path);
        if (output_file.has_parent_path()) {
            std::filesystem::create_directories(output_file.parent_path());
        }
        std::ofstream ofs(output_path);
        if (!ofs.is_open()) {
            throw core::BacktestPlatformException(fmt::format("Failed to open output file: {}", output_path));
        }
        ofs << output.dump(2) << '\n';
        logger->info("Report written to {}", output_path);

        if (TA_Shutdown() != TA_SUCCESS) {
            logger->warn("TA_Shutdown reported an error.");
        }
        logger->info("Stock Backtester CLI finished.");
        return failed_runs == 0 ? 0 : 2;

    // --- Exception Handling ---
    } catch (const core::BacktestPlatformException& ex) {
        std::cerr << "Backtest Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtest Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
