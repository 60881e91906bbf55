#pragma once

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "backtester.hpp"
#include "performance_analyzer.hpp"
#include "batch_runner.hpp"

// nlohmann::json conversions for the run outputs, found through ADL.
// Undefined metrics become null, timestamps ISO 8601 UTC strings.

namespace core {

    void to_json(nlohmann::json& j, const Action& action);
    void to_json(nlohmann::json& j, const Trade& trade);
    void to_json(nlohmann::json& j, const RejectedAction& rejected);
    void to_json(nlohmann::json& j, const TradeLog& trade_log);
    void to_json(nlohmann::json& j, const EquityPoint& point);

} // namespace core

namespace backtester {

    void to_json(nlohmann::json& j, const PerformanceReport& report);
    void to_json(nlohmann::json& j, const BacktestResult& result);
    void to_json(nlohmann::json& j, const BatchEntry& entry);

} // namespace backtester
