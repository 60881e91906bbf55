#pragma once

#include <string>
#include <vector>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp> // Include JSON library header

#include "interfaces.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    // Builds strategies from JSON of the form
    //   {"strategy_name": "...", "type": "rules|ma_cross|golden_cross|rsi|macd|bollinger|composite|combo",
    //    "params": {...}}
    // Malformed configuration raises core::ConfigurationException.
    class StrategyFactory {
    public:
        static std::unique_ptr<IStrategy> createStrategy(const json& config);

        // Convenience for a JSON array of strategy configs
        static std::vector<std::unique_ptr<IStrategy>> createStrategies(const json& configs);

        static std::vector<std::string> supportedTypes();

    private:
        static std::unique_ptr<IStrategy> buildStrategy(const json& config, const std::string& default_name);
        static std::unique_ptr<IStrategy> buildRuleStrategy(const std::string& name, const json& params);
        static std::unique_ptr<IStrategy> buildCompositeStrategy(const std::string& name, const json& params);
        static std::unique_ptr<ICondition> parseCondition(const json& condition_config);
        static std::unique_ptr<IRule> parseRule(const json& rule_config);
    };

} // namespace strategy_engine
