#include "strategy_factory.hpp"
#include "rule_strategy.hpp"
#include "builtin_strategies.hpp"
#include "composite_strategy.hpp"
#include "rule.hpp"
#include "indicator_condition.hpp"
#include "price_indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "and_condition.hpp"
#include "or_condition.hpp"
#include "logging.hpp"            // Use short path
#include "exceptions.hpp"
#include "common_types.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>              // For std::invalid_argument
#include <vector>
#include <string>
#include <memory>


namespace strategy_engine {

    namespace { // Use anonymous namespace for file-local helpers

        std::string toLower(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        core::Action stringToAction(const std::string& action_str, std::optional<double> fraction, std::string reason) {
            const std::string lower = toLower(action_str);
            if (lower == "buy") return core::Action::buy(std::move(reason), fraction);
            if (lower == "sell") return core::Action::sell(std::move(reason), fraction);
            if (lower == "hold") throw std::invalid_argument("Rule action cannot be 'Hold'.");
            throw std::invalid_argument("Unknown rule action string: " + action_str);
        }

        ComparisonOp stringToCompOp(const std::string& op_str) {
            if (op_str == ">" || op_str == "GT") return ComparisonOp::GT;
            if (op_str == "<" || op_str == "LT") return ComparisonOp::LT;
            if (op_str == ">=" || op_str == "GTE") return ComparisonOp::GTE;
            if (op_str == "<=" || op_str == "LTE") return ComparisonOp::LTE;
            if (op_str == "==" || op_str == "EQ") return ComparisonOp::EQ;
            throw std::invalid_argument("Unknown comparison operator string: " + op_str);
        }

        PriceField stringToPriceField(const std::string& field_str) {
            const std::string lower_str = toLower(field_str);
            if (lower_str == "open") return PriceField::Open;
            if (lower_str == "high") return PriceField::High;
            if (lower_str == "low") return PriceField::Low;
            if (lower_str == "close") return PriceField::Close;
            throw std::invalid_argument("Unknown price field string: " + field_str);
        }

        const json& requireField(const json& config, const char* key, const std::string& context) {
            if (!config.is_object() || !config.contains(key)) {
                throw std::invalid_argument(fmt::format("{} requires '{}'.", context, key));
            }
            return config.at(key);
        }

        std::string requireString(const json& config, const char* key, const std::string& context) {
            const json& value = requireField(config, key, context);
            if (!value.is_string()) {
                throw std::invalid_argument(fmt::format("{}: '{}' must be a string.", context, key));
            }
            return value.get<std::string>();
        }

        json paramsOf(const json& config) {
            if (!config.contains("params")) return json::object();
            const json& params = config.at("params");
            if (!params.is_object()) throw std::invalid_argument("'params' must be an object.");
            return params;
        }

        // "SMA_25" stays as given, a number 25 becomes "SMA_25"
        std::string movingAverageName(const json& params, const char* key, const std::string& fallback) {
            if (!params.contains(key)) return fallback;
            const json& value = params.at(key);
            if (value.is_string()) return value.get<std::string>();
            if (value.is_number_integer() && value.get<long long>() > 0) return fmt::format("SMA_{}", value.get<long long>());
            throw std::invalid_argument(fmt::format("'{}' must be an indicator name or a positive period.", key));
        }

    } // end anonymous namespace


    // --- Recursive Helper to Parse Conditions ---
    std::unique_ptr<ICondition> StrategyFactory::parseCondition(const json& config) {
        const std::string type = requireString(config, "type", "Condition");
        core::logging::getLogger()->trace("Parsing condition of type: {}", type);

        if (type == "Indicator") {
            const std::string context = "Indicator condition";
            std::string indicator1 = requireString(config, "indicator1", context);
            ComparisonOp op = stringToCompOp(requireString(config, "op", context));

            if (config.contains("value") && config["value"].is_number()) {
                return std::make_unique<IndicatorCondition>(indicator1, op, config["value"].get<double>());
            } else if (config.contains("indicator2") && config["indicator2"].is_string()) {
                return std::make_unique<IndicatorCondition>(indicator1, op, config["indicator2"].get<std::string>());
            }
            throw std::invalid_argument("Indicator condition requires 'value' (number) or 'indicator2' (string).");
        } else if (type == "PriceIndicator") {
            const std::string context = "PriceIndicator condition";
            PriceField field = stringToPriceField(requireString(config, "field", context));
            ComparisonOp op = stringToCompOp(requireString(config, "op", context));
            return std::make_unique<PriceIndicatorCondition>(field, op, requireString(config, "indicator", context));
        } else if (type == "CrossesAbove" || type == "CrossesBelow") {
            const std::string context = type + " condition";
            CrossType cross_type = type == "CrossesAbove" ? CrossType::CrossesAbove : CrossType::CrossesBelow;
            std::string indicator1 = requireString(config, "indicator1", context);

            if (config.contains("value") && config["value"].is_number()) {
                return std::make_unique<IndicatorCrossCondition>(indicator1, cross_type, config["value"].get<double>());
            } else if (config.contains("indicator2") && config["indicator2"].is_string()) {
                return std::make_unique<IndicatorCrossCondition>(indicator1, cross_type, config["indicator2"].get<std::string>());
            }
            throw std::invalid_argument(fmt::format("{} requires 'value' (number) or 'indicator2' (string).", context));
        } else if (type == "AND" || type == "OR") {
            if (!config.contains("conditions") || !config["conditions"].is_array() || config["conditions"].empty()) {
                throw std::invalid_argument(fmt::format("{} condition requires 'conditions' (non-empty array).", type));
            }
            std::vector<std::unique_ptr<ICondition>> sub_conditions;
            sub_conditions.reserve(config["conditions"].size());
            for (const auto& sub_conf : config["conditions"]) {
                sub_conditions.push_back(parseCondition(sub_conf)); // Recursive call
            }
            if (type == "AND") {
                return std::make_unique<AndCondition>(std::move(sub_conditions));
            }
            return std::make_unique<OrCondition>(std::move(sub_conditions));
        }
        throw std::invalid_argument(fmt::format("Unknown condition type '{}' in config.", type));
    }

    // --- Helper to Parse Rules ---
    std::unique_ptr<IRule> StrategyFactory::parseRule(const json& config) {
        const std::string context = "Rule";
        std::string name = requireString(config, "rule_name", context);
        std::string action_str = requireString(config, "action", context);
        const json& condition_config = requireField(config, "condition", context);

        std::optional<double> fraction;
        if (config.contains("fraction")) {
            if (!config["fraction"].is_number()) {
                throw std::invalid_argument(fmt::format("Rule '{}': 'fraction' must be a number.", name));
            }
            fraction = config["fraction"].get<double>();
        }
        std::string reason = config.contains("reason") ? requireString(config, "reason", context) : name;

        core::Action action = stringToAction(action_str, fraction, std::move(reason));
        auto condition = parseCondition(condition_config);
        return std::make_unique<Rule>(name, std::move(condition), action);
    }

    std::unique_ptr<IStrategy> StrategyFactory::buildRuleStrategy(const std::string& name, const json& params) {
        const std::string context = fmt::format("Rule strategy '{}'", name);
        const json& entry_conf = requireField(params, "entry_rules", context);
        if (!entry_conf.is_array()) throw std::invalid_argument(context + ": 'entry_rules' must be an array.");

        std::vector<std::unique_ptr<IRule>> entry_rules;
        for (const auto& rule_conf : entry_conf) {
            entry_rules.push_back(parseRule(rule_conf));
        }

        std::vector<std::unique_ptr<IRule>> exit_rules;
        if (params.contains("exit_rules")) {
            if (!params["exit_rules"].is_array()) throw std::invalid_argument(context + ": 'exit_rules' must be an array.");
            for (const auto& rule_conf : params["exit_rules"]) {
                exit_rules.push_back(parseRule(rule_conf));
            }
        }
        return std::make_unique<RuleStrategy>(name, std::move(entry_rules), std::move(exit_rules));
    }

    std::unique_ptr<IStrategy> StrategyFactory::buildCompositeStrategy(const std::string& name, const json& params) {
        const std::string context = fmt::format("Composite strategy '{}'", name);
        const json& components_conf = requireField(params, "components", context);
        if (!components_conf.is_array() || components_conf.empty()) {
            throw std::invalid_argument(context + ": 'components' must be a non-empty array.");
        }

        std::vector<CompositeStrategy::Component> components;
        for (const auto& component_conf : components_conf) {
            const json& weight = requireField(component_conf, "weight", context + " component");
            if (!weight.is_number()) throw std::invalid_argument(context + ": component 'weight' must be a number.");
            const json& strategy_conf = requireField(component_conf, "strategy", context + " component");

            std::string default_name = strategy_conf.is_object() && strategy_conf.contains("type") && strategy_conf["type"].is_string()
                ? strategy_conf["type"].get<std::string>() : std::string{};
            components.push_back({buildStrategy(strategy_conf, default_name), weight.get<double>()});
        }

        return std::make_unique<CompositeStrategy>(name, std::move(components),
                                                   params.value("buy_threshold", 0.4),
                                                   params.value("sell_threshold", 0.4));
    }

    std::unique_ptr<IStrategy> StrategyFactory::buildStrategy(const json& config, const std::string& default_name) {
        if (!config.is_object()) throw std::invalid_argument("Strategy config must be a JSON object.");

        std::string name = default_name;
        if (config.contains("strategy_name")) {
            name = requireString(config, "strategy_name", "Strategy");
        }
        if (name.empty()) throw std::invalid_argument("Config missing 'strategy_name'.");

        const std::string type = requireString(config, "type", fmt::format("Strategy '{}'", name));
        const json params = paramsOf(config);

        if (type == "rules") {
            return buildRuleStrategy(name, params);
        } else if (type == "ma_cross" || type == "golden_cross") {
            return std::make_unique<MovingAverageCrossStrategy>(name,
                movingAverageName(params, "fast", "SMA_25"),
                movingAverageName(params, "slow", "SMA_75"));
        } else if (type == "rsi") {
            return std::make_unique<RsiReversionStrategy>(name,
                params.value("oversold", 35.0),
                params.value("overbought", 65.0),
                params.value("indicator", std::string("RSI")));
        } else if (type == "macd") {
            return std::make_unique<MacdCrossStrategy>(name, params.value("indicator", std::string("MACD_histogram")));
        } else if (type == "bollinger") {
            return std::make_unique<BollingerBandStrategy>(name,
                params.value("lower_indicator", std::string("BB_lower")),
                params.value("upper_indicator", std::string("BB_upper")));
        } else if (type == "composite") {
            return buildCompositeStrategy(name, params);
        } else if (type == "combo") {
            return makeComboStrategy(name, params.value("buy_threshold", 0.4), params.value("sell_threshold", 0.4));
        }
        throw std::invalid_argument(fmt::format("Unknown strategy type '{}'. Supported: {}",
                                                type, fmt::join(supportedTypes(), ", ")));
    }

    // --- Main Factory Method ---
    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();

        try {
            auto strategy = buildStrategy(config, "");
            logger->info("Created strategy '{}' (requires: {})", strategy->getName(),
                         fmt::join(strategy->getRequiredIndicatorNames(), ", "));
            return strategy;
        } catch (const json::exception& e) {
             logger->error("JSON error while creating strategy: {}", e.what());
             throw core::ConfigurationException(fmt::format("Invalid strategy JSON: {}", e.what()));
        } catch (const std::invalid_argument& e) {
            logger->error("Invalid strategy configuration: {}", e.what());
            throw core::ConfigurationException(e.what());
        }
    }

    std::vector<std::unique_ptr<IStrategy>> StrategyFactory::createStrategies(const json& configs) {
        if (!configs.is_array()) {
            throw core::ConfigurationException("Strategy list must be a JSON array.");
        }
        std::vector<std::unique_ptr<IStrategy>> strategies;
        strategies.reserve(configs.size());
        for (const auto& config : configs) {
            strategies.push_back(createStrategy(config));
        }
        return strategies;
    }

    std::vector<std::string> StrategyFactory::supportedTypes() {
        return {"rules", "ma_cross", "golden_cross", "rsi", "macd", "bollinger", "composite", "combo"};
    }

} // namespace strategy_engine
