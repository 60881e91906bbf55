#include "backtest_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace backtester {

namespace {

    template<typename T>
    T readField(const json& config, const char* key, T fallback) {
        if (!config.contains(key)) return fallback;
        try {
            return config.at(key).get<T>();
        } catch (const json::exception& e) {
            throw core::ConfigurationException(fmt::format("Engine config field '{}' has the wrong type: {}", key, e.what()));
        }
    }

    bool isFiniteNonNegative(double value) {
        return std::isfinite(value) && value >= 0.0;
    }

} // anonymous namespace

std::string toString(CostModel model) {
    switch (model) {
        case CostModel::None:         return "none";
        case CostModel::FixedFee:     return "fixed_fee";
        case CostModel::Proportional: return "proportional";
        case CostModel::Both:         return "both";
    }
    return "unknown";
}

std::string toString(FillPolicy policy) {
    switch (policy) {
        case FillPolicy::NextOpen:  return "next_open";
        case FillPolicy::SameClose: return "same_close";
    }
    return "unknown";
}

std::string toString(SizingPolicy policy) {
    switch (policy) {
        case SizingPolicy::FixedFraction: return "fixed_fraction";
        case SizingPolicy::AllIn:         return "all_in";
        case SizingPolicy::FixedQuantity: return "fixed_quantity";
    }
    return "unknown";
}

CostModel costModelFromString(const std::string& text) {
    if (text == "none") return CostModel::None;
    if (text == "fixed_fee") return CostModel::FixedFee;
    if (text == "proportional") return CostModel::Proportional;
    if (text == "both") return CostModel::Both;
    throw core::ConfigurationException(fmt::format("Unknown cost model '{}'.", text));
}

FillPolicy fillPolicyFromString(const std::string& text) {
    if (text == "next_open") return FillPolicy::NextOpen;
    if (text == "same_close") return FillPolicy::SameClose;
    throw core::ConfigurationException(fmt::format("Unknown fill policy '{}'.", text));
}

SizingPolicy sizingPolicyFromString(const std::string& text) {
    if (text == "fixed_fraction") return SizingPolicy::FixedFraction;
    if (text == "all_in") return SizingPolicy::AllIn;
    if (text == "fixed_quantity") return SizingPolicy::FixedQuantity;
    throw core::ConfigurationException(fmt::format("Unknown sizing policy '{}'.", text));
}

void BacktestConfig::validate() const {
    if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
        throw core::ConfigurationException(fmt::format("Initial cash must be positive, got {}.", initial_cash));
    }
    if (!isFiniteNonNegative(fixed_fee)) {
        throw core::ConfigurationException(fmt::format("Fixed fee must be non-negative, got {}.", fixed_fee));
    }
    if (!isFiniteNonNegative(proportional_rate) || proportional_rate >= 1.0) {
        throw core::ConfigurationException(fmt::format("Proportional rate must be in [0, 1), got {}.", proportional_rate));
    }
    if (!std::isfinite(sizing_fraction) || sizing_fraction <= 0.0 || sizing_fraction > 1.0) {
        throw core::ConfigurationException(fmt::format("Sizing fraction must be in (0, 1], got {}.", sizing_fraction));
    }
    if (sizing_policy == SizingPolicy::FixedQuantity && fixed_quantity <= 0) {
        throw core::ConfigurationException(fmt::format("Fixed quantity sizing needs a positive quantity, got {}.", fixed_quantity));
    }
    if (!std::isfinite(risk_free_rate)) {
        throw core::ConfigurationException("Risk-free rate must be finite.");
    }
    if (!std::isfinite(periods_per_year) || periods_per_year <= 0.0) {
        throw core::ConfigurationException(fmt::format("Periods per year must be positive, got {}.", periods_per_year));
    }
}

double BacktestConfig::transactionCost(double notional) const {
    double cost = 0.0;
    if (cost_model == CostModel::FixedFee || cost_model == CostModel::Both) {
        cost += fixed_fee;
    }
    if (cost_model == CostModel::Proportional || cost_model == CostModel::Both) {
        cost += proportional_rate * notional;
    }
    return cost;
}

BacktestConfig BacktestConfig::fromJson(const json& config) {
    if (!config.is_object()) {
        throw core::ConfigurationException("Engine config must be a JSON object.");
    }

    BacktestConfig result;
    result.initial_cash = readField(config, "initial_cash", result.initial_cash);
    result.cost_model = costModelFromString(readField(config, "cost_model", toString(result.cost_model)));
    result.fixed_fee = readField(config, "fixed_fee", result.fixed_fee);
    result.proportional_rate = readField(config, "proportional_rate", result.proportional_rate);
    result.fill_policy = fillPolicyFromString(readField(config, "fill_policy", toString(result.fill_policy)));
    result.sizing_policy = sizingPolicyFromString(readField(config, "sizing_policy", toString(result.sizing_policy)));
    result.sizing_fraction = readField(config, "sizing_fraction", result.sizing_fraction);
    result.fixed_quantity = readField(config, "fixed_quantity", result.fixed_quantity);
    result.close_at_end = readField(config, "close_at_end", result.close_at_end);
    result.risk_free_rate = readField(config, "risk_free_rate", result.risk_free_rate);
    result.periods_per_year = readField(config, "periods_per_year", result.periods_per_year);

    result.validate();
    return result;
}

json BacktestConfig::toJson() const {
    return json{
        {"initial_cash", initial_cash},
        {"cost_model", toString(cost_model)},
        {"fixed_fee", fixed_fee},
        {"proportional_rate", proportional_rate},
        {"fill_policy", toString(fill_policy)},
        {"sizing_policy", toString(sizing_policy)},
        {"sizing_fraction", sizing_fraction},
        {"fixed_quantity", fixed_quantity},
        {"close_at_end", close_at_end},
        {"risk_free_rate", risk_free_rate},
        {"periods_per_year", periods_per_year}
    };
}

} // namespace backtester
