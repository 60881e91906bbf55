#include "indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

// Constructor for comparing indicator to value
IndicatorCondition::IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, double value)
    : indicator_name1_(indicator_name1), op_(op), rhs_(value)
{
    if (indicator_name1_.empty()) {
        throw std::invalid_argument("Indicator name 1 cannot be empty.");
    }
}

// Constructor for comparing indicator to indicator
IndicatorCondition::IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, const std::string& indicator_name2)
     : indicator_name1_(indicator_name1), op_(op), rhs_(indicator_name2)
{
     if (indicator_name1_.empty() || indicator_name2.empty()) {
         throw std::invalid_argument("Indicator names cannot be empty.");
     }
     if (indicator_name1_ == indicator_name2) {
         throw std::invalid_argument("Cannot compare an indicator to itself in IndicatorCondition.");
     }
}

bool IndicatorCondition::evaluate(const HistoryView& history) const {
    if (history.empty()) {
        return false;
    }
    const core::Bar& bar = history.current();

    auto lhs = bar.indicator(indicator_name1_);
    if (!lhs) {
        core::logging::getLogger()->trace("IndicatorCondition: '{}' not available on bar {}.",
                                          indicator_name1_, history.currentIndex());
        return false;
    }

    double rhs_value = 0.0;
    if (const double* value = std::get_if<double>(&rhs_)) {
        rhs_value = *value;
    } else {
        const std::string& indicator_name2 = std::get<std::string>(rhs_);
        auto rhs = bar.indicator(indicator_name2);
        if (!rhs) {
            core::logging::getLogger()->trace("IndicatorCondition: '{}' not available on bar {}.",
                                              indicator_name2, history.currentIndex());
            return false;
        }
        rhs_value = *rhs;
    }

    return compare(*lhs, op_, rhs_value);
}

std::string IndicatorCondition::describe() const {
    if (const double* value = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", indicator_name1_, toString(op_), *value);
    }
    return fmt::format("{} {} {}", indicator_name1_, toString(op_), std::get<std::string>(rhs_));
}

void IndicatorCondition::collectIndicatorNames(std::vector<std::string>& names) const {
    names.push_back(indicator_name1_);
    if (const std::string* name2 = std::get_if<std::string>(&rhs_)) {
        names.push_back(*name2);
    }
}

} // namespace strategy_engine
