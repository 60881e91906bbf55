#include "indicator_cross_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

IndicatorCrossCondition::IndicatorCrossCondition(std::string indicator1_name,
                                                 CrossType cross_type,
                                                 std::string indicator2_name)
    : indicator1_name_(std::move(indicator1_name)),
      cross_type_(cross_type),
      rhs_(std::move(indicator2_name))
{
     const std::string& indicator2 = std::get<std::string>(rhs_);
     if (indicator1_name_.empty() || indicator2.empty()) {
         throw std::invalid_argument("Indicator names cannot be empty for IndicatorCrossCondition.");
     }
     if (indicator1_name_ == indicator2) {
         throw std::invalid_argument("Cannot check cross condition for the same indicator.");
     }
}

IndicatorCrossCondition::IndicatorCrossCondition(std::string indicator1_name,
                                                 CrossType cross_type,
                                                 double level)
    : indicator1_name_(std::move(indicator1_name)),
      cross_type_(cross_type),
      rhs_(level)
{
     if (indicator1_name_.empty()) {
         throw std::invalid_argument("Indicator name cannot be empty for IndicatorCrossCondition.");
     }
}

core::IndicatorValue IndicatorCrossCondition::rhsValue(const core::Bar& bar) const {
    if (const double* level = std::get_if<double>(&rhs_)) {
        return *level;
    }
    return bar.indicator(std::get<std::string>(rhs_));
}

bool IndicatorCrossCondition::evaluate(const HistoryView& history) const {
    const core::Bar* prev_bar = history.previous();
    if (!prev_bar) {
        return false; // A cross needs two bars
    }
    const core::Bar& bar = history.current();

    auto lhs_now = bar.indicator(indicator1_name_);
    auto lhs_prev = prev_bar->indicator(indicator1_name_);
    auto rhs_now = rhsValue(bar);
    auto rhs_prev = rhsValue(*prev_bar);

    if (!lhs_now || !lhs_prev || !rhs_now || !rhs_prev) {
         core::logging::getLogger()->trace("IndicatorCrossCondition: missing current or previous values for '{}' on bar {}.",
                                           indicator1_name_, history.currentIndex());
         return false;
    }

    return crossed(*lhs_prev, *rhs_prev, *lhs_now, *rhs_now, cross_type_);
}

std::string IndicatorCrossCondition::describe() const {
    if (const double* level = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", indicator1_name_, toString(cross_type_), *level);
    }
    return fmt::format("{} {} {}", indicator1_name_, toString(cross_type_), std::get<std::string>(rhs_));
}

void IndicatorCrossCondition::collectIndicatorNames(std::vector<std::string>& names) const {
    names.push_back(indicator1_name_);
    if (const std::string* name2 = std::get_if<std::string>(&rhs_)) {
        names.push_back(*name2);
    }
}

} // namespace strategy_engine
