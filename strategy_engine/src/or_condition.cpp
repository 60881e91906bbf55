#include "or_condition.hpp"
#include <sstream> // For describe()
#include <stdexcept>

namespace strategy_engine {

OrCondition::OrCondition(std::vector<std::unique_ptr<ICondition>> conditions)
    : conditions_(std::move(conditions))
{
     if (conditions_.empty()) {
         throw std::invalid_argument("OrCondition must receive at least one condition.");
     }
     for (const auto& condition : conditions_) {
         if (!condition) {
             throw std::invalid_argument("OrCondition cannot hold a null condition.");
         }
     }
}

bool OrCondition::evaluate(const HistoryView& history) const {
    for (const auto& condition : conditions_) {
        if (condition->evaluate(history)) {
            return true;
        }
    }
    return false;
}

std::string OrCondition::describe() const {
    std::stringstream ss;
    ss << "(";
    for (size_t i = 0; i < conditions_.size(); ++i) {
        ss << conditions_[i]->describe();
        if (i < conditions_.size() - 1) {
            ss << " OR ";
        }
    }
    ss << ")";
    return ss.str();
}

void OrCondition::collectIndicatorNames(std::vector<std::string>& names) const {
    for (const auto& condition : conditions_) {
        condition->collectIndicatorNames(names);
    }
}

} // namespace strategy_engine
