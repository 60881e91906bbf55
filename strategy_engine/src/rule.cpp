#include "rule.hpp"
#include "logging.hpp" // Use short path
#include <spdlog/fmt/fmt.h>
#include <stdexcept> // For std::invalid_argument
#include <cmath>

namespace strategy_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           core::Action action_on_true)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)), // Take ownership
      action_(std::move(action_on_true))
{
    if (name_.empty()) {
         throw std::invalid_argument("Rule name cannot be empty.");
    }
    if (!condition_) {
         throw std::invalid_argument(fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (action_.isHold()) {
          throw std::invalid_argument(fmt::format("Action cannot be 'HOLD' for Rule '{}'.", name_));
    }
    if (action_.fraction && (!std::isfinite(*action_.fraction) || *action_.fraction <= 0.0 || *action_.fraction > 1.0)) {
          throw std::invalid_argument(fmt::format("Fraction {} for Rule '{}' must be in (0, 1].",
                                                  *action_.fraction, name_));
    }
    if (action_.reason.empty()) {
        action_.reason = name_;
    }
}

core::Action Rule::evaluate(const HistoryView& history) const {
    bool condition_result = condition_->evaluate(history);

    core::logging::getLogger()->trace("Rule '{}' evaluated on bar {} -> {}",
                                    name_, history.currentIndex(), condition_result);

    if (condition_result) {
        return action_;
    }
    return core::Action::hold();
}

std::string Rule::describe() const {
    std::string text = fmt::format("Rule '{}': IF {} THEN {}", name_, condition_->describe(),
                                   core::toString(action_.type));
    if (action_.fraction) {
        text += fmt::format(" ({:.0f}%)", *action_.fraction * 100.0);
    }
    return text;
}

} // namespace strategy_engine
