#include "rule_strategy.hpp"
#include "logging.hpp" // Use short path
#include <spdlog/fmt/fmt.h>
#include <set>
#include <stdexcept>  // For std::invalid_argument

namespace strategy_engine {

RuleStrategy::RuleStrategy(
    std::string name,
    std::vector<std::unique_ptr<IRule>> entry_rules,
    std::vector<std::unique_ptr<IRule>> exit_rules
) : name_(std::move(name)),
    entry_rules_(std::move(entry_rules)),
    exit_rules_(std::move(exit_rules))
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (entry_rules_.empty()) throw std::invalid_argument("Strategy must have at least one entry rule.");

    for (const auto& rule : entry_rules_) {
        if (!rule) throw std::invalid_argument(fmt::format("Strategy '{}' has a null entry rule.", name_));
    }
    for (const auto& rule : exit_rules_) {
        if (!rule) throw std::invalid_argument(fmt::format("Strategy '{}' has a null exit rule.", name_));
    }

    // Collect and de-duplicate indicator names, keeping first-seen order
    std::vector<std::string> collected;
    for (const auto& rule : entry_rules_) rule->getCondition().collectIndicatorNames(collected);
    for (const auto& rule : exit_rules_) rule->getCondition().collectIndicatorNames(collected);
    std::set<std::string> seen;
    for (auto& indicator_name : collected) {
        if (seen.insert(indicator_name).second) {
            required_indicator_names_.push_back(std::move(indicator_name));
        }
    }

    core::logging::getLogger()->debug("Strategy '{}' created with {} entry and {} exit rules.",
                                      name_, entry_rules_.size(), exit_rules_.size());
}


std::string RuleStrategy::getName() const { return name_; }
const std::vector<std::string>& RuleStrategy::getRequiredIndicatorNames() const { return required_indicator_names_; }


core::Action RuleStrategy::firstTriggered(const std::vector<std::unique_ptr<IRule>>& rules,
                                          const HistoryView& history) const {
    for (const auto& rule : rules) {
        core::Action action = rule->evaluate(history);
        if (!action.isHold()) {
            core::logging::getLogger()->trace("Strategy '{}': rule '{}' triggered -> {}",
                                              name_, rule->getName(), core::toString(action.type));
            return action;
        }
    }
    return core::Action::hold();
}

core::Action RuleStrategy::decide(const HistoryView& history, const core::PortfolioState& state) const {
    if (state.isFlat()) {
        return firstTriggered(entry_rules_, history);
    }
    return firstTriggered(exit_rules_, history);
}

} // namespace strategy_engine
