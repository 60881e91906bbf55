#pragma once

#include "interfaces.hpp" // Includes ICondition, IRule, Action etc.
#include <string>
#include <memory> // For std::unique_ptr

namespace strategy_engine {

    // --- Rule Class ---
    // A single entry or exit rule: a condition and the action to take when it holds.
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::Action action_on_true);

        virtual ~Rule() override = default;

        core::Action evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        std::string getName() const override { return name_; }
        const ICondition& getCondition() const override { return *condition_; }

        core::ActionType getActionType() const { return action_.type; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::Action action_;
    };

} // namespace strategy_engine
