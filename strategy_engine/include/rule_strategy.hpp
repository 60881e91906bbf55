#pragma once

#include "interfaces.hpp" // Includes IRule, IStrategy, HistoryView etc.
#include <string>
#include <vector>
#include <memory>      // For std::unique_ptr

namespace strategy_engine {

    // --- RuleStrategy Class ---
    // Strategy assembled from entry rules (consulted while flat) and exit rules
    // (consulted while holding). Within a set the first triggered rule wins.
    class RuleStrategy : public IStrategy {
    public:
        RuleStrategy(
            std::string name,
            std::vector<std::unique_ptr<IRule>> entry_rules,
            std::vector<std::unique_ptr<IRule>> exit_rules
        );

        virtual ~RuleStrategy() override = default;

        // IStrategy interface implementation
        std::string getName() const override;
        const std::vector<std::string>& getRequiredIndicatorNames() const override;
        core::Action decide(const HistoryView& history, const core::PortfolioState& state) const override;

        const std::vector<std::unique_ptr<IRule>>& getEntryRules() const { return entry_rules_; }
        const std::vector<std::unique_ptr<IRule>>& getExitRules() const { return exit_rules_; }

    private:
        std::string name_;
        std::vector<std::string> required_indicator_names_; // Collected from the rule conditions
        std::vector<std::unique_ptr<IRule>> entry_rules_;
        std::vector<std::unique_ptr<IRule>> exit_rules_;

        core::Action firstTriggered(const std::vector<std::unique_ptr<IRule>>& rules,
                                    const HistoryView& history) const;
    };

} // namespace strategy_engine
