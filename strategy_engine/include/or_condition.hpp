#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace strategy_engine {

    // --- OrCondition Class ---
    // Evaluates to true if ANY contained condition evaluates to true.
    class OrCondition : public ICondition {
    public:
        explicit OrCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        virtual ~OrCondition() override = default;

        bool evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        void collectIndicatorNames(std::vector<std::string>& names) const override;

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
