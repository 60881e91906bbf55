#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace strategy_engine {

    // --- AndCondition Class ---
    // Evaluates to true only if ALL contained conditions evaluate to true.
    class AndCondition : public ICondition {
    public:
        // Takes ownership of a non-empty vector of conditions
        explicit AndCondition(std::vector<std::unique_ptr<ICondition>> conditions);

        virtual ~AndCondition() override = default;

        bool evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        void collectIndicatorNames(std::vector<std::string>& names) const override;

    private:
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
