#pragma once

#include "interfaces.hpp"
#include "common_types.hpp" // For CrossType
#include <string>
#include <stdexcept>
#include <variant>

namespace strategy_engine {

    // --- IndicatorCrossCondition Class ---
    // True on the bar where indicator1 crosses above/below indicator2 (or a fixed level),
    // judged from the previous bar to the current one.
    class IndicatorCrossCondition : public ICondition {
    public:
        // e.g., IndicatorCrossCondition("SMA_25", CrossType::CrossesAbove, "SMA_75")
        IndicatorCrossCondition(std::string indicator1_name,
                                CrossType cross_type,
                                std::string indicator2_name);

        // e.g., IndicatorCrossCondition("MACD_histogram", CrossType::CrossesAbove, 0.0)
        IndicatorCrossCondition(std::string indicator1_name,
                                CrossType cross_type,
                                double level);

        virtual ~IndicatorCrossCondition() override = default;

        bool evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        void collectIndicatorNames(std::vector<std::string>& names) const override;

    private:
        std::string indicator1_name_;
        CrossType cross_type_;
        std::variant<double, std::string> rhs_;

        core::IndicatorValue rhsValue(const core::Bar& bar) const;
    };

} // namespace strategy_engine
