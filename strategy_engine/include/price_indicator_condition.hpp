#pragma once

#include "interfaces.hpp"
#include "common_types.hpp" // For PriceField, ComparisonOp
#include <string>
#include <stdexcept>

namespace strategy_engine {

    // --- PriceIndicatorCondition Class ---
    // Compares a bar price field against a named indicator's value.
    class PriceIndicatorCondition : public ICondition {
    public:
        // e.g., PriceIndicatorCondition(PriceField::Close, ComparisonOp::LTE, "BB_lower") -> "Close <= BB_lower"
        PriceIndicatorCondition(PriceField price_field, ComparisonOp op, std::string indicator_name);

        virtual ~PriceIndicatorCondition() override = default;

        bool evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        void collectIndicatorNames(std::vector<std::string>& names) const override;

    private:
        PriceField price_field_;
        ComparisonOp op_;
        std::string indicator_name_;
    };

} // namespace strategy_engine
