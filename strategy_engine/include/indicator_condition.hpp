#pragma once

#include "interfaces.hpp" // Include the base interface
#include "common_types.hpp"
#include <string>
#include <stdexcept>
#include <variant> // To hold either a double value or a second indicator name

namespace strategy_engine {

    // --- IndicatorCondition Class ---
    // Compares an indicator's value on the current bar against a fixed value OR another indicator.
    class IndicatorCondition : public ICondition {
    public:
        // e.g., IndicatorCondition("RSI", ComparisonOp::LTE, 35.0) -> "RSI <= 35"
        IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, double value);

        // e.g., IndicatorCondition("SMA_25", ComparisonOp::GT, "SMA_75") -> "SMA_25 > SMA_75"
        IndicatorCondition(const std::string& indicator_name1, ComparisonOp op, const std::string& indicator_name2);

        virtual ~IndicatorCondition() override = default;

        bool evaluate(const HistoryView& history) const override;
        std::string describe() const override;
        void collectIndicatorNames(std::vector<std::string>& names) const override;

    private:
        std::string indicator_name1_;
        ComparisonOp op_;
        // Either the comparison value or the second indicator name
        std::variant<double, std::string> rhs_;
    };

} // namespace strategy_engine
