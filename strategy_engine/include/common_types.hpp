#pragma once
#include "datatypes.hpp"
#include <string>

namespace strategy_engine {

    // Enum to specify which bar price field to use
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    // Shared helpers for the condition classes
    double priceValue(const core::Bar& bar, PriceField field);
    bool compare(double lhs, ComparisonOp op, double rhs);
    std::string toString(PriceField field);
    std::string toString(ComparisonOp op);
    std::string toString(CrossType type);

    // A cross needs both bars defined: prev on or beyond the threshold side, now strictly past it
    bool crossed(double prev_lhs, double prev_rhs, double now_lhs, double now_rhs, CrossType type);

} // namespace strategy_engine
