#include "common_types.hpp"
#include <cmath> // For std::fabs

namespace strategy_engine {

double priceValue(const core::Bar& bar, PriceField field) {
    switch (field) {
        case PriceField::Open:  return bar.open;
        case PriceField::High:  return bar.high;
        case PriceField::Low:   return bar.low;
        case PriceField::Close: return bar.close;
        default:                return bar.close;
    }
}

bool compare(double lhs, ComparisonOp op, double rhs) {
    switch (op) {
        case ComparisonOp::GT:  return lhs > rhs;
        case ComparisonOp::LT:  return lhs < rhs;
        case ComparisonOp::GTE: return lhs >= rhs;
        case ComparisonOp::LTE: return lhs <= rhs;
        case ComparisonOp::EQ:
            // Use tolerance for floating point equality
            return std::fabs(lhs - rhs) < 1e-9;
        default:
            return false;
    }
}

bool crossed(double prev_lhs, double prev_rhs, double now_lhs, double now_rhs, CrossType type) {
    if (type == CrossType::CrossesAbove) {
        return (prev_lhs <= prev_rhs) && (now_lhs > now_rhs);
    }
    return (prev_lhs >= prev_rhs) && (now_lhs < now_rhs);
}

std::string toString(PriceField field) {
    switch (field) {
        case PriceField::Open:  return "Open";
        case PriceField::High:  return "High";
        case PriceField::Low:   return "Low";
        case PriceField::Close: return "Close";
        default:                return "InvalidField";
    }
}

std::string toString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
        case ComparisonOp::LTE: return "<=";
        case ComparisonOp::EQ:  return "==";
        default:                return "InvalidOp";
    }
}

std::string toString(CrossType type) {
    return (type == CrossType::CrossesAbove) ? "CrossesAbove" : "CrossesBelow";
}

} // namespace strategy_engine
