#include "datatypes.hpp"

#include <utility>

namespace core {

    bool Bar::hasIndicator(const std::string& name) const {
        return indicators.find(name) != indicators.end();
    }

    IndicatorValue Bar::indicator(const std::string& name) const {
        auto it = indicators.find(name);
        if (it == indicators.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Action Action::hold() {
        return Action{};
    }

    Action Action::buy(std::string reason, std::optional<double> fraction) {
        Action action;
        action.type = ActionType::Buy;
        action.fraction = fraction;
        action.reason = std::move(reason);
        return action;
    }

    Action Action::sell(std::string reason, std::optional<double> fraction) {
        Action action;
        action.type = ActionType::Sell;
        action.fraction = fraction;
        action.reason = std::move(reason);
        return action;
    }

    std::string toString(ActionType type) {
        switch (type) {
            case ActionType::Hold: return "HOLD";
            case ActionType::Buy:  return "BUY";
            case ActionType::Sell: return "SELL";
            default:               return "UNKNOWN";
        }
    }

    std::string toString(TradeSide side) {
        return side == TradeSide::Buy ? "BUY" : "SELL";
    }

    std::string toString(RejectionReason reason) {
        switch (reason) {
            case RejectionReason::NoPosition:       return "NoPosition";
            case RejectionReason::InvalidFraction:  return "InvalidFraction";
            case RejectionReason::InsufficientCash: return "InsufficientCash";
            case RejectionReason::ZeroQuantity:     return "ZeroQuantity";
            case RejectionReason::NoFillBar:        return "NoFillBar";
            default:                                return "Unknown";
        }
    }

} // namespace core
