#include "price_indicator_condition.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

PriceIndicatorCondition::PriceIndicatorCondition(PriceField price_field, ComparisonOp op, std::string indicator_name)
    : price_field_(price_field), op_(op), indicator_name_(std::move(indicator_name))
{
     if (indicator_name_.empty()) {
        throw std::invalid_argument("Indicator name cannot be empty for PriceIndicatorCondition.");
     }
}

bool PriceIndicatorCondition::evaluate(const HistoryView& history) const {
    if (history.empty()) {
        return false;
    }
    const core::Bar& bar = history.current();

    auto rhs = bar.indicator(indicator_name_);
    if (!rhs) {
        core::logging::getLogger()->trace("PriceIndicatorCondition: '{}' not available on bar {}.",
                                          indicator_name_, history.currentIndex());
        return false;
    }

    return compare(priceValue(bar, price_field_), op_, *rhs);
}

std::string PriceIndicatorCondition::describe() const {
    return fmt::format("{} {} {}", toString(price_field_), toString(op_), indicator_name_);
}

void PriceIndicatorCondition::collectIndicatorNames(std::vector<std::string>& names) const {
    names.push_back(indicator_name_);
}

} // namespace strategy_engine
