#include "indicators.hpp"

namespace indicators {

std::vector<double> closePrices(const core::TimeSeries<core::Candle>& input) {
    std::vector<double> close_prices;
    close_prices.reserve(input.size());
    for (const auto& candle : input) {
        close_prices.push_back(candle.close);
    }
    return close_prices;
}

} // namespace indicators
