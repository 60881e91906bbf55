#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <cmath>
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

BollingerIndicator::BollingerIndicator(int period, double num_std_dev)
    : period_(period), num_std_dev_(num_std_dev), lookback_(0) {
    if (period_ <= 1) {
         throw std::invalid_argument("Bollinger period must be at least 2.");
    }
    if (!std::isfinite(num_std_dev_) || num_std_dev_ <= 0.0) {
         throw std::invalid_argument("Bollinger band width must be positive.");
    }

    lookback_ = TA_BBANDS_Lookback(period_, num_std_dev_, num_std_dev_, TA_MAType_SMA);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("BBANDS({},{})", period_, num_std_dev_);
    core::logging::getLogger()->debug("BollingerIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string BollingerIndicator::getName() const {
    return name_;
}

int BollingerIndicator::getLookback() const {
    return lookback_;
}

const IndicatorOutputs& BollingerIndicator::getResults() const {
    return results_;
}

void BollingerIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        results_[kUpper] = {};
        results_[kMiddle] = {};
        results_[kLower] = {};
        return;
    }

    std::vector<double> close_prices = closePrices(input);

    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    core::TimeSeries<double> upper(static_cast<size_t>(output_size));
    core::TimeSeries<double> middle(static_cast<size_t>(output_size));
    core::TimeSeries<double> lower(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_BBANDS(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        period_,
        num_std_dev_,      // optInNbDevUp
        num_std_dev_,      // optInNbDevDn
        TA_MAType_SMA,
        &out_begin_idx,
        &out_nb_element,
        upper.data(),
        middle.data(),
        lower.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS output for {} is misaligned: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    results_[kUpper] = std::move(upper);
    results_[kMiddle] = std::move(middle);
    results_[kLower] = std::move(lower);
    logger->trace("Successfully calculated {} results for {}", output_size, name_);
}

} // namespace indicators
