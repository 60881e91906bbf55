#include "rsi_indicator.hpp" // Use short path
#include "exceptions.hpp"    // Use short path
#include "logging.hpp"     // Use short path
#include "ta_libc.h"  // TA-Lib C API header
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RsiIndicator::RsiIndicator(int period, std::string output_name)
    : period_(period), lookback_(0), output_name_(std::move(output_name)) {
    if (period_ <= 0) {
         throw std::invalid_argument("RSI period must be positive.");
    }
    if (output_name_.empty()) {
         throw std::invalid_argument("RSI output name cannot be empty.");
    }

    // Determine the lookback period required by TA-Lib
    lookback_ = TA_RSI_Lookback(period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_RSI_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("RSI({})", period_);
    core::logging::getLogger()->debug("RsiIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string RsiIndicator::getName() const {
    return name_;
}

int RsiIndicator::getLookback() const {
    return lookback_;
}

const IndicatorOutputs& RsiIndicator::getResults() const {
    return results_;
}

void RsiIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    // Check input size
    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        results_[output_name_] = {};
        return;
    }

    std::vector<double> close_prices = closePrices(input);

    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    core::TimeSeries<double> values(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_RSI(
        0,                                     // startIdx
        static_cast<int>(close_prices.size()) - 1, // endIdx
        close_prices.data(),                   // Pointer to input data
        period_,                               // optInTimePeriod
        &out_begin_idx,                        // outBegIdx
        &out_nb_element,                       // outNbElement
        values.data()                          // outReal: Pointer to output buffer
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_RSI output for {} is misaligned: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    results_[output_name_] = std::move(values);
    logger->trace("Successfully calculated {} results for {}", output_size, name_);
}

} // namespace indicators
