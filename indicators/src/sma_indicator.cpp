#include "sma_indicator.hpp"
#include "exceptions.hpp"   // For IndicatorCalculationException
#include "logging.hpp"    // For logging errors
#include "ta_libc.h"            // Include TA-Lib C API header
#include <vector>
#include <stdexcept>                   // For std::runtime_error
#include <spdlog/fmt/fmt.h>

namespace indicators {

SmaIndicator::SmaIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw std::invalid_argument("SMA period must be positive.");
    }

    // Determine the lookback period required by TA-Lib for this period
    lookback_ = TA_MA_Lookback(period_, TA_MAType_SMA); // Use TA_MAType_SMA for simple moving average
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("SMA({})", period_);
    output_name_ = fmt::format("SMA_{}", period_);
    core::logging::getLogger()->debug("SmaIndicator created: Name='{}', Period={}, Lookback={}", name_, period_, lookback_);
}

std::string SmaIndicator::getName() const {
    return name_;
}

int SmaIndicator::getLookback() const {
    return lookback_;
}

const IndicatorOutputs& SmaIndicator::getResults() const {
    return results_;
}

void SmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear(); // Clear previous results

    // Check if input size is sufficient
    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        results_[output_name_] = {};
        return; // Not enough data to calculate anything
    }

    std::vector<double> close_prices = closePrices(input);

    // TA-Lib output size = input size - lookback
    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    core::TimeSeries<double> values(static_cast<size_t>(output_size));

    int out_begin_idx = 0; // Index of the first valid output element relative to input
    int out_nb_element = 0; // Number of elements calculated

    TA_RetCode ret_code = TA_MA(
        0,                                     // startIdx: Start from the beginning of the input array
        static_cast<int>(close_prices.size()) - 1, // endIdx: Process up to the last element
        close_prices.data(),                   // Pointer to input data (closing prices)
        period_,                               // optInTimePeriod: The period for SMA
        TA_MAType_SMA,                         // optInMAType: Specify Simple Moving Average
        &out_begin_idx,                        // outBegIdx: Index of the first output candle
        &out_nb_element,                       // outNbElement: Number of output elements calculated
        values.data()                          // outReal: Pointer to the output buffer
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA output for {} is misaligned: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    results_[output_name_] = std::move(values);
    logger->trace("Successfully calculated {} results for {}", output_size, name_);
}

} // namespace indicators
