#include "macd_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdIndicator::MacdIndicator(int fast_period, int slow_period, int signal_period)
    : fast_period_(fast_period), slow_period_(slow_period), signal_period_(signal_period), lookback_(0) {
    if (fast_period_ <= 0 || slow_period_ <= 0 || signal_period_ <= 0) {
         throw std::invalid_argument("MACD periods must be positive.");
    }
    if (fast_period_ >= slow_period_) {
         throw std::invalid_argument(fmt::format("MACD fast period {} must be shorter than slow period {}.",
                                                 fast_period_, slow_period_));
    }

    lookback_ = TA_MACD_Lookback(fast_period_, slow_period_, signal_period_);
    if (lookback_ < 0) {
         throw std::runtime_error(fmt::format("TA_MACD_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("MACD({},{},{})", fast_period_, slow_period_, signal_period_);
    core::logging::getLogger()->debug("MacdIndicator created: Name='{}', Lookback={}", name_, lookback_);
}

std::string MacdIndicator::getName() const {
    return name_;
}

int MacdIndicator::getLookback() const {
    return lookback_;
}

const IndicatorOutputs& MacdIndicator::getResults() const {
    return results_;
}

void MacdIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        results_[kMacd] = {};
        results_[kSignal] = {};
        results_[kHistogram] = {};
        return;
    }

    std::vector<double> close_prices = closePrices(input);

    const int output_size = static_cast<int>(close_prices.size()) - lookback_;
    core::TimeSeries<double> macd(static_cast<size_t>(output_size));
    core::TimeSeries<double> signal(static_cast<size_t>(output_size));
    core::TimeSeries<double> histogram(static_cast<size_t>(output_size));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MACD(
        0,
        static_cast<int>(close_prices.size()) - 1,
        close_prices.data(),
        fast_period_,
        slow_period_,
        signal_period_,
        &out_begin_idx,
        &out_nb_element,
        macd.data(),
        signal.data(),
        histogram.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MACD failed for {} with code {}", name_, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MACD output for {} is misaligned: begin {} (expected {}), count {} (expected {})",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    results_[kMacd] = std::move(macd);
    results_[kSignal] = std::move(signal);
    results_[kHistogram] = std::move(histogram);
    logger->trace("Successfully calculated {} results for {}", output_size, name_);
}

} // namespace indicators
