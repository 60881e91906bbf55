#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <map>      // For named indicator values
#include <optional> // For not-yet-available indicator values and optional P&L
#include <cstddef>

namespace core {

    // Using system_clock for time points; all string conversions are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

    // An indicator value without a value means "not yet available" (still in lookback)
    using IndicatorValue = std::optional<double>;

    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // One simulation step: OHLCV plus the indicator values the signal provider attached.
    // A key that is present with no value is "not yet available"; a missing key was never supplied.
    struct Bar : public Candle {
        std::map<std::string, IndicatorValue> indicators;

        bool hasIndicator(const std::string& name) const;
        // Returns the value, or nullopt when the indicator is missing or not yet available
        IndicatorValue indicator(const std::string& name) const;
    };

    enum class ActionType {
        Hold,
        Buy,
        Sell
    };

    // Decision produced by a strategy for one bar.
    // Buy:  fraction = share of current cash to commit, nullopt = engine sizing policy.
    // Sell: fraction = share of the position to sell in (0, 1], nullopt = ALL.
    struct Action {
        ActionType type = ActionType::Hold;
        std::optional<double> fraction;
        std::string reason;

        static Action hold();
        static Action buy(std::string reason = "", std::optional<double> fraction = std::nullopt);
        static Action sell(std::string reason = "", std::optional<double> fraction = std::nullopt);

        bool isHold() const { return type == ActionType::Hold; }
    };

    // Read-only view of the simulated account handed to strategies.
    struct PortfolioState {
        double cash = 0.0;
        long long position_quantity = 0;      // Shares held, never negative (no shorting)
        double average_entry_price = 0.0;     // Price-only average, excludes costs
        std::optional<std::size_t> entry_index; // Bar where the open position was entered

        bool isFlat() const { return position_quantity == 0; }
        double marketValue(double price) const { return static_cast<double>(position_quantity) * price; }
        double unrealizedPnl(double price) const {
            return static_cast<double>(position_quantity) * (price - average_entry_price);
        }
    };

    enum class TradeSide {
        Buy,
        Sell
    };

    // One executed order. Sells carry realized P&L; buys do not.
    struct Trade {
        std::size_t signal_index = 0;  // Bar on which the decision was taken
        Timestamp signal_time;
        std::size_t fill_index = 0;    // Bar on which the order was filled
        Timestamp fill_time;
        std::size_t entry_index = 0;   // For sells: bar where the position was opened
        TradeSide side = TradeSide::Buy;
        long long quantity = 0;
        double fill_price = 0.0;
        double cost = 0.0;             // Transaction cost of this execution
        std::optional<double> realized_pnl;
        std::optional<std::size_t> holding_bars;
        std::string reason;
    };

    enum class RejectionReason {
        NoPosition,       // Sell while flat
        InvalidFraction,  // Fraction outside (0, 1]
        InsufficientCash, // Buy that cannot afford a single share (or the fixed quantity)
        ZeroQuantity,     // Sell fraction rounds down to zero shares
        NoFillBar         // Decision on the final bar, nothing left to fill on
    };

    // An action the portfolio could not honour. Logged, never executed.
    struct RejectedAction {
        std::size_t bar_index = 0;
        Timestamp timestamp;
        Action action;
        RejectionReason reason = RejectionReason::NoPosition;
        std::string message;
    };

    struct TradeLog {
        std::vector<Trade> trades;
        std::vector<RejectedAction> rejected;
    };

    // Equity snapshot taken at each bar's close
    struct EquityPoint {
        Timestamp timestamp;
        double cash = 0.0;
        long long position_quantity = 0;
        double position_value = 0.0;
        double equity = 0.0;   // cash + position_value
    };

    using EquityCurve = TimeSeries<EquityPoint>;

    std::string toString(ActionType type);
    std::string toString(TradeSide side);
    std::string toString(RejectionReason reason);

} // namespace core
