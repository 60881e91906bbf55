// backtester/include/portfolio.hpp
#pragma once

#include <cstddef>
#include <optional>

// Use short paths
#include "datatypes.hpp" // Provides core::Timestamp, core::Trade, core::PortfolioState

namespace backtester {

    // --- Portfolio Class Definition ---
    // Cash and a single long position, owned by one backtest run.
    // Callers size orders first; buy()/sell() only guard the invariants
    // (cash >= 0, 0 <= sold quantity <= position) and throw std::invalid_argument on violation.
    class Portfolio {
    public:
        explicit Portfolio(double initial_cash);

        // --- Getters ---
        double getInitialCash() const { return initial_cash_; }
        double getCash() const { return cash_; }
        long long getPositionQuantity() const { return position_quantity_; }
        double getAverageEntryPrice() const { return average_entry_price_; }
        std::optional<std::size_t> getEntryIndex() const { return entry_index_; }
        int getTotalExecutions() const { return execution_count_; }

        core::PortfolioState getState() const;
        double getEquity(double price) const;

        // Snapshot for the equity curve, valued at the given (close) price
        core::EquityPoint markToMarket(core::Timestamp timestamp, double price) const;

        // --- Modifiers ---
        // Returns the executed trade; the caller fills in signal bar and reason.
        core::Trade buy(long long quantity, double price, double cost,
                        std::size_t fill_index, core::Timestamp fill_time);
        core::Trade sell(long long quantity, double price, double cost,
                         std::size_t fill_index, core::Timestamp fill_time);

    private:
        double initial_cash_;
        double cash_;
        long long position_quantity_ = 0;
        double average_entry_price_ = 0.0;      // Price only, costs excluded
        double open_entry_costs_ = 0.0;         // Buy costs not yet charged to a sell
        std::optional<std::size_t> entry_index_;
        int execution_count_ = 0;
    };

} // namespace backtester
