#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept> // For invalid_argument

namespace backtester {

    Portfolio::Portfolio(double initial_cash)
        : initial_cash_(initial_cash), cash_(initial_cash) {
        if (!std::isfinite(initial_cash) || initial_cash <= 0) {
            throw std::invalid_argument("Initial cash must be positive.");
        }
    }

    core::PortfolioState Portfolio::getState() const {
        core::PortfolioState state;
        state.cash = cash_;
        state.position_quantity = position_quantity_;
        state.average_entry_price = average_entry_price_;
        state.entry_index = entry_index_;
        return state;
    }

    double Portfolio::getEquity(double price) const {
        return cash_ + static_cast<double>(position_quantity_) * price;
    }

    core::EquityPoint Portfolio::markToMarket(core::Timestamp timestamp, double price) const {
        core::EquityPoint point;
        point.timestamp = timestamp;
        point.cash = cash_;
        point.position_quantity = position_quantity_;
        point.position_value = static_cast<double>(position_quantity_) * price;
        point.equity = point.cash + point.position_value;
        return point;
    }

    core::Trade Portfolio::buy(long long quantity, double price, double cost,
                               std::size_t fill_index, core::Timestamp fill_time) {
        if (quantity <= 0) {
            throw std::invalid_argument(fmt::format("Buy quantity must be positive, got {}.", quantity));
        }
        const double outlay = static_cast<double>(quantity) * price + cost;
        if (outlay > cash_) {
            throw std::invalid_argument(fmt::format("Buy of {} @ {:.4f} needs {:.2f} but only {:.2f} cash is available.",
                                                    quantity, price, outlay, cash_));
        }

        const long long new_quantity = position_quantity_ + quantity;
        average_entry_price_ = (average_entry_price_ * static_cast<double>(position_quantity_) +
                                price * static_cast<double>(quantity)) / static_cast<double>(new_quantity);
        if (position_quantity_ == 0) {
            entry_index_ = fill_index;
        }
        position_quantity_ = new_quantity;
        open_entry_costs_ += cost;
        cash_ -= outlay;
        execution_count_++;

        core::Trade trade;
        trade.fill_index = fill_index;
        trade.fill_time = fill_time;
        trade.entry_index = *entry_index_;
        trade.side = core::TradeSide::Buy;
        trade.quantity = quantity;
        trade.fill_price = price;
        trade.cost = cost;

        core::logging::getLogger()->debug("BUY  {} @ {:.4f} on {} (cost {:.2f}), cash {:.2f}, position {}",
                                          quantity, price, core::utils::timestampToString(fill_time),
                                          cost, cash_, position_quantity_);
        return trade;
    }

    core::Trade Portfolio::sell(long long quantity, double price, double cost,
                                std::size_t fill_index, core::Timestamp fill_time) {
        if (quantity <= 0 || quantity > position_quantity_) {
            throw std::invalid_argument(fmt::format("Sell quantity {} is outside (0, {}].", quantity, position_quantity_));
        }
        const double proceeds = static_cast<double>(quantity) * price - cost;
        if (cash_ + proceeds < 0.0) {
            throw std::invalid_argument(fmt::format("Sell of {} @ {:.4f} with cost {:.2f} would leave negative cash.",
                                                    quantity, price, cost));
        }

        // Entry costs are charged to sells pro rata to the quantity closed
        const double allocated_entry_cost = open_entry_costs_ *
            static_cast<double>(quantity) / static_cast<double>(position_quantity_);
        const double realized = (price - average_entry_price_) * static_cast<double>(quantity)
                                - cost - allocated_entry_cost;
        const std::size_t entry_index = entry_index_.value_or(fill_index);

        cash_ += proceeds;
        position_quantity_ -= quantity;
        open_entry_costs_ -= allocated_entry_cost;
        execution_count_++;

        core::Trade trade;
        trade.fill_index = fill_index;
        trade.fill_time = fill_time;
        trade.entry_index = entry_index;
        trade.side = core::TradeSide::Sell;
        trade.quantity = quantity;
        trade.fill_price = price;
        trade.cost = cost;
        trade.realized_pnl = realized;
        trade.holding_bars = fill_index - entry_index;

        if (position_quantity_ == 0) {
            average_entry_price_ = 0.0;
            open_entry_costs_ = 0.0;
            entry_index_.reset();
        }

        core::logging::getLogger()->debug("SELL {} @ {:.4f} on {} (cost {:.2f}), realized {:.2f}, cash {:.2f}, position {}",
                                          quantity, price, core::utils::timestampToString(fill_time),
                                          cost, realized, cash_, position_quantity_);
        return trade;
    }

} // namespace backtester
