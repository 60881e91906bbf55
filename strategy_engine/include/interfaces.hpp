#pragma once

#include <vector>
#include <string>
#include <memory> // For std::unique_ptr
#include <cstddef>

#include "datatypes.hpp" // Provides Bar, Action, PortfolioState, TimeSeries etc.

namespace strategy_engine {

    // --- HistoryView ---
    // Causally restricted window over the bar sequence: only bars [0, size()) are reachable.
    // The engine builds one per step with size() == t + 1, so a strategy deciding on bar t
    // cannot index past it.
    class HistoryView {
    public:
        HistoryView(const core::TimeSeries<core::Bar>& bars, std::size_t visible_count);

        std::size_t size() const { return visible_count_; }
        bool empty() const { return visible_count_ == 0; }

        // Bounds-checked against the visible window, throws std::out_of_range
        const core::Bar& at(std::size_t index) const;

        // Last visible bar (the bar being decided on)
        const core::Bar& current() const;
        std::size_t currentIndex() const;

        // Bar before current(), nullptr when current() is the first bar
        const core::Bar* previous() const;

    private:
        const core::TimeSeries<core::Bar>* bars_;
        std::size_t visible_count_;
    };

    // --- Condition Interface ---
    // Represents a single logical condition (e.g., price > SMA, RSI < 30)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        // False whenever a needed value is not yet available
        virtual bool evaluate(const HistoryView& history) const = 0;
        virtual std::string describe() const = 0;
        // Indicator names this condition reads
        virtual void collectIndicatorNames(std::vector<std::string>& names) const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit rule: a condition and the action it triggers
    class IRule {
    public:
        virtual ~IRule() = default;
        // Returns the rule's action when triggered, HOLD otherwise
        virtual core::Action evaluate(const HistoryView& history) const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
        virtual const ICondition& getCondition() const = 0;
    };

    // --- Strategy Interface ---
    // Pure decision function over the visible history and the current portfolio state.
    // Implementations hold only immutable configuration; decide() must be deterministic.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual std::string getName() const = 0;

        // Indicator keys every bar must carry for this strategy (validated by the engine)
        virtual const std::vector<std::string>& getRequiredIndicatorNames() const = 0;

        virtual core::Action decide(const HistoryView& history, const core::PortfolioState& state) const = 0;
    };

} // namespace strategy_engine
