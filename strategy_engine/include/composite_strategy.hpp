#pragma once

#include "interfaces.hpp"
#include <string>
#include <vector>
#include <memory>

namespace strategy_engine {

    // --- CompositeStrategy ---
    // Weighted vote over component strategies. Every component decides on the same history
    // and state; BUY votes add to the buy score and SELL votes to the sell score.
    // A side is eligible once its score reaches its threshold. When both sides are eligible
    // the higher score wins, and an exact tie yields HOLD.
    class CompositeStrategy : public IStrategy {
    public:
        struct Component {
            std::unique_ptr<IStrategy> strategy;
            double weight = 0.0;
        };

        CompositeStrategy(std::string name,
                          std::vector<Component> components,
                          double buy_threshold,
                          double sell_threshold);

        virtual ~CompositeStrategy() override = default;

        std::string getName() const override { return name_; }
        const std::vector<std::string>& getRequiredIndicatorNames() const override { return required_indicator_names_; }
        core::Action decide(const HistoryView& history, const core::PortfolioState& state) const override;

        std::size_t componentCount() const { return components_.size(); }
        double getBuyThreshold() const { return buy_threshold_; }
        double getSellThreshold() const { return sell_threshold_; }

    private:
        std::string name_;
        std::vector<Component> components_;
        double buy_threshold_;
        double sell_threshold_;
        std::vector<std::string> required_indicator_names_;
    };

    // The dashboard's "combo" preset: rsi 0.25, ma_cross 0.35, macd 0.25, bollinger 0.15, thresholds 0.4
    std::unique_ptr<CompositeStrategy> makeComboStrategy(std::string name = "combo",
                                                         double buy_threshold = 0.4,
                                                         double sell_threshold = 0.4);

} // namespace strategy_engine
