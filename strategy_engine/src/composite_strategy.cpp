#include "composite_strategy.hpp"
#include "builtin_strategies.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <set>
#include <stdexcept>

namespace strategy_engine {

CompositeStrategy::CompositeStrategy(std::string name,
                                     std::vector<Component> components,
                                     double buy_threshold,
                                     double sell_threshold)
    : name_(std::move(name)),
      components_(std::move(components)),
      buy_threshold_(buy_threshold),
      sell_threshold_(sell_threshold)
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    if (components_.empty()) {
        throw std::invalid_argument(fmt::format("Composite strategy '{}' needs at least one component.", name_));
    }
    if (!std::isfinite(buy_threshold_) || buy_threshold_ <= 0.0 ||
        !std::isfinite(sell_threshold_) || sell_threshold_ <= 0.0) {
        throw std::invalid_argument(fmt::format("Composite strategy '{}' thresholds must be positive.", name_));
    }

    std::set<std::string> seen;
    for (const auto& component : components_) {
        if (!component.strategy) {
            throw std::invalid_argument(fmt::format("Composite strategy '{}' has a null component.", name_));
        }
        if (!std::isfinite(component.weight) || component.weight <= 0.0) {
            throw std::invalid_argument(fmt::format("Component '{}' of '{}' must have a positive weight.",
                                                    component.strategy->getName(), name_));
        }
        for (const auto& indicator_name : component.strategy->getRequiredIndicatorNames()) {
            if (seen.insert(indicator_name).second) {
                required_indicator_names_.push_back(indicator_name);
            }
        }
    }
}

core::Action CompositeStrategy::decide(const HistoryView& history, const core::PortfolioState& state) const {
    double buy_score = 0.0;
    double sell_score = 0.0;
    std::vector<std::string> buy_voters;
    std::vector<std::string> sell_voters;

    for (const auto& component : components_) {
        core::Action vote = component.strategy->decide(history, state);
        if (vote.type == core::ActionType::Buy) {
            buy_score += component.weight;
            buy_voters.push_back(component.strategy->getName());
        } else if (vote.type == core::ActionType::Sell) {
            sell_score += component.weight;
            sell_voters.push_back(component.strategy->getName());
        }
    }

    const bool buy_eligible = buy_score > 0.0 && buy_score >= buy_threshold_;
    const bool sell_eligible = sell_score > 0.0 && sell_score >= sell_threshold_;

    core::logging::getLogger()->trace("Composite '{}' on bar {}: buy {:.4f}, sell {:.4f}",
                                      name_, history.currentIndex(), buy_score, sell_score);

    if (buy_eligible && (!sell_eligible || buy_score > sell_score)) {
        return core::Action::buy(fmt::format("vote buy {:.2f} ({})", buy_score, fmt::join(buy_voters, ", ")));
    }
    if (sell_eligible && (!buy_eligible || sell_score > buy_score)) {
        return core::Action::sell(fmt::format("vote sell {:.2f} ({})", sell_score, fmt::join(sell_voters, ", ")));
    }
    return core::Action::hold();
}

std::unique_ptr<CompositeStrategy> makeComboStrategy(std::string name,
                                                     double buy_threshold,
                                                     double sell_threshold) {
    std::vector<CompositeStrategy::Component> components;
    components.push_back({std::make_unique<RsiReversionStrategy>(), 0.25});
    components.push_back({std::make_unique<MovingAverageCrossStrategy>(), 0.35});
    components.push_back({std::make_unique<MacdCrossStrategy>(), 0.25});
    components.push_back({std::make_unique<BollingerBandStrategy>(), 0.15});
    return std::make_unique<CompositeStrategy>(std::move(name), std::move(components),
                                               buy_threshold, sell_threshold);
}

} // namespace strategy_engine
