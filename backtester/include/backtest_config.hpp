#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    using json = nlohmann::json;

    enum class CostModel {
        None,
        FixedFee,      // Flat fee per execution
        Proportional,  // Rate applied to the traded notional (commission / spread)
        Both
    };

    // Both policies fill a decision taken on bar t on bar t+1
    enum class FillPolicy {
        NextOpen,   // Open of the next bar
        SameClose   // Close of the bar the order executes on (t+1), never the signal bar
    };

    enum class SizingPolicy {
        FixedFraction, // sizing_fraction of current cash
        AllIn,         // All current cash
        FixedQuantity  // Exactly fixed_quantity shares
    };

    // --- BacktestConfig ---
    // Immutable run configuration. validate() raises core::ConfigurationException.
    struct BacktestConfig {
        double initial_cash = 1000000.0;
        CostModel cost_model = CostModel::None;
        double fixed_fee = 0.0;
        double proportional_rate = 0.0;
        FillPolicy fill_policy = FillPolicy::NextOpen;
        SizingPolicy sizing_policy = SizingPolicy::FixedFraction;
        double sizing_fraction = 0.95;
        long long fixed_quantity = 0;
        bool close_at_end = false;

        // Analyzer settings carried with the run
        double risk_free_rate = 0.001; // Annual
        double periods_per_year = 252.0;

        void validate() const;

        // Transaction cost for a given traded notional under the configured model
        double transactionCost(double notional) const;

        // Fields missing from the JSON keep their defaults
        static BacktestConfig fromJson(const json& config);
        json toJson() const;
    };

    std::string toString(CostModel model);
    std::string toString(FillPolicy policy);
    std::string toString(SizingPolicy policy);

    CostModel costModelFromString(const std::string& text);
    FillPolicy fillPolicyFromString(const std::string& text);
    SizingPolicy sizingPolicyFromString(const std::string& text);

} // namespace backtester
