// include/basis_trade/backtest/backtest_engine.hpp
#pragma once

#include <vector>
#include "basis_trade/backtest/backtest_metrics_calculator.hpp"
#include "basis_trade/backtest/backtest_result.hpp"
#include "basis_trade/backtest/trade.hpp"
#include "basis_trade/core/config_base.hpp"
#include "basis_trade/core/types.hpp"
#include "basis_trade/strategy/signal_generator.hpp"
#include "basis_trade/transaction_cost/cost_model.hpp"

namespace basis_trade {
namespace backtest {

/**
 * @brief Configuration for a basis trade backtest
 * All fractions are decimals; thresholds are monthly basis levels.
 */
struct BacktestConfig : public ConfigBase {
    double account_size = 200000.0;
    double funding_cost_annual = 0.05;

    // Signal thresholds
    double entry_threshold = 0.005;
    double stop_loss_threshold = 0.002;
    double exit_threshold = 0.035;
    double strong_entry_threshold = 0.01;

    int holding_days = 30;

    // Net P&L (gross less itemized costs) instead of gross less funding
    bool include_transaction_costs = false;
    bool use_etf = true;
    double etf_expense_ratio_annual = 0.0025;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief INVALID_ARGUMENT for non-positive capital or holding limit,
     * or negative rates and thresholds
     */
    Result<void> validate() const override;

    strategy::SignalThresholds to_signal_thresholds() const;
    transaction_cost::CostModel::Config to_cost_config() const;
};

/**
 * @brief Single-position basis trade simulator
 *
 * Walks the observations in input order. While flat, a strong or
 * acceptable entry signal opens one unit long spot / short futures. While
 * in a position, a stop loss, a full exit or reaching the holding limit
 * closes it, and the same observation may then open a new position. A
 * position still open after the last observation is force-closed there.
 *
 * run() never fails: empty input yields an empty result.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config = BacktestConfig());

    BacktestResult run(const std::vector<Observation>& observations) const;

    const BacktestConfig& config() const {
        return config_;
    }

private:
    BacktestConfig config_;
    strategy::SignalGenerator signal_generator_;
    transaction_cost::CostModel cost_model_;
    BacktestMetricsCalculator metrics_calculator_;

    Trade open_trade(const Observation& obs) const;

    /**
     * @brief Fill exit fields, costs and realized P&L of an open trade
     */
    void close_trade(Trade& trade, const Observation& obs, TradeStatus status) const;
};

}  // namespace backtest
}  // namespace basis_trade
