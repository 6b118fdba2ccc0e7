// include/basis_trade/optimization/grid_search_optimizer.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "basis_trade/backtest/backtest_engine.hpp"
#include "basis_trade/backtest/backtest_result.hpp"
#include "basis_trade/core/config_base.hpp"
#include "basis_trade/core/error.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace optimization {

/**
 * @brief Largest raw grid (entry x stop x exit x holding values, before the
 * threshold-order filter) a configuration may describe
 *
 * Every combination is a full backtest held in memory; the default grid is 2700.
 */
constexpr std::size_t MAX_GRID_COMBINATIONS = 1000000;

/**
 * @brief Configuration for the threshold grid search
 */
struct GridSearchConfig : public ConfigBase {
    // Entry threshold range
    double entry_min;
    double entry_max;
    double entry_step;

    // Stop-loss threshold range
    double stop_min;
    double stop_max;
    double stop_step;

    // Exit threshold range
    double exit_min;
    double exit_max;
    double exit_step;

    std::vector<int> holding_values;

    size_t top_n;        // Number of ranked combinations to report
    size_t max_threads;  // 0 = hardware concurrency

    // Held fixed across the grid
    double account_size;
    double funding_cost_annual;
    double strong_entry_threshold;

    GridSearchConfig()
        : entry_min(0.002),
          entry_max(0.020),
          entry_step(0.002),
          stop_min(0.001),
          stop_max(0.005),
          stop_step(0.001),
          exit_min(0.020),
          exit_max(0.060),
          exit_step(0.005),
          holding_values{10, 20, 30, 40, 50, 60},
          top_n(20),
          max_threads(0),
          account_size(200000.0),
          funding_cost_annual(0.05),
          strong_entry_threshold(0.01) {}

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief INVALID_ARGUMENT for a non-positive step, min > max, no or
     * non-positive holding periods, or non-positive account size
     */
    Result<void> validate() const override;
};

/**
 * @brief One point of the search grid
 * Defaults are the baseline strategy parameters.
 */
struct ParameterSet {
    double entry_threshold = 0.005;
    double stop_loss_threshold = 0.002;
    double exit_threshold = 0.035;
    int holding_days = 30;

    nlohmann::json to_json() const;
};

/**
 * @brief Backtest outcome of one ParameterSet
 */
struct ParameterScore {
    ParameterSet params;
    double total_return = 0.0;
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
};

struct GridSearchResult {
    // Every evaluated combination, best total_return first
    std::vector<ParameterScore> ranked;

    // First top_n ranked combinations with at least one trade
    std::vector<ParameterScore> top;

    std::optional<ParameterScore> best;

    // Default parameters, for comparison
    backtest::BacktestResult baseline;
};

/**
 * @brief Inclusive float range rounded to 6 decimals
 * Values are generated while value <= stop + step / 10. Empty if step <= 0.
 */
std::vector<double> frange(double start, double stop, double step);

/**
 * @brief Brute-force search over entry, stop-loss, exit and holding period
 *
 * Combinations with entry <= stop or exit <= entry are discarded before
 * scoring. Surviving combinations are backtested on a pool of worker
 * threads sharing the read-only observations; each combination's score
 * lands in its own preallocated slot.
 */
class GridSearchOptimizer {
public:
    explicit GridSearchOptimizer(GridSearchConfig config = GridSearchConfig());

    Result<void> validate_config() const;

    /**
     * @brief All valid combinations in entry, stop, exit, holding order
     */
    std::vector<ParameterSet> generate_grid() const;

    /**
     * @brief Score every combination and rank by total return
     * @return INVALID_ARGUMENT for an invalid configuration or no observations
     */
    Result<GridSearchResult> optimize(const std::vector<Observation>& observations) const;

    /**
     * @brief Backtest a single parameter set with this optimizer's fixed settings
     */
    backtest::BacktestResult evaluate(const std::vector<Observation>& observations,
                                      const ParameterSet& params) const;

    backtest::BacktestConfig make_backtest_config(const ParameterSet& params) const;

    /**
     * @brief Write the best parameter set as JSON
     * @return DATA_NOT_FOUND when no combination produced a trade
     */
    static Result<void> save_best_params(const GridSearchResult& result,
                                         const std::string& filepath);

    /**
     * @brief Write the top combinations as CSV
     */
    static Result<void> save_rankings_csv(const GridSearchResult& result,
                                          const std::string& filepath);

    const GridSearchConfig& config() const {
        return config_;
    }

private:
    GridSearchConfig config_;

    size_t worker_count(size_t jobs) const;
};

}  // namespace optimization
}  // namespace basis_trade
