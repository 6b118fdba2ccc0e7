// include/basis_trade/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <utility>
#include <vector>
#include "basis_trade/backtest/backtest_result.hpp"
#include "basis_trade/backtest/trade.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace backtest {

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * The equity curve holds one point for the initial capital followed by one
 * point per trade closed inside the data range, so its "returns" are
 * trade-to-trade returns rather than calendar-daily returns.
 *
 * All methods are const, do no logging and never throw; degenerate input
 * (empty curves, zero capital, fewer than two samples) yields 0.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Return Calculations ==========

    /**
     * @brief (end - start) / start, or 0 when start <= 0
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Point-to-point returns of an equity curve
     * Points following a non-positive equity value are skipped.
     */
    std::vector<double> calculate_returns_from_equity(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief mean / sample stdev * sqrt(periods_per_year)
     * @return 0 with fewer than two returns or zero variance
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double periods_per_year = 365.0) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Drawdown from the running peak at each point, as a decimal
     */
    std::vector<std::pair<Timestamp, double>> calculate_drawdowns(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    double calculate_max_drawdown(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Trade Statistics ==========

    struct TradeStatistics {
        int total_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double avg_win = 0.0;
        double avg_loss = 0.0;
        double total_profit = 0.0;
        double total_loss = 0.0;
        double avg_holding_days = 0.0;
    };

    /**
     * @brief Win/loss counts and mean return_pct per bucket
     * Trades with zero or missing P&L belong to neither bucket.
     */
    TradeStatistics calculate_trade_statistics(const std::vector<Trade>& trades) const;

    // ========== Composite Calculation ==========

    /**
     * @brief Fill the metric fields of `result` from its trades and equity curve
     */
    void populate_metrics(BacktestResult& result) const;

private:
    double calculate_mean(const std::vector<double>& values) const;

    /**
     * @brief Sample standard deviation (n - 1 denominator)
     */
    double calculate_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace backtest
}  // namespace basis_trade
