// src/backtest/backtest_metrics_calculator.cpp
#include "basis_trade/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace basis_trade {
namespace backtest {

// ========== Return Calculations ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].second;
        if (prev > 0.0) {
            returns.push_back((equity_curve[i].second - prev) / prev);
        }
    }
    return returns;
}

// ========== Risk-Adjusted Return Metrics ==========

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                         double periods_per_year) const {
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean_return = calculate_mean(returns);
    double std_dev = calculate_std_dev(returns, mean_return);
    if (std_dev <= 0.0) {
        return 0.0;
    }

    return mean_return / std_dev * std::sqrt(periods_per_year);
}

// ========== Drawdown Metrics ==========

std::vector<std::pair<Timestamp, double>> BacktestMetricsCalculator::calculate_drawdowns(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    std::vector<std::pair<Timestamp, double>> drawdowns;
    drawdowns.reserve(equity_curve.size());

    if (equity_curve.empty()) {
        return drawdowns;
    }

    double peak = equity_curve[0].second;

    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        double drawdown = (equity < peak && peak > 0.0) ? (peak - equity) / peak : 0.0;
        drawdowns.emplace_back(timestamp, drawdown);
    }

    return drawdowns;
}

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    auto drawdowns = calculate_drawdowns(equity_curve);
    if (drawdowns.empty()) {
        return 0.0;
    }

    auto max_it = std::max_element(drawdowns.begin(), drawdowns.end(),
                                   [](const auto& a, const auto& b) { return a.second < b.second; });
    return max_it->second;
}

// ========== Trade Statistics ==========

BacktestMetricsCalculator::TradeStatistics BacktestMetricsCalculator::calculate_trade_statistics(
    const std::vector<Trade>& trades) const {
    TradeStatistics stats;
    stats.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return stats;
    }

    std::vector<double> win_returns;
    std::vector<double> loss_returns;
    double holding_sum = 0.0;

    for (const auto& trade : trades) {
        holding_sum += trade.holding_days();
        if (!trade.realized_pnl) {
            continue;
        }
        const double pnl = *trade.realized_pnl;
        const double ret = trade.return_pct().value_or(0.0);
        if (pnl > 0.0) {
            win_returns.push_back(ret);
            stats.total_profit += pnl;
        } else if (pnl < 0.0) {
            loss_returns.push_back(ret);
            stats.total_loss += pnl;
        }
    }

    stats.winning_trades = static_cast<int>(win_returns.size());
    stats.losing_trades = static_cast<int>(loss_returns.size());
    stats.avg_win = calculate_mean(win_returns);
    stats.avg_loss = calculate_mean(loss_returns);
    stats.avg_holding_days = holding_sum / static_cast<double>(trades.size());
    return stats;
}

// ========== Composite Calculation ==========

void BacktestMetricsCalculator::populate_metrics(BacktestResult& result) const {
    TradeStatistics stats = calculate_trade_statistics(result.trades);
    result.total_trades = stats.total_trades;
    result.winning_trades = stats.winning_trades;
    result.losing_trades = stats.losing_trades;
    result.avg_win = stats.avg_win;
    result.avg_loss = stats.avg_loss;

    if (result.total_trades == 0 || result.equity_curve.empty()) {
        result.total_return = 0.0;
        result.max_drawdown = 0.0;
        result.sharpe_ratio = 0.0;
        return;
    }

    result.total_return = calculate_total_return(result.equity_curve.front().second,
                                                 result.equity_curve.back().second);
    result.max_drawdown = calculate_max_drawdown(result.equity_curve);
    result.sharpe_ratio = calculate_sharpe_ratio(calculate_returns_from_equity(result.equity_curve));
}

// ========== Helper Methods ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace backtest
}  // namespace basis_trade
