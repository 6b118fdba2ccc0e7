// include/basis_trade/backtest/backtest_result.hpp
#pragma once

#include <optional>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "basis_trade/backtest/trade.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace backtest {

/**
 * @brief Outcome of one backtest run
 * Fully populated by BacktestEngine::run(); all fractions are decimals.
 */
struct BacktestResult {
    std::vector<Trade> trades;

    // Performance metrics
    double total_return{0.0};
    double max_drawdown{0.0};
    double sharpe_ratio{0.0};

    // Trading metrics
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    double avg_win{0.0};   // mean return_pct of winners
    double avg_loss{0.0};  // mean return_pct of losers (negative)

    std::optional<Timestamp> start_date;
    std::optional<Timestamp> end_date;
    double initial_capital{200000.0};

    // Starts at initial_capital, one point per trade closed before the end of data
    std::vector<std::pair<Timestamp, double>> equity_curve;

    double win_rate() const {
        return total_trades == 0 ? 0.0 : static_cast<double>(winning_trades) / total_trades;
    }

    /**
     * @brief |avg_win / avg_loss|, +infinity when there are no meaningful losses
     */
    double profit_factor() const;

    double final_capital() const {
        return initial_capital * (1.0 + total_return);
    }

    /**
     * @brief {"summary": {...}, "trades": [...]} with percentages scaled by 100
     * Non-finite values are written as null.
     */
    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace basis_trade
