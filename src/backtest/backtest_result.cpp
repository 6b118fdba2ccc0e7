// src/backtest/backtest_result.cpp
#include "basis_trade/backtest/backtest_result.hpp"
#include <cmath>
#include <limits>
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace backtest {

namespace {

nlohmann::json finite_or_null(double value) {
    return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json();
}

nlohmann::json date_or_null(const std::optional<Timestamp>& date) {
    return date ? nlohmann::json(core::format_date(*date)) : nlohmann::json();
}

}  // namespace

double BacktestResult::profit_factor() const {
    if (std::abs(avg_loss) < 0.0001) {
        return std::numeric_limits<double>::infinity();
    }
    return std::abs(avg_win / avg_loss);
}

nlohmann::json BacktestResult::to_json() const {
    nlohmann::json summary;
    summary["initial_capital"] = initial_capital;
    summary["final_capital"] = final_capital();
    summary["total_return"] = total_return * 100.0;
    summary["total_trades"] = total_trades;
    summary["winning_trades"] = winning_trades;
    summary["losing_trades"] = losing_trades;
    summary["win_rate"] = win_rate() * 100.0;
    summary["avg_win"] = avg_win * 100.0;
    summary["avg_loss"] = avg_loss * 100.0;
    summary["profit_factor"] = finite_or_null(profit_factor());
    summary["max_drawdown"] = max_drawdown * 100.0;
    summary["sharpe_ratio"] = sharpe_ratio;
    summary["start_date"] = date_or_null(start_date);
    summary["end_date"] = date_or_null(end_date);

    nlohmann::json trade_list = nlohmann::json::array();
    for (const auto& trade : trades) {
        trade_list.push_back(trade.to_json());
    }

    nlohmann::json j;
    j["summary"] = summary;
    j["trades"] = trade_list;
    return j;
}

}  // namespace backtest
}  // namespace basis_trade
