// include/basis_trade/backtest/trade.hpp
#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "basis_trade/core/types.hpp"
#include "basis_trade/transaction_cost/cost_model.hpp"

namespace basis_trade {
namespace backtest {

enum class TradeStatus {
    OPEN,
    CLOSED,
    STOPPED_OUT,
    FORCED_CLOSE
};

std::string trade_status_to_string(TradeStatus status);

/**
 * @brief One long-spot / short-futures position from entry to exit
 *
 * Exit fields and realized_pnl stay empty until the engine closes the
 * trade. A closed trade is never modified again.
 */
struct Trade {
    Timestamp entry_date;
    Price entry_spot{0.0};
    Price entry_futures{0.0};
    double entry_basis{0.0};  // futures - spot at entry

    std::optional<Timestamp> exit_date;
    std::optional<Price> exit_spot;
    std::optional<Price> exit_futures;
    std::optional<double> exit_basis;

    Quantity position_size{1.0};
    double funding_cost{0.0};
    std::optional<double> realized_pnl;
    TradeStatus status{TradeStatus::OPEN};

    // Full cost breakdown computed at close
    transaction_cost::TradingCosts costs;

    /**
     * @brief Calendar days between entry and exit, 0 while open
     */
    int holding_days() const;

    /**
     * @brief Realized P&L over entry notional; empty while open
     */
    std::optional<double> return_pct() const;

    /**
     * @brief return_pct scaled to 365 days; empty for zero-day trades
     */
    std::optional<double> annualized_return() const;

    bool is_open() const {
        return status == TradeStatus::OPEN;
    }

    /**
     * @brief Flat record for export; percentages are multiplied by 100
     */
    nlohmann::json to_json() const;
};

}  // namespace backtest
}  // namespace basis_trade
