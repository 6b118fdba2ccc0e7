// src/backtest/trade.cpp
#include "basis_trade/backtest/trade.hpp"
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace backtest {

std::string trade_status_to_string(TradeStatus status) {
    switch (status) {
        case TradeStatus::OPEN:
            return "open";
        case TradeStatus::CLOSED:
            return "closed";
        case TradeStatus::STOPPED_OUT:
            return "stopped_out";
        case TradeStatus::FORCED_CLOSE:
            return "forced_close";
        default:
            return "unknown";
    }
}

int Trade::holding_days() const {
    if (!exit_date) {
        return 0;
    }
    return static_cast<int>(core::days_between(entry_date, *exit_date));
}

std::optional<double> Trade::return_pct() const {
    if (!realized_pnl) {
        return std::nullopt;
    }
    const double notional = entry_spot * position_size;
    if (notional == 0.0) {
        return 0.0;
    }
    return *realized_pnl / notional;
}

std::optional<double> Trade::annualized_return() const {
    auto ret = return_pct();
    int days = holding_days();
    if (!ret || days <= 0) {
        return std::nullopt;
    }
    return *ret * (365.0 / days);
}

nlohmann::json Trade::to_json() const {
    nlohmann::json j;
    j["entry_date"] = core::format_date(entry_date);
    j["exit_date"] = exit_date ? nlohmann::json(core::format_date(*exit_date)) : nlohmann::json();
    j["entry_basis"] = entry_basis;
    j["exit_basis"] = exit_basis ? nlohmann::json(*exit_basis) : nlohmann::json();
    j["holding_days"] = holding_days();

    auto ret = return_pct();
    j["return_pct"] = ret ? nlohmann::json(*ret * 100.0) : nlohmann::json();
    auto annualized = annualized_return();
    j["annualized_return"] = annualized ? nlohmann::json(*annualized * 100.0) : nlohmann::json();

    j["realized_pnl"] = realized_pnl ? nlohmann::json(*realized_pnl) : nlohmann::json();
    j["funding_cost"] = funding_cost;
    j["total_costs"] = costs.total_costs();
    j["status"] = trade_status_to_string(status);
    return j;
}

}  // namespace backtest
}  // namespace basis_trade
