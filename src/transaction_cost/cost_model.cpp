// src/transaction_cost/cost_model.cpp
#include "basis_trade/transaction_cost/cost_model.hpp"
#include <algorithm>

namespace basis_trade {
namespace transaction_cost {

CostModel::CostModel(const Config& config) : config_(config) {}

double CostModel::funding_cost(double annual_rate, int holding_days, double entry_notional) {
    return (annual_rate / 365.0) * holding_days * entry_notional;
}

TradingCosts CostModel::calculate_costs(const TradeLegs& legs) const {
    TradingCosts costs;
    const double entry_spot_value = legs.entry_spot * legs.position_size;
    const double exit_spot_value = legs.exit_spot * legs.position_size;

    // Commissions
    if (config_.use_etf) {
        costs.etf_entry_commission =
            std::max(config_.etf_min_commission, entry_spot_value * config_.etf_commission_rate);
        costs.etf_exit_commission =
            std::max(config_.etf_min_commission, exit_spot_value * config_.etf_commission_rate);
    } else {
        costs.spot_entry_commission = entry_spot_value * config_.spot_commission_rate;
        costs.spot_exit_commission = exit_spot_value * config_.spot_commission_rate;
    }

    const double contracts = config_.futures_contract_size > 0.0
                                 ? legs.position_size / config_.futures_contract_size
                                 : 0.0;
    costs.futures_entry_commission = contracts * config_.futures_commission_per_contract;
    costs.futures_exit_commission = contracts * config_.futures_commission_per_contract;

    // Slippage
    const double spot_slippage_rate =
        config_.use_etf ? config_.etf_slippage_rate : config_.spot_slippage_rate;
    costs.spot_entry_slippage = entry_spot_value * spot_slippage_rate;
    costs.spot_exit_slippage = exit_spot_value * spot_slippage_rate;
    costs.futures_entry_slippage =
        legs.entry_futures * legs.position_size * config_.futures_slippage_rate;
    costs.futures_exit_slippage =
        legs.exit_futures * legs.position_size * config_.futures_slippage_rate;

    // Holding costs
    costs.funding_cost =
        funding_cost(config_.funding_rate_annual, legs.holding_days, entry_spot_value);
    if (config_.use_etf) {
        costs.etf_expense_ratio =
            funding_cost(config_.etf_expense_ratio_annual, legs.holding_days, entry_spot_value);
    }

    return costs;
}

NetPnL CostModel::calculate_net_pnl(const TradeLegs& legs) const {
    NetPnL pnl;
    pnl.spot_pnl = (legs.exit_spot - legs.entry_spot) * legs.position_size;
    pnl.futures_pnl = (legs.entry_futures - legs.exit_futures) * legs.position_size;
    pnl.gross_pnl = pnl.spot_pnl + pnl.futures_pnl;

    pnl.costs = calculate_costs(legs);
    pnl.total_costs = pnl.costs.total_costs();
    pnl.net_pnl = pnl.gross_pnl - pnl.total_costs;

    const double notional = legs.entry_spot * legs.position_size;
    pnl.net_return_pct = notional != 0.0 ? pnl.net_pnl / notional * 100.0 : 0.0;
    pnl.annualized_return =
        legs.holding_days > 0 ? pnl.net_return_pct * (365.0 / legs.holding_days) : 0.0;
    return pnl;
}

}  // namespace transaction_cost
}  // namespace basis_trade
