// include/basis_trade/transaction_cost/cost_model.hpp
#pragma once

#include <string>

namespace basis_trade {
namespace transaction_cost {

/**
 * @brief Itemized costs of one basis trade
 *
 * One-time costs are charged at entry and exit; holding costs accrue over
 * the holding period. All amounts are in dollars.
 */
struct TradingCosts {
    // Commissions
    double spot_entry_commission = 0.0;
    double spot_exit_commission = 0.0;
    double futures_entry_commission = 0.0;
    double futures_exit_commission = 0.0;
    double etf_entry_commission = 0.0;
    double etf_exit_commission = 0.0;

    // Slippage (the ETF leg's slippage is booked on the spot lines)
    double spot_entry_slippage = 0.0;
    double spot_exit_slippage = 0.0;
    double futures_entry_slippage = 0.0;
    double futures_exit_slippage = 0.0;

    // Holding costs
    double funding_cost = 0.0;
    double etf_expense_ratio = 0.0;

    double total_entry_costs() const {
        return spot_entry_commission + futures_entry_commission + etf_entry_commission +
               spot_entry_slippage + futures_entry_slippage;
    }

    double total_exit_costs() const {
        return spot_exit_commission + futures_exit_commission + etf_exit_commission +
               spot_exit_slippage + futures_exit_slippage;
    }

    double total_holding_costs() const {
        return funding_cost + etf_expense_ratio;
    }

    double total_costs() const {
        return total_entry_costs() + total_exit_costs() + total_holding_costs();
    }
};

/**
 * @brief Prices and size of a completed basis trade
 */
struct TradeLegs {
    double entry_spot = 0.0;
    double exit_spot = 0.0;
    double entry_futures = 0.0;
    double exit_futures = 0.0;
    double position_size = 1.0;  // units of the underlying
    int holding_days = 0;
};

/**
 * @brief Gross and net P&L of a basis trade (long spot, short futures)
 */
struct NetPnL {
    double spot_pnl = 0.0;
    double futures_pnl = 0.0;
    double gross_pnl = 0.0;
    double total_costs = 0.0;
    double net_pnl = 0.0;
    double net_return_pct = 0.0;     // in percent of entry notional
    double annualized_return = 0.0;  // in percent, 0 for zero-day trades
    TradingCosts costs;
};

/**
 * @brief Cost model for a long-spot (or spot ETF) / short CME futures trade
 *
 * Usage:
 *   CostModel model;                      // ETF long leg, 5% funding
 *   auto costs = model.calculate_costs(legs);
 *   auto pnl = model.calculate_net_pnl(legs);
 */
class CostModel {
public:
    struct Config {
        // Long leg through a spot ETF (IBIT/FBTC) instead of direct spot
        bool use_etf;

        double funding_rate_annual;
        double etf_expense_ratio_annual;

        // ETF: 0.05% commission, $1 minimum per side, 1bp slippage
        double etf_commission_rate;
        double etf_min_commission;
        double etf_slippage_rate;

        // Direct spot: 0.4% maker fee, 5bp slippage
        double spot_commission_rate;
        double spot_slippage_rate;

        // CME: 5 units per contract, $2 per contract per side, 2bp slippage
        double futures_contract_size;
        double futures_commission_per_contract;
        double futures_slippage_rate;

        Config()
            : use_etf(true),
              funding_rate_annual(0.05),
              etf_expense_ratio_annual(0.0025),
              etf_commission_rate(0.0005),
              etf_min_commission(1.0),
              etf_slippage_rate(0.0001),
              spot_commission_rate(0.004),
              spot_slippage_rate(0.0005),
              futures_contract_size(5.0),
              futures_commission_per_contract(2.0),
              futures_slippage_rate(0.0002) {}
    };

    explicit CostModel(const Config& config = Config());

    /**
     * @brief Funding cost of carrying the entry notional for holding_days
     */
    static double funding_cost(double annual_rate, int holding_days, double entry_notional);

    TradingCosts calculate_costs(const TradeLegs& legs) const;

    /**
     * @brief Gross P&L of both legs less all itemized costs
     */
    NetPnL calculate_net_pnl(const TradeLegs& legs) const;

    const Config& config() const {
        return config_;
    }

private:
    Config config_;
};

}  // namespace transaction_cost
}  // namespace basis_trade
