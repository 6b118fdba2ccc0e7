// src/backtest/backtest_engine.cpp
#include "basis_trade/backtest/backtest_engine.hpp"
#include <optional>
#include <utility>
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace backtest {

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["account_size"] = account_size;
    j["funding_cost_annual"] = funding_cost_annual;
    j["entry_threshold"] = entry_threshold;
    j["stop_loss_threshold"] = stop_loss_threshold;
    j["exit_threshold"] = exit_threshold;
    j["strong_entry_threshold"] = strong_entry_threshold;
    j["holding_days"] = holding_days;
    j["include_transaction_costs"] = include_transaction_costs;
    j["use_etf"] = use_etf;
    j["etf_expense_ratio_annual"] = etf_expense_ratio_annual;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("account_size"))
        account_size = j.at("account_size").get<double>();
    if (j.contains("funding_cost_annual"))
        funding_cost_annual = j.at("funding_cost_annual").get<double>();
    if (j.contains("entry_threshold"))
        entry_threshold = j.at("entry_threshold").get<double>();
    if (j.contains("stop_loss_threshold"))
        stop_loss_threshold = j.at("stop_loss_threshold").get<double>();
    if (j.contains("exit_threshold"))
        exit_threshold = j.at("exit_threshold").get<double>();
    if (j.contains("strong_entry_threshold"))
        strong_entry_threshold = j.at("strong_entry_threshold").get<double>();
    if (j.contains("holding_days"))
        holding_days = j.at("holding_days").get<int>();
    if (j.contains("include_transaction_costs"))
        include_transaction_costs = j.at("include_transaction_costs").get<bool>();
    if (j.contains("use_etf"))
        use_etf = j.at("use_etf").get<bool>();
    if (j.contains("etf_expense_ratio_annual"))
        etf_expense_ratio_annual = j.at("etf_expense_ratio_annual").get<double>();
}

Result<void> BacktestConfig::validate() const {
    if (account_size <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "account_size must be positive",
                                "BacktestConfig");
    }
    if (holding_days <= 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "holding_days must be positive",
                                "BacktestConfig");
    }
    if (funding_cost_annual < 0.0 || etf_expense_ratio_annual < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Annual rates cannot be negative",
                                "BacktestConfig");
    }
    if (entry_threshold < 0.0 || strong_entry_threshold < 0.0 || stop_loss_threshold < 0.0 ||
        exit_threshold < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Thresholds cannot be negative",
                                "BacktestConfig");
    }
    return Result<void>();
}

strategy::SignalThresholds BacktestConfig::to_signal_thresholds() const {
    strategy::SignalThresholds thresholds;
    thresholds.entry_threshold = entry_threshold;
    thresholds.strong_entry_threshold = strong_entry_threshold;
    thresholds.stop_loss_threshold = stop_loss_threshold;
    thresholds.exit_threshold = exit_threshold;
    return thresholds;
}

transaction_cost::CostModel::Config BacktestConfig::to_cost_config() const {
    transaction_cost::CostModel::Config cost_config;
    cost_config.use_etf = use_etf;
    cost_config.funding_rate_annual = funding_cost_annual;
    cost_config.etf_expense_ratio_annual = etf_expense_ratio_annual;
    return cost_config;
}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)),
      signal_generator_(config_.to_signal_thresholds()),
      cost_model_(config_.to_cost_config()) {}

Trade BacktestEngine::open_trade(const Observation& obs) const {
    Trade trade;
    trade.entry_date = obs.date;
    trade.entry_spot = obs.spot_price;
    trade.entry_futures = obs.futures_price;
    trade.entry_basis = obs.futures_price - obs.spot_price;
    trade.position_size = 1.0;
    trade.status = TradeStatus::OPEN;
    return trade;
}

void BacktestEngine::close_trade(Trade& trade, const Observation& obs, TradeStatus status) const {
    trade.exit_date = obs.date;
    trade.exit_spot = obs.spot_price;
    trade.exit_futures = obs.futures_price;
    trade.exit_basis = obs.futures_price - obs.spot_price;
    trade.status = status;

    transaction_cost::TradeLegs legs;
    legs.entry_spot = trade.entry_spot;
    legs.exit_spot = obs.spot_price;
    legs.entry_futures = trade.entry_futures;
    legs.exit_futures = obs.futures_price;
    legs.position_size = trade.position_size;
    legs.holding_days = trade.holding_days();

    const double spot_pnl = (obs.spot_price - trade.entry_spot) * trade.position_size;
    const double futures_pnl = (trade.entry_futures - obs.futures_price) * trade.position_size;

    trade.funding_cost = transaction_cost::CostModel::funding_cost(
        config_.funding_cost_annual, legs.holding_days, trade.entry_spot * trade.position_size);
    trade.costs = cost_model_.calculate_costs(legs);

    if (config_.include_transaction_costs) {
        trade.realized_pnl = spot_pnl + futures_pnl - trade.costs.total_costs();
    } else {
        trade.realized_pnl = spot_pnl + futures_pnl - trade.funding_cost;
    }
}

BacktestResult BacktestEngine::run(const std::vector<Observation>& observations) const {
    ScopedLogComponent log_scope("BacktestEngine");
    BacktestResult result;
    result.initial_capital = config_.account_size;

    if (observations.empty()) {
        WARN("Backtest called with no observations");
        return result;
    }

    result.start_date = observations.front().date;
    result.end_date = observations.back().date;

    DEBUG("Running backtest from " << core::format_date(observations.front().date) << " to "
                                   << core::format_date(observations.back().date) << " ("
                                   << observations.size() << " observations)");

    double equity = config_.account_size;
    result.equity_curve.emplace_back(observations.front().date, equity);

    std::optional<Trade> position;
    bool warned_order = false;

    for (size_t i = 0; i < observations.size(); ++i) {
        const auto& obs = observations[i];

        if (!warned_order && i > 0 && obs.date <= observations[i - 1].date) {
            WARN("Observation dates are not strictly increasing at "
                 << core::format_date(obs.date) << "; processing in input order");
            warned_order = true;
        }

        const int dte = static_cast<int>(core::days_between(obs.date, obs.futures_expiry));
        const strategy::Signal signal =
            signal_generator_.generate_signal(obs.spot_price, obs.futures_price, dte);

        if (position) {
            const int held = static_cast<int>(core::days_between(position->entry_date, obs.date));

            std::optional<TradeStatus> exit_status;
            if (signal == strategy::Signal::STOP_LOSS) {
                exit_status = TradeStatus::STOPPED_OUT;
            } else if (signal == strategy::Signal::FULL_EXIT) {
                exit_status = TradeStatus::CLOSED;
            } else if (held >= config_.holding_days) {
                exit_status = TradeStatus::CLOSED;
            }

            if (exit_status) {
                close_trade(*position, obs, *exit_status);
                equity += *position->realized_pnl;
                result.equity_curve.emplace_back(obs.date, equity);

                DEBUG("Exit " << core::format_date(obs.date) << " "
                              << trade_status_to_string(*exit_status) << " after " << held
                              << " days, pnl " << *position->realized_pnl);

                result.trades.push_back(std::move(*position));
                position.reset();
            }
        }

        if (!position && strategy::is_entry_signal(signal)) {
            position = open_trade(obs);
            DEBUG("Entry " << core::format_date(obs.date) << " "
                           << strategy::signal_to_string(signal) << " basis "
                           << position->entry_basis);
        }
    }

    // The forced close is recorded without an equity point
    if (position) {
        close_trade(*position, observations.back(), TradeStatus::FORCED_CLOSE);
        DEBUG("Forced close " << core::format_date(observations.back().date) << " pnl "
                              << *position->realized_pnl);
        result.trades.push_back(std::move(*position));
        position.reset();
    }

    metrics_calculator_.populate_metrics(result);

    DEBUG("Backtest complete: " << result.total_trades << " trades, total return "
                                << result.total_return * 100.0 << "%, max drawdown "
                                << result.max_drawdown * 100.0 << "%, sharpe "
                                << result.sharpe_ratio);
    return result;
}

}  // namespace backtest
}  // namespace basis_trade
