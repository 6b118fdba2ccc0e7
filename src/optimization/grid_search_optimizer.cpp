// src/optimization/grid_search_optimizer.cpp
#include "basis_trade/optimization/grid_search_optimizer.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>
#include "basis_trade/core/logger.hpp"

namespace basis_trade {
namespace optimization {

namespace {

ParameterScore score_from_result(const ParameterSet& params,
                                 const backtest::BacktestResult& result) {
    ParameterScore score;
    score.params = params;
    score.total_return = result.total_return;
    score.sharpe_ratio = result.sharpe_ratio;
    score.max_drawdown = result.max_drawdown;
    score.total_trades = result.total_trades;
    score.winning_trades = result.winning_trades;
    score.losing_trades = result.losing_trades;
    score.win_rate = result.win_rate();
    return score;
}

Result<void> check_range(const std::string& name, double min, double max, double step) {
    if (step <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, name + " step must be positive",
                                "GridSearchConfig");
    }
    if (min > max) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                name + " minimum exceeds maximum", "GridSearchConfig");
    }
    return Result<void>();
}

// Number of values frange(min, max, step) yields, without building them
double range_length(double min, double max, double step) {
    return std::floor((max - min) / step + 0.1) + 1.0;
}

}  // namespace

nlohmann::json GridSearchConfig::to_json() const {
    nlohmann::json j;
    j["entry_min"] = entry_min;
    j["entry_max"] = entry_max;
    j["entry_step"] = entry_step;
    j["stop_min"] = stop_min;
    j["stop_max"] = stop_max;
    j["stop_step"] = stop_step;
    j["exit_min"] = exit_min;
    j["exit_max"] = exit_max;
    j["exit_step"] = exit_step;
    j["holding_values"] = holding_values;
    j["top_n"] = top_n;
    j["max_threads"] = max_threads;
    j["account_size"] = account_size;
    j["funding_cost_annual"] = funding_cost_annual;
    j["strong_entry_threshold"] = strong_entry_threshold;
    return j;
}

void GridSearchConfig::from_json(const nlohmann::json& j) {
    if (j.contains("entry_min")) entry_min = j.at("entry_min").get<double>();
    if (j.contains("entry_max")) entry_max = j.at("entry_max").get<double>();
    if (j.contains("entry_step")) entry_step = j.at("entry_step").get<double>();
    if (j.contains("stop_min")) stop_min = j.at("stop_min").get<double>();
    if (j.contains("stop_max")) stop_max = j.at("stop_max").get<double>();
    if (j.contains("stop_step")) stop_step = j.at("stop_step").get<double>();
    if (j.contains("exit_min")) exit_min = j.at("exit_min").get<double>();
    if (j.contains("exit_max")) exit_max = j.at("exit_max").get<double>();
    if (j.contains("exit_step")) exit_step = j.at("exit_step").get<double>();
    if (j.contains("holding_values")) {
        holding_values = j.at("holding_values").get<std::vector<int>>();
    }
    if (j.contains("top_n")) top_n = j.at("top_n").get<size_t>();
    if (j.contains("max_threads")) max_threads = j.at("max_threads").get<size_t>();
    if (j.contains("account_size")) account_size = j.at("account_size").get<double>();
    if (j.contains("funding_cost_annual")) {
        funding_cost_annual = j.at("funding_cost_annual").get<double>();
    }
    if (j.contains("strong_entry_threshold")) {
        strong_entry_threshold = j.at("strong_entry_threshold").get<double>();
    }
}

nlohmann::json ParameterSet::to_json() const {
    nlohmann::json j;
    j["entry_threshold"] = entry_threshold;
    j["stop_loss_threshold"] = stop_loss_threshold;
    j["exit_threshold"] = exit_threshold;
    j["holding_days"] = holding_days;
    return j;
}

std::vector<double> frange(double start, double stop, double step) {
    std::vector<double> values;
    if (step <= 0.0) {
        return values;
    }
    double value = start;
    while (value <= stop + step / 10.0) {
        values.push_back(std::round(value * 1e6) / 1e6);
        value += step;
    }
    return values;
}

GridSearchOptimizer::GridSearchOptimizer(GridSearchConfig config) : config_(std::move(config)) {}

Result<void> GridSearchConfig::validate() const {
    auto entry_check = check_range("Entry threshold", entry_min, entry_max, entry_step);
    if (entry_check.is_error()) {
        return entry_check;
    }
    auto stop_check = check_range("Stop-loss threshold", stop_min, stop_max, stop_step);
    if (stop_check.is_error()) {
        return stop_check;
    }
    auto exit_check = check_range("Exit threshold", exit_min, exit_max, exit_step);
    if (exit_check.is_error()) {
        return exit_check;
    }

    if (holding_values.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No holding periods to search",
                                "GridSearchConfig");
    }
    for (int days : holding_values) {
        if (days <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Holding periods must be positive, got " +
                                        std::to_string(days),
                                    "GridSearchConfig");
        }
    }

    const double combinations = range_length(entry_min, entry_max, entry_step) *
                                range_length(stop_min, stop_max, stop_step) *
                                range_length(exit_min, exit_max, exit_step) *
                                static_cast<double>(holding_values.size());
    if (!std::isfinite(combinations) ||
        combinations > static_cast<double>(MAX_GRID_COMBINATIONS)) {
        std::ostringstream msg;
        msg << "Grid of " << std::setprecision(3) << combinations
            << " combinations exceeds the limit of " << MAX_GRID_COMBINATIONS;
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, msg.str(), "GridSearchConfig");
    }

    if (account_size <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Account size must be positive",
                                "GridSearchConfig");
    }
    return Result<void>();
}

Result<void> GridSearchOptimizer::validate_config() const {
    return config_.validate();
}

std::vector<ParameterSet> GridSearchOptimizer::generate_grid() const {
    const auto entries = frange(config_.entry_min, config_.entry_max, config_.entry_step);
    const auto stops = frange(config_.stop_min, config_.stop_max, config_.stop_step);
    const auto exits = frange(config_.exit_min, config_.exit_max, config_.exit_step);

    std::vector<ParameterSet> grid;
    for (double entry : entries) {
        for (double stop : stops) {
            if (entry <= stop) {
                continue;
            }
            for (double exit_level : exits) {
                if (exit_level <= entry) {
                    continue;
                }
                for (int hold : config_.holding_values) {
                    ParameterSet params;
                    params.entry_threshold = entry;
                    params.stop_loss_threshold = stop;
                    params.exit_threshold = exit_level;
                    params.holding_days = hold;
                    grid.push_back(params);
                }
            }
        }
    }
    return grid;
}

backtest::BacktestConfig GridSearchOptimizer::make_backtest_config(
    const ParameterSet& params) const {
    backtest::BacktestConfig bt_config;
    bt_config.account_size = config_.account_size;
    bt_config.funding_cost_annual = config_.funding_cost_annual;
    bt_config.strong_entry_threshold = config_.strong_entry_threshold;
    bt_config.entry_threshold = params.entry_threshold;
    bt_config.stop_loss_threshold = params.stop_loss_threshold;
    bt_config.exit_threshold = params.exit_threshold;
    bt_config.holding_days = params.holding_days;
    return bt_config;
}

backtest::BacktestResult GridSearchOptimizer::evaluate(
    const std::vector<Observation>& observations, const ParameterSet& params) const {
    backtest::BacktestEngine engine(make_backtest_config(params));
    return engine.run(observations);
}

size_t GridSearchOptimizer::worker_count(size_t jobs) const {
    size_t workers = config_.max_threads;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

Result<GridSearchResult> GridSearchOptimizer::optimize(
    const std::vector<Observation>& observations) const {
    ScopedLogComponent log_scope("GridSearchOptimizer");
    auto valid = validate_config();
    if (valid.is_error()) {
        ERROR("Invalid grid search configuration: " << valid.error()->what());
        return forward_error<GridSearchResult>(valid, "GridSearchOptimizer");
    }
    if (observations.empty()) {
        return make_error<GridSearchResult>(ErrorCode::INVALID_ARGUMENT,
                                            "No observations to optimize over",
                                            "GridSearchOptimizer");
    }

    const std::vector<ParameterSet> grid = generate_grid();
    const size_t workers = worker_count(grid.size());
    INFO("Testing " << grid.size() << " parameter combinations on " << workers << " threads");

    std::vector<ParameterScore> scores(grid.size());
    std::vector<std::exception_ptr> failures(workers);
    std::atomic<size_t> completed{0};
    const size_t progress_step = std::max<size_t>(1, grid.size() / 10);

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&, w]() {
            try {
                Logger::register_component("GridSearchOptimizer");
                for (size_t i = w; i < grid.size(); i += workers) {
                    scores[i] = score_from_result(grid[i], evaluate(observations, grid[i]));
                    size_t done = completed.fetch_add(1) + 1;
                    if (done % progress_step == 0) {
                        INFO("Progress: " << done << "/" << grid.size());
                    }
                }
            } catch (...) {
                failures[w] = std::current_exception();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& failure : failures) {
        if (!failure) {
            continue;
        }
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            return make_error<GridSearchResult>(ErrorCode::UNKNOWN_ERROR,
                                                std::string("Grid search worker failed: ") +
                                                    e.what(),
                                                "GridSearchOptimizer");
        } catch (...) {
            return make_error<GridSearchResult>(ErrorCode::UNKNOWN_ERROR,
                                                "Grid search worker failed", "GridSearchOptimizer");
        }
    }

    GridSearchResult result;
    result.ranked = std::move(scores);
    std::stable_sort(result.ranked.begin(), result.ranked.end(),
                     [](const ParameterScore& a, const ParameterScore& b) {
                         return a.total_return > b.total_return;
                     });

    for (const auto& score : result.ranked) {
        if (score.total_trades <= 0) {
            continue;
        }
        if (!result.best) {
            result.best = score;
        }
        if (result.top.size() < config_.top_n) {
            result.top.push_back(score);
        }
    }

    result.baseline = evaluate(observations, ParameterSet());

    if (result.best) {
        const auto& p = result.best->params;
        INFO("Best parameters: entry " << p.entry_threshold << ", stop "
                                       << p.stop_loss_threshold << ", exit " << p.exit_threshold
                                       << ", hold " << p.holding_days << " -> return "
                                       << result.best->total_return * 100.0 << "%");
    } else {
        WARN("No parameter combination produced a trade");
    }
    INFO("Baseline return " << result.baseline.total_return * 100.0 << "% over "
                            << result.baseline.total_trades << " trades");

    return result;
}

Result<void> GridSearchOptimizer::save_best_params(const GridSearchResult& result,
                                                   const std::string& filepath) {
    if (!result.best) {
        return make_error<void>(ErrorCode::DATA_NOT_FOUND, "No best parameters to save",
                                "GridSearchOptimizer");
    }

    try {
        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + filepath + " for writing",
                                    "GridSearchOptimizer");
        }
        file << result.best->params.to_json().dump(2) << "\n";
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving best parameters: ") + e.what(),
                                "GridSearchOptimizer");
    }
}

Result<void> GridSearchOptimizer::save_rankings_csv(const GridSearchResult& result,
                                                    const std::string& filepath) {
    try {
        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(filepath);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + filepath + " for writing",
                                    "GridSearchOptimizer");
        }

        file << "rank,entry_threshold,stop_loss_threshold,exit_threshold,holding_days,"
             << "total_return_pct,sharpe_ratio,max_drawdown_pct,total_trades,win_rate_pct\n";
        int rank = 1;
        for (const auto& score : result.top) {
            file << rank++ << "," << score.params.entry_threshold << ","
                 << score.params.stop_loss_threshold << "," << score.params.exit_threshold << ","
                 << score.params.holding_days << "," << std::fixed << std::setprecision(4)
                 << score.total_return * 100.0 << "," << score.sharpe_ratio << ","
                 << score.max_drawdown * 100.0 << "," << score.total_trades << ","
                 << score.win_rate * 100.0 << std::defaultfloat << "\n";
        }
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error saving rankings: ") + e.what(),
                                "GridSearchOptimizer");
    }
}

}  // namespace optimization
}  // namespace basis_trade
