#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include "basis_trade/calendar/expiry_calendar.hpp"
#include "basis_trade/core/config_base.hpp"
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"
#include "basis_trade/data/observation_io.hpp"
#include "basis_trade/optimization/grid_search_optimizer.hpp"

using namespace basis_trade;
using namespace basis_trade::optimization;

namespace {

/**
 * @brief Application config: "logging", "grid_search" and "data" sections
 * The "data" section matches bt_basis.
 */
struct OptimizerAppConfig : public ConfigBase {
    LoggerConfig logging;
    GridSearchConfig grid_search;
    std::string csv_path;
    std::string output_directory{"results/optimization"};
    std::string sample_start{"2024-01-01"};
    std::string sample_end{"2024-12-31"};
    uint32_t seed{42};
    std::string expiry;  // YYYYMM; restricts the run to that contract's window
    bool end_on_expiry{false};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logging"] = logging.to_json();
        j["grid_search"] = grid_search.to_json();
        j["data"] = {{"csv_path", csv_path},
                     {"output_directory", output_directory},
                     {"sample_start", sample_start},
                     {"sample_end", sample_end},
                     {"seed", seed},
                     {"expiry", expiry},
                     {"end_on_expiry", end_on_expiry}};
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("logging")) logging.from_json(j.at("logging"));
        if (j.contains("grid_search")) grid_search.from_json(j.at("grid_search"));
        if (j.contains("data")) {
            const auto& d = j.at("data");
            if (d.contains("csv_path")) csv_path = d.at("csv_path").get<std::string>();
            if (d.contains("output_directory")) {
                output_directory = d.at("output_directory").get<std::string>();
            }
            if (d.contains("sample_start")) sample_start = d.at("sample_start").get<std::string>();
            if (d.contains("sample_end")) sample_end = d.at("sample_end").get<std::string>();
            if (d.contains("seed")) seed = d.at("seed").get<uint32_t>();
            if (d.contains("expiry")) expiry = d.at("expiry").get<std::string>();
            if (d.contains("end_on_expiry")) end_on_expiry = d.at("end_on_expiry").get<bool>();
        }
    }

    Result<void> validate() const override {
        return grid_search.validate();
    }
};

void print_score_row(int rank, const ParameterScore& score) {
    std::cout << std::setw(4) << rank << "  " << std::fixed << std::setprecision(3)
              << std::setw(6) << score.params.entry_threshold << "  " << std::setw(6)
              << score.params.stop_loss_threshold << "  " << std::setw(6)
              << score.params.exit_threshold << "  " << std::setw(4) << score.params.holding_days
              << "  " << std::setprecision(2) << std::setw(8) << score.total_return * 100.0
              << "%  " << std::setw(6) << score.sharpe_ratio << "  " << std::setw(6)
              << score.max_drawdown * 100.0 << "%  " << std::setw(5) << score.total_trades
              << "  " << std::setw(6) << score.win_rate * 100.0 << "%" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        OptimizerAppConfig app_config;
        app_config.logging.destination = LogDestination::BOTH;
        app_config.logging.filename_prefix = "opt_basis";

        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";
        auto config_result = app_config.load_from_file(config_path);
        if (config_result.is_error() && argc <= 1 &&
            config_result.error()->code() == ErrorCode::FILE_NOT_FOUND) {
            std::cerr << "No " << config_path << ", using default configuration" << std::endl;
        } else if (config_result.is_error()) {
            std::cerr << "Failed to load " << config_path << ": "
                      << config_result.error()->to_string() << std::endl;
            return 1;
        }
        if (argc > 2) {
            app_config.csv_path = argv[2];
        }
        if (argc > 3) {
            app_config.output_directory = argv[3];
        }

        auto& logger = Logger::instance();
        logger.initialize(app_config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("opt_basis");
        INFO("Logger initialized for basis trade parameter search");

        std::vector<Observation> observations;
        if (!app_config.csv_path.empty()) {
            auto load_result = data::load_observations_csv(app_config.csv_path);
            if (load_result.is_error()) {
                std::cerr << "Failed to load observations: " << load_result.error()->to_string()
                          << std::endl;
                return 1;
            }
            observations = load_result.value();
        } else {
            auto start = core::parse_date(app_config.sample_start);
            auto end = core::parse_date(app_config.sample_end);
            if (start.is_error() || end.is_error()) {
                std::cerr << "Invalid sample date range " << app_config.sample_start << " to "
                          << app_config.sample_end << std::endl;
                return 1;
            }
            data::SampleDataParams params;
            params.seed = app_config.seed;
            observations = data::generate_sample_data(start.value(), end.value(), params);
            INFO("Generated " << observations.size() << " sample observations");
        }

        if (!app_config.expiry.empty()) {
            auto window =
                calendar::contract_date_range(app_config.expiry, app_config.end_on_expiry);
            if (window.is_error()) {
                std::cerr << "Invalid expiry: " << window.error()->to_string() << std::endl;
                return 1;
            }
            const auto& [start, end] = window.value();
            observations = data::filter_date_range(observations, start, end);
            INFO("Contract " << app_config.expiry << " window " << core::format_date(start)
                             << " to " << core::format_date(end) << ": " << observations.size()
                             << " observations");
        }

        GridSearchOptimizer optimizer(app_config.grid_search);
        auto opt_result = optimizer.optimize(observations);
        if (opt_result.is_error()) {
            std::cerr << "Optimization failed: " << opt_result.error()->to_string() << std::endl;
            return 1;
        }
        const GridSearchResult& result = opt_result.value();

        std::cout << "\n=== Top " << result.top.size() << " Parameter Sets ===" << std::endl;
        std::cout << "Rank   Entry    Stop    Exit  Hold    Return  Sharpe   MaxDD  Trades   WinRate"
                  << std::endl;
        int rank = 1;
        for (const auto& score : result.top) {
            print_score_row(rank++, score);
        }

        const auto& baseline = result.baseline;
        std::cout << "\n=== Baseline (entry 0.005, stop 0.002, exit 0.035, hold 30) ===" << std::endl;
        std::cout << "Total Return:    " << std::fixed << std::setprecision(2)
                  << baseline.total_return * 100.0 << "%" << std::endl;
        std::cout << "Sharpe Ratio:    " << std::setprecision(3) << baseline.sharpe_ratio
                  << std::endl;
        std::cout << "Total Trades:    " << baseline.total_trades << std::endl;

        if (!result.best) {
            std::cout << "\nNo parameter set produced a trade" << std::endl;
            return 0;
        }

        const double improvement = result.best->total_return - baseline.total_return;
        std::cout << "Improvement:     " << std::setprecision(2) << improvement * 100.0 << "%"
                  << std::endl;
        std::cout << "===========================================\n" << std::endl;

        const std::filesystem::path out_dir(app_config.output_directory);
        auto best_result = GridSearchOptimizer::save_best_params(
            result, (out_dir / "best_params.json").string());
        if (best_result.is_error()) {
            std::cerr << "Failed to save best parameters: " << best_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        auto rank_result = GridSearchOptimizer::save_rankings_csv(
            result, (out_dir / "rankings.csv").string());
        if (rank_result.is_error()) {
            std::cerr << "Failed to save rankings: " << rank_result.error()->to_string() << std::endl;
            return 1;
        }

        INFO("Optimization results written to " << app_config.output_directory);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
