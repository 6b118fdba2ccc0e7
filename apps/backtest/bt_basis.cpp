#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include "basis_trade/backtest/backtest_csv_exporter.hpp"
#include "basis_trade/backtest/backtest_engine.hpp"
#include "basis_trade/calendar/expiry_calendar.hpp"
#include "basis_trade/core/config_base.hpp"
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"
#include "basis_trade/data/observation_io.hpp"

using namespace basis_trade;
using namespace basis_trade::backtest;

namespace {

/**
 * @brief Top-level layout of the application config file
 *
 * {
 *   "logging":  { LoggerConfig },
 *   "backtest": { BacktestConfig },
 *   "data": { "csv_path": "...", "output_directory": "...",
 *             "sample_start": "YYYY-MM-DD", "sample_end": "YYYY-MM-DD", "seed": 42,
 *             "expiry": "YYYYMM", "end_on_expiry": false }
 * }
 * With an empty csv_path a synthetic series is generated instead. A
 * non-empty expiry keeps only that contract's trading window.
 */
struct BacktestAppConfig : public ConfigBase {
    LoggerConfig logging;
    BacktestConfig backtest;
    std::string csv_path;
    std::string output_directory{"results/backtest"};
    std::string sample_start{"2024-01-01"};
    std::string sample_end{"2024-12-31"};
    uint32_t seed{42};
    std::string expiry;  // YYYYMM; restricts the run to that contract's window
    bool end_on_expiry{false};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["logging"] = logging.to_json();
        j["backtest"] = backtest.to_json();
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
        if (j.contains("backtest")) backtest.from_json(j.at("backtest"));
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
        return backtest.validate();
    }
};

Result<std::vector<Observation>> read_observations(const BacktestAppConfig& app_config) {
    if (!app_config.csv_path.empty()) {
        INFO("Loading observations from " << app_config.csv_path);
        return data::load_observations_csv(app_config.csv_path);
    }

    auto start = core::parse_date(app_config.sample_start);
    if (start.is_error()) {
        return forward_error<std::vector<Observation>>(start, "bt_basis");
    }
    auto end = core::parse_date(app_config.sample_end);
    if (end.is_error()) {
        return forward_error<std::vector<Observation>>(end, "bt_basis");
    }

    INFO("No data file configured, generating sample data " << app_config.sample_start << " to "
                                                             << app_config.sample_end);
    data::SampleDataParams params;
    params.seed = app_config.seed;
    return data::generate_sample_data(start.value(), end.value(), params);
}

Result<std::vector<Observation>> load_input(const BacktestAppConfig& app_config) {
    auto observations = read_observations(app_config);
    if (observations.is_error() || app_config.expiry.empty()) {
        return observations;
    }

    auto window = calendar::contract_date_range(app_config.expiry, app_config.end_on_expiry);
    if (window.is_error()) {
        return forward_error<std::vector<Observation>>(window, "bt_basis");
    }
    const auto& [start, end] = window.value();
    INFO("Restricting to contract " << app_config.expiry << " window " << core::format_date(start)
                                    << " to " << core::format_date(end));
    return data::filter_date_range(observations.value(), start, end);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        Logger::reset_for_tests();

        BacktestAppConfig app_config;
        app_config.logging.destination = LogDestination::BOTH;
        app_config.logging.filename_prefix = "bt_basis";

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
        Logger::register_component("bt_basis");
        INFO("Logger initialized for basis trade backtest");

        auto data_result = load_input(app_config);
        if (data_result.is_error()) {
            std::cerr << "Failed to load observations: " << data_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        const auto& observations = data_result.value();
        INFO("Loaded " << observations.size() << " observations");

        const BacktestConfig& config = app_config.backtest;
        std::cout << "\n=== Backtest Configuration ===" << std::endl;
        std::cout << "Account size:    $" << std::fixed << std::setprecision(0)
                  << config.account_size << std::endl;
        std::cout << std::setprecision(4);
        std::cout << "Entry threshold: " << config.entry_threshold << std::endl;
        std::cout << "Strong entry:    " << config.strong_entry_threshold << std::endl;
        std::cout << "Stop loss:       " << config.stop_loss_threshold << std::endl;
        std::cout << "Exit threshold:  " << config.exit_threshold << std::endl;
        std::cout << "Holding days:    " << config.holding_days << std::endl;
        std::cout << "Funding (annual): " << config.funding_cost_annual << std::endl;
        std::cout << "==============================\n" << std::endl;

        BacktestEngine engine(config);
        BacktestResult results = engine.run(observations);

        std::cout << "=== Backtest Results ===" << std::endl;
        if (results.start_date && results.end_date) {
            std::cout << "Period:          " << core::format_date(*results.start_date) << " to "
                      << core::format_date(*results.end_date) << std::endl;
        }
        std::cout << "Total Return:    " << std::fixed << std::setprecision(2)
                  << results.total_return * 100.0 << "%" << std::endl;
        std::cout << "Final Capital:   $" << results.final_capital() << std::endl;
        std::cout << "Sharpe Ratio:    " << std::setprecision(3) << results.sharpe_ratio
                  << std::endl;
        std::cout << "Max Drawdown:    " << std::setprecision(2) << results.max_drawdown * 100.0
                  << "%" << std::endl;
        std::cout << "Total Trades:    " << results.total_trades << " (" << results.winning_trades
                  << " wins, " << results.losing_trades << " losses)" << std::endl;
        std::cout << "Win Rate:        " << results.win_rate() * 100.0 << "%" << std::endl;
        std::cout << "Avg Win:         " << results.avg_win * 100.0 << "%" << std::endl;
        std::cout << "Avg Loss:        " << results.avg_loss * 100.0 << "%" << std::endl;
        const double profit_factor = results.profit_factor();
        if (profit_factor == std::numeric_limits<double>::infinity()) {
            std::cout << "Profit Factor:   inf" << std::endl;
        } else {
            std::cout << "Profit Factor:   " << profit_factor << std::endl;
        }
        std::cout << "========================\n" << std::endl;

        BacktestCSVExporter exporter(app_config.output_directory);
        auto export_result = exporter.export_all(results);
        if (export_result.is_error()) {
            std::cerr << "Failed to export results: " << export_result.error()->to_string()
                      << std::endl;
            return 1;
        }

        INFO("Backtest completed successfully");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
