// include/basis_trade/backtest/backtest_csv_exporter.hpp
#pragma once

#include <string>
#include "basis_trade/backtest/backtest_result.hpp"
#include "basis_trade/core/error.hpp"

namespace basis_trade {
namespace backtest {

/**
 * @brief Writes a BacktestResult to an output directory
 *
 * Files produced by export_all():
 *   trades.csv        one row per closed trade
 *   equity_curve.csv  date,equity
 *   summary.json      BacktestResult::to_json()
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);

    /**
     * @brief Create the output directory if needed
     */
    Result<void> initialize_directory() const;

    Result<void> export_trades(const BacktestResult& result) const;
    Result<void> export_equity_curve(const BacktestResult& result) const;
    Result<void> export_summary(const BacktestResult& result) const;

    /**
     * @brief Create the directory and write all three files
     * Stops at the first failure.
     */
    Result<void> export_all(const BacktestResult& result) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;

    std::string file_path(const std::string& filename) const;
};

}  // namespace backtest
}  // namespace basis_trade
