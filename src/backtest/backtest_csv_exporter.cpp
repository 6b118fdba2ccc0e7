// src/backtest/backtest_csv_exporter.cpp
#include "basis_trade/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

std::string BacktestCSVExporter::file_path(const std::string& filename) const {
    return (std::filesystem::path(output_directory_) / filename).string();
}

Result<void> BacktestCSVExporter::initialize_directory() const {
    try {
        std::filesystem::create_directories(output_directory_);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error creating output directory: ") + e.what(),
                                "BacktestCSVExporter");
    }
}

Result<void> BacktestCSVExporter::export_trades(const BacktestResult& result) const {
    const std::string path = file_path("trades.csv");
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", "BacktestCSVExporter");
    }

    file << "entry_date,exit_date,entry_spot,entry_futures,exit_spot,exit_futures,"
         << "entry_basis,exit_basis,holding_days,funding_cost,total_costs,realized_pnl,"
         << "return_pct,status\n";
    file << std::fixed << std::setprecision(2);

    for (const auto& trade : result.trades) {
        file << core::format_date(trade.entry_date) << ","
             << (trade.exit_date ? core::format_date(*trade.exit_date) : "") << ","
             << trade.entry_spot << "," << trade.entry_futures << ","
             << trade.exit_spot.value_or(0.0) << "," << trade.exit_futures.value_or(0.0) << ","
             << trade.entry_basis << "," << trade.exit_basis.value_or(0.0) << ","
             << trade.holding_days() << "," << trade.funding_cost << ","
             << trade.costs.total_costs() << "," << trade.realized_pnl.value_or(0.0) << ","
             << std::setprecision(4) << trade.return_pct().value_or(0.0) * 100.0
             << std::setprecision(2) << "," << trade_status_to_string(trade.status) << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_equity_curve(const BacktestResult& result) const {
    const std::string path = file_path("equity_curve.csv");
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", "BacktestCSVExporter");
    }

    file << "date,equity\n";
    file << std::fixed << std::setprecision(2);
    for (const auto& [date, equity] : result.equity_curve) {
        file << core::format_date(date) << "," << equity << "\n";
    }

    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_summary(const BacktestResult& result) const {
    const std::string path = file_path("summary.json");
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path + " for writing", "BacktestCSVExporter");
    }

    file << result.to_json().dump(2) << "\n";
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing " + path,
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_all(const BacktestResult& result) const {
    auto dir_result = initialize_directory();
    if (dir_result.is_error()) {
        return dir_result;
    }

    auto trades_result = export_trades(result);
    if (trades_result.is_error()) {
        return trades_result;
    }

    auto equity_result = export_equity_curve(result);
    if (equity_result.is_error()) {
        return equity_result;
    }

    auto summary_result = export_summary(result);
    if (summary_result.is_error()) {
        return summary_result;
    }

    INFO("Exported " << result.trades.size() << " trades to " << output_directory_);
    return Result<void>();
}

}  // namespace backtest
}  // namespace basis_trade
