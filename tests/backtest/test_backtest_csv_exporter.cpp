#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "../core/test_base.hpp"
#include "basis_trade/backtest/backtest_csv_exporter.hpp"
#include "basis_trade/backtest/backtest_engine.hpp"
#include "basis_trade/core/time_utils.hpp"

using namespace basis_trade;
using namespace basis_trade::backtest;

class BacktestCSVExporterTest : public basis_trade::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        output_dir = std::filesystem::temp_directory_path() / "basis_trade_exporter_test";
        std::filesystem::remove_all(output_dir);

        BacktestConfig config;
        config.holding_days = 10;
        const Timestamp expiry = core::make_date(2024, 1, 21);
        result = BacktestEngine(config).run(
            {Observation(core::make_date(2024, 1, 1), 90000.0, 91000.0, expiry),
             Observation(core::make_date(2024, 1, 11), 92000.0, 92500.0, expiry)});
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir);
        TestBase::TearDown();
    }

    static std::vector<std::string> read_lines(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path output_dir;
    BacktestResult result;
};

TEST_F(BacktestCSVExporterTest, ExportAllWritesThreeFiles) {
    BacktestCSVExporter exporter(output_dir.string());
    auto export_result = exporter.export_all(result);
    ASSERT_TRUE(export_result.is_ok()) << export_result.error()->what();

    EXPECT_TRUE(std::filesystem::exists(output_dir / "trades.csv"));
    EXPECT_TRUE(std::filesystem::exists(output_dir / "equity_curve.csv"));
    EXPECT_TRUE(std::filesystem::exists(output_dir / "summary.json"));
}

TEST_F(BacktestCSVExporterTest, TradesCsvHasOneRowPerTrade) {
    BacktestCSVExporter exporter(output_dir.string());
    ASSERT_TRUE(exporter.export_all(result).is_ok());

    auto lines = read_lines(output_dir / "trades.csv");
    ASSERT_EQ(lines.size(), result.trades.size() + 1);
    EXPECT_EQ(lines[0],
              "entry_date,exit_date,entry_spot,entry_futures,exit_spot,exit_futures,"
              "entry_basis,exit_basis,holding_days,funding_cost,total_costs,realized_pnl,"
              "return_pct,status");
    EXPECT_EQ(lines[1].substr(0, 22), "2024-01-01,2024-01-11,");
    EXPECT_NE(lines[1].find(",376.71,"), std::string::npos);
    EXPECT_NE(lines[1].find(",closed"), std::string::npos);
    EXPECT_NE(lines[2].find(",forced_close"), std::string::npos);
}

TEST_F(BacktestCSVExporterTest, EquityCurveCsv) {
    BacktestCSVExporter exporter(output_dir.string());
    ASSERT_TRUE(exporter.export_all(result).is_ok());

    auto lines = read_lines(output_dir / "equity_curve.csv");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "date,equity");
    EXPECT_EQ(lines[1], "2024-01-01,200000.00");
    EXPECT_EQ(lines[2], "2024-01-11,200376.71");
}

TEST_F(BacktestCSVExporterTest, SummaryJsonMatchesResult) {
    BacktestCSVExporter exporter(output_dir.string());
    ASSERT_TRUE(exporter.export_all(result).is_ok());

    std::ifstream file(output_dir / "summary.json");
    nlohmann::json j = nlohmann::json::parse(file);
    ASSERT_TRUE(j.contains("summary"));
    EXPECT_EQ(j["summary"]["total_trades"].get<int>(), 2);
    EXPECT_EQ(j["summary"]["start_date"].get<std::string>(), "2024-01-01");
    EXPECT_TRUE(j["summary"]["profit_factor"].is_null());
    EXPECT_EQ(j["trades"].size(), 2u);
    EXPECT_EQ(j["trades"][0]["status"].get<std::string>(), "closed");
}

TEST_F(BacktestCSVExporterTest, UnwritableDirectoryReported) {
    std::filesystem::create_directories(output_dir);
    const auto blocker = output_dir / "not_a_directory";
    std::ofstream(blocker) << "x";

    BacktestCSVExporter exporter((blocker / "nested").string());
    auto export_result = exporter.export_all(result);
    ASSERT_TRUE(export_result.is_error());
    EXPECT_EQ(export_result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
