#include <gtest/gtest.h>
#include "basis_trade/core/time_utils.hpp"
#include "basis_trade/data/continuous_series.hpp"
#include "../core/test_base.hpp"
#include "mock_contract_source.hpp"

using namespace basis_trade;
using namespace basis_trade::data;
using core::make_date;

class ContinuousSeriesTest : public basis_trade::testing::TestBase {};

TEST_F(ContinuousSeriesTest, SplicesFrontMonthRows) {
    calendar::ExpirySchedule schedule =
        calendar::build_expiry_schedule(make_date(2024, 1, 24), make_date(2024, 1, 30));

    ContractPriceTable rows;
    rows[{make_date(2024, 1, 24), "202401"}] = 100.0;
    rows[{make_date(2024, 1, 24), "202402"}] = 110.0;
    rows[{make_date(2024, 1, 25), "202402"}] = 110.5;  // front-month row missing
    rows[{make_date(2024, 1, 26), "202401"}] = 101.0;  // expiry day stays on January
    rows[{make_date(2024, 1, 26), "202402"}] = 111.0;
    rows[{make_date(2024, 1, 29), "202402"}] = 112.0;

    auto result = build_continuous_series("MBT", rows, schedule);
    ASSERT_TRUE(result.is_ok());
    const auto& series = result.value();

    ASSERT_EQ(series.size(), 3u);
    EXPECT_EQ(series[0].date, make_date(2024, 1, 24));
    EXPECT_DOUBLE_EQ(series[0].price, 100.0);
    EXPECT_EQ(series[1].date, make_date(2024, 1, 26));
    EXPECT_DOUBLE_EQ(series[1].price, 101.0);
    EXPECT_EQ(series[2].date, make_date(2024, 1, 29));
    EXPECT_DOUBLE_EQ(series[2].price, 112.0);
}

TEST_F(ContinuousSeriesTest, EmptyRowsGiveEmptySeries) {
    calendar::ExpirySchedule schedule =
        calendar::build_expiry_schedule(make_date(2024, 1, 1), make_date(2024, 1, 31));
    auto result = build_continuous_series("MBT", ContractPriceTable(), schedule);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ContinuousSeriesTest, EmptyScheduleIsAnError) {
    ContractPriceTable rows;
    rows[{make_date(2024, 1, 24), "202401"}] = 100.0;

    auto result = build_continuous_series("MBT", rows, calendar::ExpirySchedule());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ContinuousSeriesTest, SelectFrontMonthTriesContractsInExpiryOrder) {
    basis_trade::testing::MockContractSource source;
    source.fail_on("202403");
    source.add_history("202404", {FuturesBar(make_date(2024, 1, 29), 43000.0),
                                  FuturesBar(make_date(2024, 1, 30), 43100.0)});
    // Outside the requested window
    source.add_history("202402", {FuturesBar(make_date(2023, 12, 1), 40000.0)});

    auto result =
        select_front_month_contract(source, "MBT", make_date(2024, 1, 27), make_date(2024, 2, 20));
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    const auto& selected = result.value();
    EXPECT_EQ(selected.contract_code, "202404");
    EXPECT_EQ(selected.expiry, make_date(2024, 4, 26));
    EXPECT_EQ(selected.bars.size(), 2u);

    EXPECT_EQ(source.requested(), (std::vector<std::string>{"202402", "202403", "202404"}));
}

TEST_F(ContinuousSeriesTest, SelectFrontMonthStopsAtFirstHit) {
    basis_trade::testing::MockContractSource source;
    source.add_history("202401", {FuturesBar(make_date(2024, 1, 5), 44000.0)});
    source.add_history("202402", {FuturesBar(make_date(2024, 1, 5), 44500.0)});

    auto result =
        select_front_month_contract(source, "MBT", make_date(2024, 1, 2), make_date(2024, 1, 20));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().contract_code, "202401");
    EXPECT_EQ(source.requested().size(), 1u);
}

TEST_F(ContinuousSeriesTest, SelectFrontMonthWithoutDataFails) {
    basis_trade::testing::MockContractSource source;

    auto result =
        select_front_month_contract(source, "MBT", make_date(2024, 1, 2), make_date(2024, 1, 20));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_FALSE(source.requested().empty());
}

TEST_F(ContinuousSeriesTest, MergeSkipsDatesMissingOnEitherSide) {
    Timestamp fallback = make_date(2024, 1, 26);
    Timestamp listed = make_date(2024, 2, 23);

    std::vector<PricePoint> spot = {PricePoint(make_date(2024, 1, 1), 42000.0),
                                    PricePoint(make_date(2024, 1, 2), 42500.0),
                                    PricePoint(make_date(2024, 1, 3), 43000.0),
                                    PricePoint(make_date(2024, 1, 4), 43500.0)};
    std::vector<FuturesBar> futures = {FuturesBar(make_date(2024, 1, 1), 42600.0, listed),
                                       FuturesBar(make_date(2024, 1, 3), 43700.0, listed),
                                       FuturesBar(make_date(2024, 1, 4), 44100.0),
                                       FuturesBar(make_date(2024, 1, 5), 44200.0, listed)};

    auto merged = merge_observations(spot, futures, fallback);

    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[0].date, make_date(2024, 1, 1));
    EXPECT_DOUBLE_EQ(merged[0].spot_price, 42000.0);
    EXPECT_DOUBLE_EQ(merged[0].futures_price, 42600.0);
    EXPECT_EQ(merged[0].futures_expiry, listed);
    EXPECT_EQ(merged[1].date, make_date(2024, 1, 3));
    EXPECT_EQ(merged[2].date, make_date(2024, 1, 4));
    EXPECT_EQ(merged[2].futures_expiry, fallback);
}

TEST_F(ContinuousSeriesTest, ComputeBasisRow) {
    Observation obs(make_date(2024, 2, 3), 90000.0, 91000.0, make_date(2024, 2, 23));
    BasisRow row = compute_basis_row(obs);

    EXPECT_DOUBLE_EQ(row.basis_absolute, 1000.0);
    EXPECT_NEAR(row.basis_percent, 1.1111, 1e-4);
    EXPECT_EQ(row.days_to_expiry, 20);
    EXPECT_NEAR(row.annualized_basis, 1.1111 * 365.0 / 20.0, 1e-3);
}

TEST_F(ContinuousSeriesTest, ComputeBasisRowGuards) {
    BasisRow zero_spot =
        compute_basis_row(Observation(make_date(2024, 2, 3), 0.0, 100.0, make_date(2024, 2, 23)));
    EXPECT_DOUBLE_EQ(zero_spot.basis_percent, 0.0);
    EXPECT_DOUBLE_EQ(zero_spot.annualized_basis, 0.0);

    BasisRow expired = compute_basis_row(
        Observation(make_date(2024, 2, 23), 90000.0, 90100.0, make_date(2024, 2, 23)));
    EXPECT_EQ(expired.days_to_expiry, 0);
    EXPECT_GT(expired.basis_percent, 0.0);
    EXPECT_DOUBLE_EQ(expired.annualized_basis, 0.0);
}

TEST_F(ContinuousSeriesTest, AssignFrontMonthExpiriesRollsAfterExpiry) {
    Timestamp stale = make_date(2023, 12, 29);
    std::vector<Observation> input = {
        Observation(make_date(2024, 1, 25), 42000.0, 42500.0, stale),
        Observation(make_date(2024, 1, 26), 42100.0, 42600.0, stale),
        Observation(make_date(2024, 1, 29), 42200.0, 42900.0, stale)};

    auto result = assign_front_month_expiries(input);
    ASSERT_TRUE(result.is_ok());
    const auto& relabeled = result.value();

    ASSERT_EQ(relabeled.size(), 3u);
    EXPECT_EQ(relabeled[0].futures_expiry, make_date(2024, 1, 26));
    EXPECT_EQ(relabeled[1].futures_expiry, make_date(2024, 1, 26));
    EXPECT_EQ(relabeled[2].futures_expiry, make_date(2024, 2, 23));
    // Prices are untouched
    EXPECT_DOUBLE_EQ(relabeled[2].futures_price, 42900.0);
}

TEST_F(ContinuousSeriesTest, AssignFrontMonthExpiriesEmptyInput) {
    auto result = assign_front_month_expiries({});
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
}
