#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "basis_trade/core/time_utils.hpp"
#include "basis_trade/data/observation_io.hpp"
#include "../core/test_base.hpp"

using namespace basis_trade;
using namespace basis_trade::data;
using core::make_date;

class ObservationIOTest : public basis_trade::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "basis_observation_io_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::filesystem::path path = test_dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ObservationIOTest, LoadsAccumulatorFormatWithExtraColumns) {
    std::string path = write_file(
        "basis.csv",
        "date,spot_price,futures_price,futures_expiry,basis_absolute,basis_percent,"
        "days_to_expiry,annualized_basis\n"
        "2024-02-02,43000.50,43500.25,2024-02-23,499.75,1.16,21,20.2\n"
        "2024-02-03T00:00:00,43100.00,43550.00,2024-02-23 00:00:00,450.0,1.04,20,19.0\r\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();
    const auto& obs = result.value();

    ASSERT_EQ(obs.size(), 2u);
    EXPECT_EQ(obs[0].date, make_date(2024, 2, 2));
    EXPECT_DOUBLE_EQ(obs[0].spot_price, 43000.50);
    EXPECT_DOUBLE_EQ(obs[0].futures_price, 43500.25);
    EXPECT_EQ(obs[0].futures_expiry, make_date(2024, 2, 23));
    EXPECT_EQ(obs[1].date, make_date(2024, 2, 3));
    EXPECT_EQ(obs[1].futures_expiry, make_date(2024, 2, 23));
}

TEST_F(ObservationIOTest, ColumnOrderComesFromHeader) {
    std::string path = write_file("reordered.csv",
                                  "futures_expiry,futures_price,date,spot_price\n"
                                  "2024-02-23,91000,2024-02-03,90000\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_DOUBLE_EQ(result.value()[0].spot_price, 90000.0);
    EXPECT_DOUBLE_EQ(result.value()[0].futures_price, 91000.0);
}

TEST_F(ObservationIOTest, MissingFileIsReported) {
    auto result = load_observations_csv((test_dir / "nope.csv").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ObservationIOTest, MissingColumnIsInvalidData) {
    std::string path = write_file("no_expiry.csv",
                                  "date,spot_price,futures_price\n"
                                  "2024-02-03,90000,91000\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_NE(std::string(result.error()->what()).find("futures_expiry"), std::string::npos);
}

TEST_F(ObservationIOTest, BadRowNamesTheLine) {
    std::string path = write_file("bad_price.csv",
                                  "date,spot_price,futures_price,futures_expiry\n"
                                  "2024-02-02,90000,91000,2024-02-23\n"
                                  "2024-02-03,ninety,91000,2024-02-23\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_NE(std::string(result.error()->what()).find("Line 3"), std::string::npos);
}

TEST_F(ObservationIOTest, BadDateIsInvalidData) {
    std::string path = write_file("bad_date.csv",
                                  "date,spot_price,futures_price,futures_expiry\n"
                                  "2024-02-30,90000,91000,2024-02-23\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(ObservationIOTest, OutOfOrderRowsAreKeptInFileOrder) {
    std::string path = write_file("unsorted.csv",
                                  "date,spot_price,futures_price,futures_expiry\n"
                                  "2024-02-05,90000,91000,2024-02-23\n"
                                  "2024-02-04,90100,91100,2024-02-23\n");

    auto result = load_observations_csv(path);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].date, make_date(2024, 2, 5));
    EXPECT_EQ(result.value()[1].date, make_date(2024, 2, 4));
}

TEST_F(ObservationIOTest, SaveWritesFourColumnsWithTwoDecimals) {
    std::vector<Observation> obs = {
        Observation(make_date(2024, 2, 2), 43000.5, 43500.0, make_date(2024, 2, 23))};
    std::string path = (test_dir / "nested" / "out.csv").string();

    auto saved = save_observations_csv(obs, path);
    ASSERT_TRUE(saved.is_ok());

    std::ifstream file(path);
    std::string header, row;
    std::getline(file, header);
    std::getline(file, row);
    EXPECT_EQ(header, "date,spot_price,futures_price,futures_expiry");
    EXPECT_EQ(row, "2024-02-02,43000.50,43500.00,2024-02-23");

    auto loaded = load_observations_csv(path);
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_DOUBLE_EQ(loaded.value()[0].spot_price, 43000.5);
}

TEST_F(ObservationIOTest, SampleDataIsDeterministicAndBounded) {
    Timestamp start = make_date(2024, 1, 1);
    Timestamp end = make_date(2024, 3, 31);

    auto first = generate_sample_data(start, end);
    auto second = generate_sample_data(start, end);

    ASSERT_EQ(first.size(), 91u);
    ASSERT_EQ(second.size(), first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_DOUBLE_EQ(first[i].spot_price, second[i].spot_price);
        EXPECT_DOUBLE_EQ(first[i].futures_price, second[i].futures_price);

        EXPECT_GE(first[i].spot_price, 10000.0);
        EXPECT_GE(first[i].futures_price, first[i].spot_price * 0.99 - 1e-6);
        EXPECT_GE(first[i].futures_expiry, first[i].date);
        EXPECT_EQ(core::weekday(first[i].futures_expiry), 4u);
        if (i > 0) {
            EXPECT_EQ(core::days_between(first[i - 1].date, first[i].date), 1);
        }
    }

    SampleDataParams other;
    other.seed = 7;
    auto reseeded = generate_sample_data(start, end, other);
    EXPECT_NE(reseeded[10].spot_price, first[10].spot_price);
}

TEST_F(ObservationIOTest, FilterDateRangeIsInclusive) {
    auto observations = generate_sample_data(make_date(2024, 1, 1), make_date(2024, 3, 31));

    auto window = filter_date_range(observations, make_date(2024, 1, 26), make_date(2024, 2, 22));
    ASSERT_EQ(window.size(), 28u);
    EXPECT_EQ(window.front().date, make_date(2024, 1, 26));
    EXPECT_EQ(window.back().date, make_date(2024, 2, 22));

    EXPECT_TRUE(filter_date_range(observations, make_date(2025, 1, 1), make_date(2025, 2, 1))
                    .empty());
    EXPECT_TRUE(filter_date_range(observations, make_date(2024, 2, 1), make_date(2024, 1, 1))
                    .empty());
}

TEST_F(ObservationIOTest, SampleDataEmptyForReversedRange) {
    EXPECT_TRUE(generate_sample_data(make_date(2024, 2, 1), make_date(2024, 1, 1)).empty());
}
