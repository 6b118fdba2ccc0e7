// include/basis_trade/data/observation_io.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "basis_trade/core/error.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace data {

/**
 * @brief Parameters of the synthetic basis series generator
 */
struct SampleDataParams {
    double base_price{50000.0};
    double volatility{0.02};  // daily stdev of spot returns
    double avg_basis{0.015};  // mean futures premium over spot
    uint32_t seed{42};
};

/**
 * @brief Load observations from a CSV with a header row
 *
 * Required columns: date, spot_price, futures_price, futures_expiry. Other
 * columns (basis_percent, days_to_expiry, ...) are ignored. Rows are
 * returned in file order; out-of-order dates are logged, not rejected.
 */
Result<std::vector<Observation>> load_observations_csv(const std::string& path);

/**
 * @brief Write observations as date,spot_price,futures_price,futures_expiry
 */
Result<void> save_observations_csv(const std::vector<Observation>& observations,
                                   const std::string& path);

/**
 * @brief Observations dated within [start, end] by calendar day, input order kept
 */
std::vector<Observation> filter_date_range(const std::vector<Observation>& observations,
                                           const Timestamp& start, const Timestamp& end);

/**
 * @brief Daily random-walk spot series with a noisy positive basis
 *
 * Spot is floored at 10000 and the basis at -1%. Each day's expiry is the
 * front-month expiry for that date. Identical seeds give identical series.
 */
std::vector<Observation> generate_sample_data(const Timestamp& start, const Timestamp& end,
                                              const SampleDataParams& params = SampleDataParams());

}  // namespace data
}  // namespace basis_trade
