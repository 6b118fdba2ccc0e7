// include/basis_trade/data/continuous_series.hpp
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "basis_trade/calendar/expiry_calendar.hpp"
#include "basis_trade/core/error.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace data {

/**
 * @brief Per-contract daily closes keyed by (date, YYYYMM contract code)
 */
using ContractPriceTable = std::map<std::pair<Timestamp, std::string>, Price>;

/**
 * @brief Source of single-contract futures histories
 *
 * Implemented by the market data collaborators (broker or vendor file
 * readers). Failures are reported through Result rather than exceptions.
 */
class ContractDataSource {
public:
    virtual ~ContractDataSource() = default;

    /**
     * @brief Daily bars of one contract between start and end (inclusive)
     * @param symbol Base symbol, e.g. "MBT"
     * @param yyyymm Contract month
     * @return Bars sorted by date; an empty vector if the contract has no data
     */
    virtual Result<std::vector<FuturesBar>> get_contract_history(const std::string& symbol,
                                                                 const std::string& yyyymm,
                                                                 const Timestamp& start,
                                                                 const Timestamp& end) = 0;
};

/**
 * @brief History of the contract chosen as tradable front month for a run
 */
struct FrontMonthHistory {
    std::string contract_code;  // YYYYMM
    Timestamp expiry;
    std::vector<FuturesBar> bars;
};

/**
 * @brief Derived basis columns of one observation, as written by the
 * accumulation tools
 */
struct BasisRow {
    Observation observation;
    double basis_absolute{0.0};
    double basis_percent{0.0};     // in percent
    double annualized_basis{0.0};  // in percent
    int days_to_expiry{0};
};

/**
 * @brief Splice per-contract rows into a single front-month series
 *
 * For every distinct date in `rows`, the contract whose code matches the
 * front-month expiry for that date is selected. Dates on which that
 * contract has no row are dropped; gaps are not filled.
 *
 * @param base_symbol Symbol used for logging only
 * @param rows Per-contract closes
 * @param schedule Expiry schedule covering the dates in `rows`
 * @return Chronologically sorted series
 */
Result<std::vector<PricePoint>> build_continuous_series(const std::string& base_symbol,
                                                        const ContractPriceTable& rows,
                                                        const calendar::ExpirySchedule& schedule);

/**
 * @brief Pick the contract to trade for a run starting at `start`
 *
 * Contracts are tried in ascending expiry order starting at the front
 * month for `start`. The first contract returning any bars is used, even if
 * a later contract has denser data.
 *
 * @return The selected history, or DATA_NOT_FOUND if no candidate has data
 */
Result<FrontMonthHistory> select_front_month_contract(ContractDataSource& source,
                                                      const std::string& symbol,
                                                      const Timestamp& start,
                                                      const Timestamp& end);

/**
 * @brief Join spot and futures histories into observations by date
 *
 * Dates present on only one side are skipped. Futures bars without an
 * expiry use `fallback_expiry`.
 */
std::vector<Observation> merge_observations(const std::vector<PricePoint>& spot,
                                            const std::vector<FuturesBar>& futures,
                                            const Timestamp& fallback_expiry);

/**
 * @brief Compute the basis columns for an observation
 */
BasisRow compute_basis_row(const Observation& observation);

/**
 * @brief Re-label each observation's expiry with the front month for its date
 *
 * The schedule spans the first to the last observation. Each change of
 * front month is logged as a roll.
 */
Result<std::vector<Observation>> assign_front_month_expiries(
    const std::vector<Observation>& observations);

}  // namespace data
}  // namespace basis_trade
