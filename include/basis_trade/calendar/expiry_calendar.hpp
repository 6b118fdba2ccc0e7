// include/basis_trade/calendar/expiry_calendar.hpp
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "basis_trade/core/error.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace calendar {

/// Days past the end of a requested range that a schedule still covers
constexpr int EXPIRY_SCHEDULE_BUFFER_DAYS = 60;

/// CME year digits cycle every 10 years, decoded against this base ("6" = 2026)
constexpr int CME_YEAR_DIGIT_BASE = 2020;

/**
 * @brief Sorted, duplicate-free list of month-end contract expiries
 */
class ExpirySchedule {
public:
    ExpirySchedule() = default;
    explicit ExpirySchedule(std::vector<Timestamp> expiries);

    const std::vector<Timestamp>& expiries() const {
        return expiries_;
    }

    bool empty() const {
        return expiries_.empty();
    }

    size_t size() const {
        return expiries_.size();
    }

    const Timestamp& front() const {
        return expiries_.front();
    }

    const Timestamp& back() const {
        return expiries_.back();
    }

private:
    std::vector<Timestamp> expiries_;
};

/**
 * @brief Parsed CME futures symbol such as "MBTG6"
 */
struct ContractSymbol {
    std::string base_symbol;
    int year;
    unsigned month;
};

/**
 * @brief Last Friday on or before the last calendar day of the month
 * CME Bitcoin futures expire on this day.
 */
Timestamp last_trading_friday(int year, unsigned month);

/**
 * @brief Expiries for every month from start's month through end + 60 days
 */
ExpirySchedule build_expiry_schedule(const Timestamp& start, const Timestamp& end);

/**
 * @brief Nearest expiry on or after the date
 *
 * Dates past the last buffered expiry resolve to the schedule's last entry
 * rather than failing.
 *
 * @return The front-month expiry, or INVALID_ARGUMENT for an empty schedule
 */
Result<Timestamp> front_month_expiry(const Timestamp& date, const ExpirySchedule& schedule);

/**
 * @brief Expiry of a six-digit YYYYMM contract code
 */
Result<Timestamp> expiry_from_yyyymm(const std::string& code);

/**
 * @brief Trading window of one contract, bounded by the previous and its own expiry
 *
 * By default the window runs from the previous month's expiry through the
 * day before this contract's expiry. With end_on_expiry it starts the day
 * after the previous expiry and ends on this contract's expiry.
 *
 * @return {start, end}, or INVALID_ARGUMENT for a malformed code
 */
Result<std::pair<Timestamp, Timestamp>> contract_date_range(const std::string& yyyymm,
                                                            bool end_on_expiry = false);

/**
 * @brief YYYYMM code of the front-month contract as seen on reference_date
 *
 * Before the current month's last trading Friday the current month is the
 * front month; from that day on the code rolls to the next month.
 */
std::string front_month_code(const Timestamp& reference_date);

/**
 * @brief YYYYMM code of the month containing the date
 */
std::string yyyymm_code(const Timestamp& date);

/**
 * @brief Calendar days from `from` to `expiry` (negative once expired)
 */
int days_to_expiry(const Timestamp& expiry, const Timestamp& from);

/**
 * @brief CME month letter (F, G, H, ... Z) for month 1-12
 */
Result<char> cme_month_code(unsigned month);

/**
 * @brief Month number for a CME month letter
 */
std::optional<unsigned> month_from_cme_code(char code);

/**
 * @brief Convert YYYYMM to the exchange symbol suffix, e.g. "202602" -> "G6"
 */
Result<std::string> contract_suffix(const std::string& yyyymm);

/**
 * @brief Parse a symbol like "MBTG6" into base symbol, year and month
 * Calendar spreads (symbols containing '-') are rejected.
 */
std::optional<ContractSymbol> parse_contract_symbol(const std::string& symbol);

}  // namespace calendar
}  // namespace basis_trade
