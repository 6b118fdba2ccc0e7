// include/basis_trade/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <string>
#include "basis_trade/core/error.hpp"
#include "basis_trade/core/types.hpp"

namespace basis_trade {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Calendar date broken into its fields
 */
struct CivilDate {
    int year;
    unsigned month;  // 1-12
    unsigned day;    // 1-31
};

/**
 * @brief Number of days since 1970-01-01 for a proleptic Gregorian date
 */
inline int64_t days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

/**
 * @brief Inverse of days_from_civil
 */
inline CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

/**
 * @brief Whole days since the epoch, floored (dates before 1970 are negative)
 */
inline int64_t epoch_days(const Timestamp& ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) {
        --days;
    }
    return days;
}

/**
 * @brief Build a Timestamp at UTC midnight of the given date
 */
inline Timestamp make_date(int year, unsigned month, unsigned day) {
    return Timestamp(std::chrono::seconds(days_from_civil(year, month, day) * 86400));
}

inline CivilDate to_civil(const Timestamp& ts) {
    return civil_from_days(epoch_days(ts));
}

/**
 * @brief Truncate a timestamp to UTC midnight of its day
 */
inline Timestamp date_only(const Timestamp& ts) {
    return Timestamp(std::chrono::seconds(epoch_days(ts) * 86400));
}

/**
 * @brief Day of week with Monday = 0 ... Sunday = 6
 */
inline unsigned weekday(const Timestamp& ts) {
    // 1970-01-01 was a Thursday (3)
    int64_t d = epoch_days(ts);
    return static_cast<unsigned>(((d % 7) + 7 + 3) % 7);
}

inline Timestamp add_days(const Timestamp& ts, int64_t days) {
    return ts + std::chrono::seconds(days * 86400);
}

/**
 * @brief Whole days from `from` to `to`, floored like a calendar difference
 */
inline int64_t days_between(const Timestamp& from, const Timestamp& to) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) {
        --days;
    }
    return days;
}

/**
 * @brief Format a timestamp as YYYY-MM-DD (UTC)
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Parse an ISO date ("YYYY-MM-DD", optionally followed by a time part)
 * @return Timestamp at UTC midnight, or INVALID_DATA
 */
Result<Timestamp> parse_date(const std::string& text);

}  // namespace core
}  // namespace basis_trade
