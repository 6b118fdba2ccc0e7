// src/calendar/expiry_calendar.cpp
#include "basis_trade/calendar/expiry_calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace calendar {

namespace {

constexpr char CME_MONTH_LETTERS[] = {'F', 'G', 'H', 'J', 'K', 'M',
                                      'N', 'Q', 'U', 'V', 'X', 'Z'};

std::string format_yyyymm(int year, unsigned month) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d%02u", year, month);
    return std::string(buffer);
}

}  // namespace

ExpirySchedule::ExpirySchedule(std::vector<Timestamp> expiries)
    : expiries_(std::move(expiries)) {
    std::sort(expiries_.begin(), expiries_.end());
    expiries_.erase(std::unique(expiries_.begin(), expiries_.end()), expiries_.end());
}

Timestamp last_trading_friday(int year, unsigned month) {
    int next_year = month == 12 ? year + 1 : year;
    unsigned next_month = month == 12 ? 1 : month + 1;
    Timestamp last_day = core::add_days(core::make_date(next_year, next_month, 1), -1);

    // Friday is weekday 4 (Monday = 0)
    unsigned days_back = (core::weekday(last_day) + 7 - 4) % 7;
    return core::add_days(last_day, -static_cast<int64_t>(days_back));
}

ExpirySchedule build_expiry_schedule(const Timestamp& start, const Timestamp& end) {
    core::CivilDate cursor = core::to_civil(start);
    cursor.day = 1;
    Timestamp horizon = core::add_days(core::date_only(end), EXPIRY_SCHEDULE_BUFFER_DAYS);

    std::vector<Timestamp> expiries;
    while (core::make_date(cursor.year, cursor.month, 1) <= horizon) {
        expiries.push_back(last_trading_friday(cursor.year, cursor.month));
        if (cursor.month == 12) {
            cursor.year += 1;
            cursor.month = 1;
        } else {
            cursor.month += 1;
        }
    }
    return ExpirySchedule(std::move(expiries));
}

Result<Timestamp> front_month_expiry(const Timestamp& date, const ExpirySchedule& schedule) {
    if (schedule.empty()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Expiry schedule is empty", "ExpiryCalendar");
    }

    Timestamp day = core::date_only(date);
    const auto& expiries = schedule.expiries();
    auto it = std::lower_bound(expiries.begin(), expiries.end(), day,
                               [](const Timestamp& expiry, const Timestamp& value) {
                                   return core::date_only(expiry) < value;
                               });
    if (it == expiries.end()) {
        return schedule.back();
    }
    return *it;
}

Result<Timestamp> expiry_from_yyyymm(const std::string& code) {
    if (code.size() != 6 || !std::all_of(code.begin(), code.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Expiry code must be YYYYMM: '" + code + "'",
                                     "ExpiryCalendar");
    }
    int year = std::stoi(code.substr(0, 4));
    int month = std::stoi(code.substr(4, 2));
    if (month < 1 || month > 12) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Expiry month out of range: '" + code + "'",
                                     "ExpiryCalendar");
    }
    return last_trading_friday(year, static_cast<unsigned>(month));
}

Result<std::pair<Timestamp, Timestamp>> contract_date_range(const std::string& yyyymm,
                                                            bool end_on_expiry) {
    auto expiry = expiry_from_yyyymm(yyyymm);
    if (expiry.is_error()) {
        return forward_error<std::pair<Timestamp, Timestamp>>(expiry, "ExpiryCalendar");
    }

    core::CivilDate month = core::to_civil(expiry.value());
    Timestamp previous_expiry = month.month == 1
                                    ? last_trading_friday(month.year - 1, 12)
                                    : last_trading_friday(month.year, month.month - 1);

    if (end_on_expiry) {
        return std::make_pair(core::add_days(previous_expiry, 1), expiry.value());
    }
    return std::make_pair(previous_expiry, core::add_days(expiry.value(), -1));
}

std::string front_month_code(const Timestamp& reference_date) {
    core::CivilDate today = core::to_civil(reference_date);
    Timestamp current_expiry = last_trading_friday(today.year, today.month);

    if (core::date_only(reference_date) < current_expiry) {
        return format_yyyymm(today.year, today.month);
    }
    if (today.month == 12) {
        return format_yyyymm(today.year + 1, 1);
    }
    return format_yyyymm(today.year, today.month + 1);
}

std::string yyyymm_code(const Timestamp& date) {
    core::CivilDate c = core::to_civil(date);
    return format_yyyymm(c.year, c.month);
}

int days_to_expiry(const Timestamp& expiry, const Timestamp& from) {
    return static_cast<int>(core::days_between(from, expiry));
}

Result<char> cme_month_code(unsigned month) {
    if (month < 1 || month > 12) {
        return make_error<char>(ErrorCode::INVALID_ARGUMENT,
                                "Month out of range: " + std::to_string(month), "ExpiryCalendar");
    }
    return CME_MONTH_LETTERS[month - 1];
}

std::optional<unsigned> month_from_cme_code(char code) {
    for (unsigned i = 0; i < 12; ++i) {
        if (CME_MONTH_LETTERS[i] == code) {
            return i + 1;
        }
    }
    return std::nullopt;
}

Result<std::string> contract_suffix(const std::string& yyyymm) {
    auto expiry = expiry_from_yyyymm(yyyymm);
    if (expiry.is_error()) {
        return forward_error<std::string>(expiry, "ExpiryCalendar");
    }
    int year = std::stoi(yyyymm.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(yyyymm.substr(4, 2)));
    auto letter = cme_month_code(month);
    if (letter.is_error()) {
        return forward_error<std::string>(letter, "ExpiryCalendar");
    }
    return std::string(1, letter.value()) + std::to_string(year % 10);
}

std::optional<ContractSymbol> parse_contract_symbol(const std::string& symbol) {
    if (symbol.size() < 4 || symbol.find('-') != std::string::npos) {
        return std::nullopt;
    }

    char year_digit = symbol[symbol.size() - 1];
    char month_letter = symbol[symbol.size() - 2];
    if (!std::isdigit(static_cast<unsigned char>(year_digit))) {
        return std::nullopt;
    }
    auto month = month_from_cme_code(month_letter);
    if (!month) {
        return std::nullopt;
    }

    ContractSymbol parsed;
    parsed.base_symbol = symbol.substr(0, symbol.size() - 2);
    parsed.year = CME_YEAR_DIGIT_BASE + (year_digit - '0');
    parsed.month = *month;
    return parsed;
}

}  // namespace calendar
}  // namespace basis_trade
