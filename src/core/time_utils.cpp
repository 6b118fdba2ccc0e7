// src/core/time_utils.cpp

#include "basis_trade/core/time_utils.hpp"
#include <cctype>
#include <cstdio>

namespace basis_trade {
namespace core {

std::string format_date(const Timestamp& ts) {
    CivilDate c = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
    return std::string(buffer);
}

Result<Timestamp> parse_date(const std::string& text) {
    // Only the leading date part is significant; "2024-02-23T00:00:00" and
    // "2024-02-23 00:00:00" are accepted as well.
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Invalid date format (expected YYYY-MM-DD): '" + text + "'",
                                     "TimeUtils");
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                         "Invalid date digits: '" + text + "'", "TimeUtils");
        }
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Unexpected trailing characters in date: '" + text + "'",
                                     "TimeUtils");
    }

    int year = std::stoi(text.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Date out of range: '" + text + "'", "TimeUtils");
    }

    Timestamp ts = make_date(year, month, day);
    // Reject dates like 2023-02-30 that normalize into the next month
    CivilDate check = to_civil(ts);
    if (check.month != month || check.day != day) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Date does not exist: '" + text + "'", "TimeUtils");
    }
    return ts;
}

}  // namespace core
}  // namespace basis_trade
