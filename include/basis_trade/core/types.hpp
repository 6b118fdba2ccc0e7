// include/basis_trade/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace basis_trade {

/**
 * @brief Timestamp type for consistent time representation
 * Daily data is stored at UTC midnight
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes (units of the underlying)
 */
using Quantity = double;

/**
 * @brief One day of merged spot/futures data fed to the backtester
 */
struct Observation {
    Timestamp date;
    Price spot_price{0.0};
    Price futures_price{0.0};
    Timestamp futures_expiry;

    Observation() = default;
    Observation(Timestamp d, Price spot, Price futures, Timestamp expiry)
        : date(d), spot_price(spot), futures_price(futures), futures_expiry(expiry) {}
};

/**
 * @brief Dated price, used for spot histories and continuous futures series
 */
struct PricePoint {
    Timestamp date;
    Price price{0.0};

    PricePoint() = default;
    PricePoint(Timestamp d, Price p) : date(d), price(p) {}
};

/**
 * @brief Daily close of a single futures contract
 * The expiry is optional because some sources only report the contract code
 */
struct FuturesBar {
    Timestamp date;
    Price price{0.0};
    std::optional<Timestamp> expiry;

    FuturesBar() = default;
    FuturesBar(Timestamp d, Price p, std::optional<Timestamp> e = std::nullopt)
        : date(d), price(p), expiry(e) {}
};

}  // namespace basis_trade
