// src/data/continuous_series.cpp
#include "basis_trade/data/continuous_series.hpp"
#include <algorithm>
#include <unordered_map>
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace data {

Result<std::vector<PricePoint>> build_continuous_series(const std::string& base_symbol,
                                                        const ContractPriceTable& rows,
                                                        const calendar::ExpirySchedule& schedule) {
    std::vector<PricePoint> series;
    if (rows.empty()) {
        WARN("No contract rows for " << base_symbol << ", continuous series is empty");
        return series;
    }
    if (schedule.empty()) {
        return make_error<std::vector<PricePoint>>(
            ErrorCode::INVALID_ARGUMENT, "Expiry schedule is empty", "ContinuousSeries");
    }

    // The map is ordered by (date, code), so dates come out already sorted
    auto it = rows.begin();
    while (it != rows.end()) {
        const Timestamp date = it->first.first;
        auto front = calendar::front_month_expiry(date, schedule);
        if (front.is_error()) {
            return make_error<std::vector<PricePoint>>(front.error()->code(),
                                                       front.error()->what(), "ContinuousSeries");
        }

        auto match = rows.find(std::make_pair(date, calendar::yyyymm_code(front.value())));
        if (match != rows.end()) {
            series.emplace_back(date, match->second);
        } else {
            TRACE("No front-month row for " << base_symbol << " on " << core::format_date(date));
        }

        while (it != rows.end() && it->first.first == date) {
            ++it;
        }
    }

    DEBUG("Continuous series for " << base_symbol << ": " << series.size() << " bars");
    return series;
}

Result<FrontMonthHistory> select_front_month_contract(ContractDataSource& source,
                                                      const std::string& symbol,
                                                      const Timestamp& start,
                                                      const Timestamp& end) {
    calendar::ExpirySchedule schedule = calendar::build_expiry_schedule(start, end);
    auto front = calendar::front_month_expiry(start, schedule);
    if (front.is_error()) {
        return forward_error<FrontMonthHistory>(front, "ContinuousSeries");
    }

    for (const auto& candidate : schedule.expiries()) {
        if (candidate < front.value()) {
            continue;
        }

        std::string code = calendar::yyyymm_code(candidate);
        DEBUG("Trying contract " << symbol << " " << code);

        auto history = source.get_contract_history(symbol, code, start, end);
        if (history.is_error()) {
            WARN("Contract " << symbol << " " << code
                             << " unavailable: " << history.error()->what());
            continue;
        }
        if (history.value().empty()) {
            DEBUG("No data for " << symbol << " " << code << ", trying next");
            continue;
        }

        INFO("Using contract " << symbol << " " << code << " (" << history.value().size()
                               << " bars)");
        FrontMonthHistory selected;
        selected.contract_code = code;
        selected.expiry = candidate;
        selected.bars = history.value();
        return selected;
    }

    return make_error<FrontMonthHistory>(
        ErrorCode::DATA_NOT_FOUND,
        "No futures data for any " + symbol + " contract from " + core::format_date(start),
        "ContinuousSeries");
}

std::vector<Observation> merge_observations(const std::vector<PricePoint>& spot,
                                            const std::vector<FuturesBar>& futures,
                                            const Timestamp& fallback_expiry) {
    std::unordered_map<int64_t, const FuturesBar*> futures_by_day;
    futures_by_day.reserve(futures.size());
    for (const auto& bar : futures) {
        futures_by_day[core::epoch_days(bar.date)] = &bar;
    }

    std::vector<Observation> merged;
    merged.reserve(std::min(spot.size(), futures.size()));
    size_t skipped = 0;

    for (const auto& point : spot) {
        auto it = futures_by_day.find(core::epoch_days(point.date));
        if (it == futures_by_day.end()) {
            ++skipped;
            continue;
        }
        const FuturesBar& bar = *it->second;
        merged.emplace_back(point.date, point.price, bar.price,
                            bar.expiry.value_or(fallback_expiry));
    }

    if (skipped > 0) {
        DEBUG("Merge skipped " << skipped << " spot dates without futures data");
    }
    return merged;
}

BasisRow compute_basis_row(const Observation& observation) {
    BasisRow row;
    row.observation = observation;
    row.basis_absolute = observation.futures_price - observation.spot_price;
    row.basis_percent = observation.spot_price != 0.0
                            ? row.basis_absolute / observation.spot_price * 100.0
                            : 0.0;
    row.days_to_expiry = calendar::days_to_expiry(observation.futures_expiry, observation.date);
    row.annualized_basis =
        row.days_to_expiry > 0 ? row.basis_percent * (365.0 / row.days_to_expiry) : 0.0;
    return row;
}

Result<std::vector<Observation>> assign_front_month_expiries(
    const std::vector<Observation>& observations) {
    std::vector<Observation> relabeled;
    if (observations.empty()) {
        return relabeled;
    }

    calendar::ExpirySchedule schedule =
        calendar::build_expiry_schedule(observations.front().date, observations.back().date);
    INFO("Generated " << schedule.size() << " expiry dates");

    relabeled.reserve(observations.size());
    std::optional<Timestamp> current_expiry;

    for (const auto& obs : observations) {
        auto front = calendar::front_month_expiry(obs.date, schedule);
        if (front.is_error()) {
            return make_error<std::vector<Observation>>(front.error()->code(),
                                                        front.error()->what(), "ContinuousSeries");
        }

        if (!current_expiry) {
            INFO("Initial contract expiry: " << core::format_date(front.value()));
        } else if (front.value() != *current_expiry) {
            INFO("Contract roll on " << core::format_date(obs.date) << ": "
                                     << core::format_date(*current_expiry) << " ("
                                     << calendar::days_to_expiry(*current_expiry, obs.date)
                                     << " days) -> " << core::format_date(front.value()) << " ("
                                     << calendar::days_to_expiry(front.value(), obs.date)
                                     << " days)");
        }
        current_expiry = front.value();

        Observation updated = obs;
        updated.futures_expiry = front.value();
        relabeled.push_back(updated);
    }
    return relabeled;
}

}  // namespace data
}  // namespace basis_trade
