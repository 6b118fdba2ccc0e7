// src/data/observation_io.cpp
#include "basis_trade/data/observation_io.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <unordered_map>
#include "basis_trade/calendar/expiry_calendar.hpp"
#include "basis_trade/core/logger.hpp"
#include "basis_trade/core/time_utils.hpp"

namespace basis_trade {
namespace data {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        // Strip \r from files written on Windows, and surrounding blanks
        field.erase(std::remove(field.begin(), field.end(), '\r'), field.end());
        size_t first = field.find_first_not_of(" \t\"");
        size_t last = field.find_last_not_of(" \t\"");
        fields.push_back(first == std::string::npos ? ""
                                                    : field.substr(first, last - first + 1));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

Result<double> parse_price(const std::string& text, const std::string& column, size_t line_no) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Line " + std::to_string(line_no) + ": invalid " + column +
                                      " '" + text + "'",
                                  "ObservationIO");
    }
}

}  // namespace

Result<std::vector<Observation>> load_observations_csv(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return make_error<std::vector<Observation>>(ErrorCode::FILE_NOT_FOUND,
                                                    "Data file not found: " + path,
                                                    "ObservationIO");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<std::vector<Observation>>(ErrorCode::FILE_IO_ERROR,
                                                    "Failed to open data file: " + path,
                                                    "ObservationIO");
    }

    std::string header_line;
    if (!std::getline(file, header_line)) {
        return make_error<std::vector<Observation>>(ErrorCode::INVALID_DATA,
                                                    "Data file is empty: " + path,
                                                    "ObservationIO");
    }

    std::unordered_map<std::string, size_t> columns;
    auto header = split_csv_line(header_line);
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const char* required : {"date", "spot_price", "futures_price", "futures_expiry"}) {
        if (columns.find(required) == columns.end()) {
            return make_error<std::vector<Observation>>(
                ErrorCode::INVALID_DATA,
                std::string("Missing required column '") + required + "' in " + path,
                "ObservationIO");
        }
    }
    const size_t date_col = columns["date"];
    const size_t spot_col = columns["spot_price"];
    const size_t futures_col = columns["futures_price"];
    const size_t expiry_col = columns["futures_expiry"];
    const size_t min_fields = std::max({date_col, spot_col, futures_col, expiry_col}) + 1;

    std::vector<Observation> observations;
    std::string line;
    size_t line_no = 1;
    size_t out_of_order = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_csv_line(line);
        if (fields.size() < min_fields) {
            return make_error<std::vector<Observation>>(
                ErrorCode::INVALID_DATA,
                "Line " + std::to_string(line_no) + ": expected at least " +
                    std::to_string(min_fields) + " fields",
                "ObservationIO");
        }

        auto date = core::parse_date(fields[date_col]);
        if (date.is_error()) {
            return make_error<std::vector<Observation>>(
                ErrorCode::INVALID_DATA,
                "Line " + std::to_string(line_no) + ": " + date.error()->what(), "ObservationIO");
        }
        auto expiry = core::parse_date(fields[expiry_col]);
        if (expiry.is_error()) {
            return make_error<std::vector<Observation>>(
                ErrorCode::INVALID_DATA,
                "Line " + std::to_string(line_no) + ": " + expiry.error()->what(),
                "ObservationIO");
        }
        auto spot = parse_price(fields[spot_col], "spot_price", line_no);
        if (spot.is_error()) {
            return make_error<std::vector<Observation>>(spot.error()->code(),
                                                        spot.error()->what(), "ObservationIO");
        }
        auto futures = parse_price(fields[futures_col], "futures_price", line_no);
        if (futures.is_error()) {
            return make_error<std::vector<Observation>>(futures.error()->code(),
                                                        futures.error()->what(), "ObservationIO");
        }

        if (!observations.empty() && date.value() <= observations.back().date) {
            ++out_of_order;
        }
        observations.emplace_back(date.value(), spot.value(), futures.value(), expiry.value());
    }

    if (out_of_order > 0) {
        WARN(path << ": " << out_of_order << " rows are not in strictly increasing date order");
    }
    INFO("Loaded " << observations.size() << " observations from " << path);
    return observations;
}

Result<void> save_observations_csv(const std::vector<Observation>& observations,
                                   const std::string& path) {
    try {
        std::filesystem::path out(path);
        if (out.has_parent_path()) {
            std::filesystem::create_directories(out.parent_path());
        }
        std::ofstream file(out);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open file for writing: " + path, "ObservationIO");
        }

        file << "date,spot_price,futures_price,futures_expiry\n";
        file << std::fixed << std::setprecision(2);
        for (const auto& obs : observations) {
            file << core::format_date(obs.date) << "," << obs.spot_price << ","
                 << obs.futures_price << "," << core::format_date(obs.futures_expiry) << "\n";
        }
        INFO("Saved " << observations.size() << " rows to " << path);
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error writing observations: ") + e.what(),
                                "ObservationIO");
    }
}

std::vector<Observation> filter_date_range(const std::vector<Observation>& observations,
                                           const Timestamp& start, const Timestamp& end) {
    const Timestamp first = core::date_only(start);
    const Timestamp last = core::date_only(end);
    std::vector<Observation> window;
    for (const auto& obs : observations) {
        const Timestamp day = core::date_only(obs.date);
        if (day >= first && day <= last) {
            window.push_back(obs);
        }
    }
    return window;
}

std::vector<Observation> generate_sample_data(const Timestamp& start, const Timestamp& end,
                                              const SampleDataParams& params) {
    std::vector<Observation> data;
    Timestamp first = core::date_only(start);
    Timestamp last = core::date_only(end);
    if (last < first) {
        return data;
    }

    std::mt19937 rng(params.seed);
    std::normal_distribution<double> price_noise(0.0, params.volatility);
    std::normal_distribution<double> basis_noise(params.avg_basis, 0.01);

    calendar::ExpirySchedule schedule = calendar::build_expiry_schedule(first, last);
    double price = params.base_price;

    for (Timestamp day = first; day <= last; day = core::add_days(day, 1)) {
        price = std::max(10000.0, price + price_noise(rng) * price);
        double basis_pct = std::max(-0.01, basis_noise(rng));

        Observation obs;
        obs.date = day;
        obs.spot_price = price;
        obs.futures_price = price * (1.0 + basis_pct);
        // The schedule is never empty for a non-empty range
        obs.futures_expiry = calendar::front_month_expiry(day, schedule).value();
        data.push_back(obs);
    }
    return data;
}

}  // namespace data
}  // namespace basis_trade
