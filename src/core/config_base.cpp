// src/core/config_base.cpp
#include "basis_trade/core/config_base.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace basis_trade {

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot write config file " + filepath,
                                "ConfigBase");
    }

    file << std::setw(4) << to_json() << std::endl;
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed writing config file " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filepath, ec)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND, "Config file not found: " + filepath,
                                "ConfigBase");
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Cannot read config file " + filepath,
                                "ConfigBase");
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid config " + filepath + ": " + e.what(), "ConfigBase");
    }

    auto valid = validate();
    if (valid.is_error()) {
        return forward_error<void>(valid, "ConfigBase");
    }
    return Result<void>();
}

}  // namespace basis_trade
