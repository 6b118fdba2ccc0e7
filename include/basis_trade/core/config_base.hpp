// include/basis_trade/core/config_base.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "basis_trade/core/error.hpp"

namespace basis_trade {

/**
 * @brief Base class for JSON-backed configuration sections
 *
 * Derived configs declare their defaults as member initializers; from_json
 * only overwrites the keys present in the document, so a partial file
 * overrides just the values it names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to filepath, 4-space indented
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Read filepath, apply it with from_json() and validate()
     * @return FILE_NOT_FOUND, FILE_IO_ERROR, JSON_PARSE_ERROR (also for keys
     *         of the wrong type) or the error reported by validate()
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;
    virtual void from_json(const nlohmann::json& j) = 0;

    /**
     * @brief Check value ranges after loading; accepts everything by default
     */
    virtual Result<void> validate() const {
        return Result<void>();
    }
};

}  // namespace basis_trade
