/**
 * @file Export.hpp
 * @brief JSON and TOML snapshots of resolved flag values
 *
 * Value mapping:
 * - bool, int64, uint64, float64, string -> native JSON / TOML scalars
 * - duration -> text as produced by format_duration() ("1h30m0s")
 * - list -> array of strings (the materialized value)
 */

#ifndef ENVFLAG_EXPORT_HPP
#define ENVFLAG_EXPORT_HPP

#include "envflag/Flag.hpp"
#include "envflag/FlagSet.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <string>

namespace envflag {

/**
 * @brief Current value of one flag as JSON
 */
nlohmann::json value_to_json(const Flag& flag);

/**
 * @brief {flag name: value} for every flag in the set
 */
nlohmann::json to_json(const FlagSet& flags);

/**
 * @brief Per-flag resolution details.
 *
 * ```json
 * {"port": {"type": "int64", "value": 9090, "default": "8080",
 *           "source": "environment", "env": "MYAPP_PORT", "usage": "..."}}
 * ```
 * "env" is null when the flag was pinned by the command line or is
 * suppressed.
 */
nlohmann::json describe(const FlagSet& flags);

/**
 * @brief {flag name: value} as a TOML table
 */
toml::table to_toml(const FlagSet& flags);

/**
 * @brief to_toml() serialized to text
 */
std::string to_toml_string(const FlagSet& flags);

} // namespace envflag

#endif // ENVFLAG_EXPORT_HPP
