/**
 * @file Coerce.hpp
 * @brief Text-to-value conversion for each supported flag type
 *
 * Every parser consumes the whole input and returns std::nullopt on any
 * syntax error or overflow. None of them throw.
 */

#ifndef ENVFLAG_COERCE_HPP
#define ENVFLAG_COERCE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace envflag {

/**
 * @brief Signed count of nanoseconds
 */
using Duration = std::chrono::nanoseconds;

/**
 * @brief Parse a boolean.
 *
 * Accepts 1, t, T, TRUE, true, True and 0, f, F, FALSE, false, False.
 */
std::optional<bool> parse_bool(const std::string& text);

/**
 * @brief Parse a base-10 signed 64-bit integer with optional sign
 */
std::optional<std::int64_t> parse_int64(const std::string& text);

/**
 * @brief Parse a base-10 unsigned 64-bit integer (optional leading '+')
 */
std::optional<std::uint64_t> parse_uint64(const std::string& text);

/**
 * @brief Parse a decimal or exponential floating point number
 */
std::optional<double> parse_double(const std::string& text);

/**
 * @brief Parse a duration such as "300ms", "-1.5h" or "2h45m".
 *
 * A duration is an optional sign followed by one or more decimal numbers,
 * each with an optional fraction and a mandatory unit suffix. Valid units
 * are "ns", "us" (or "µs"), "ms", "s", "m", "h". The bare string "0" is
 * accepted as zero.
 *
 * Examples:
 * ```cpp
 * parse_duration("1h30m")  // 5400s
 * parse_duration("1.5s")   // 1500ms
 * parse_duration("-2m3s")  // -123s
 * parse_duration("10")     // nullopt (missing unit)
 * ```
 */
std::optional<Duration> parse_duration(const std::string& text);

/**
 * @brief Format a duration in the syntax accepted by parse_duration.
 *
 * Leading zero units are omitted, fractions lose trailing zeros:
 * 5400s -> "1h30m0s", 1500ms -> "1.5s", 300ms -> "300ms", 0 -> "0s".
 */
std::string format_duration(Duration d);

} // namespace envflag

#endif // ENVFLAG_COERCE_HPP
