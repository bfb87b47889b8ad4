/**
 * @file Names.hpp
 * @brief Environment variable name derivation and list splitting
 *
 * A flag identifier such as "myMixedCaps" maps to the environment
 * variable MY_MIXED_CAPS, optionally behind a namespace prefix
 * (APP_MY_MIXED_CAPS).
 */

#ifndef ENVFLAG_NAMES_HPP
#define ENVFLAG_NAMES_HPP

#include <string>
#include <vector>

namespace envflag {

/**
 * @brief Separator placed between a prefix and a variable name
 */
constexpr char kPrefixSeparator = '_';

/**
 * @brief Convert a flag identifier to SCREAMING_SNAKE_CASE.
 *
 * An underscore is inserted before every upper-case letter whose preceding
 * character is not upper-case; every character is then upper-cased. Runs
 * of capitals are kept together, so names already in screaming-snake form
 * are returned unchanged.
 *
 * Examples:
 *   - myInt             -> MY_INT
 *   - MixedCaps         -> MIXED_CAPS
 *   - already_screaming -> ALREADY_SCREAMING
 *   - HTTPServer        -> HTTPSERVER
 *   - ""                -> ""
 *
 * @param identifier Flag identifier
 * @return Canonical environment variable name
 */
std::string to_screaming_snake(const std::string& identifier);

/**
 * @brief Normalize an environment prefix.
 *
 * Upper-cases the prefix and makes it end with exactly one separator.
 * An empty prefix (or one made only of separators) stays empty.
 *
 * @param prefix Raw prefix, e.g. "myapp" or "MYAPP__"
 * @return Normalized prefix, e.g. "MYAPP_"
 */
std::string normalize_prefix(const std::string& prefix);

/**
 * @brief Prepend a prefix to a variable name unless it is already there.
 *
 * The prefix is normalized first. Idempotent:
 * apply_prefix(apply_prefix(n, p), p) == apply_prefix(n, p).
 *
 * @param name Environment variable name
 * @param prefix Namespace prefix (normalized internally)
 * @return Prefixed name
 */
std::string apply_prefix(const std::string& name, const std::string& prefix);

/**
 * @brief Split on every occurrence of sep and trim each part.
 *
 * "" yields {""} and "a," yields {"a", ""}. An empty separator returns the
 * trimmed input as a single element.
 */
std::vector<std::string> split_with(const std::string& s, const std::string& sep);

/**
 * @brief split_with(s, ",")
 */
std::vector<std::string> split_with_comma(const std::string& s);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& s);

/**
 * @brief Upper-case ASCII letters
 */
std::string to_upper(std::string s);

} // namespace envflag

#endif // ENVFLAG_NAMES_HPP
