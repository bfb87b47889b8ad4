/**
 * @file StringList.hpp
 * @brief Comma-separated list flag value
 */

#ifndef ENVFLAG_STRINGLIST_HPP
#define ENVFLAG_STRINGLIST_HPP

#include <string>
#include <utility>
#include <vector>

namespace envflag {

/**
 * @brief A list of strings received as one comma-separated text.
 *
 * The command line and the environment only ever write the raw text.
 * FlagSet materializes the list once per resolution pass, after every
 * source has been applied, so value() always reflects the text that won.
 *
 * Example:
 * ```cpp
 * StringList hosts;
 * flags.var(hosts, "hosts", "", "Upstream hosts");
 * flags.parse({"--hosts", "a, b ,c"});
 * hosts.value();  // {"a", "b", "c"}
 * ```
 */
class StringList {
public:
    StringList() = default;

    /**
     * @brief Unsplit text as last received
     */
    const std::string& raw() const noexcept { return raw_; }

    /**
     * @brief Replace the raw text; value() is unchanged until materialize()
     */
    void set_raw(std::string raw) { raw_ = std::move(raw); }

    /**
     * @brief Split raw() on commas and trim every element.
     *
     * An empty raw text yields an empty list.
     */
    void materialize();

    /**
     * @brief Materialized elements (empty before the first materialize())
     */
    const std::vector<std::string>& value() const noexcept { return value_; }

private:
    friend class FlagSet;

    std::string raw_;
    std::vector<std::string> value_;
};

} // namespace envflag

#endif // ENVFLAG_STRINGLIST_HPP
