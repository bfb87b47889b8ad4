/**
 * @file Flag.hpp
 * @brief A single typed flag bound to caller-owned storage
 *
 * A Flag links an identifier, the caller's variable, a usage string and
 * an environment policy. The caller keeps ownership of the variable and
 * reads the resolved value from it after FlagSet::parse().
 */

#ifndef ENVFLAG_FLAG_HPP
#define ENVFLAG_FLAG_HPP

#include "envflag/Coerce.hpp"
#include "envflag/StringList.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace envflag {

/**
 * @brief Environment directive that disables environment lookup
 */
constexpr const char* kNoEnv = "-";

/**
 * @brief Supported flag value types
 */
enum class FlagType {
    Bool,
    Int64,
    Uint64,
    Double,
    Duration,
    String,
    StringList,
};

/**
 * @brief Human-readable type name ("bool", "int64", ..., "list")
 */
const char* type_name(FlagType type) noexcept;

/**
 * @brief Caller-owned storage cell, one alternative per FlagType
 */
using FlagStorage = std::variant<bool*,
                                 std::int64_t*,
                                 std::uint64_t*,
                                 double*,
                                 Duration*,
                                 std::string*,
                                 StringList*>;

/**
 * @brief How a flag is associated with an environment variable
 */
enum class EnvPolicy {
    Auto,       ///< derived from the flag name
    Explicit,   ///< given by the caller
    Suppressed, ///< never read from the environment
};

/**
 * @brief Environment policy plus the explicit variable name, if any
 */
struct EnvDirective {
    EnvPolicy policy = EnvPolicy::Auto;
    std::string name; ///< upper-cased; only meaningful for Explicit

    /**
     * @brief "" -> Auto, "-" -> Suppressed, anything else -> Explicit(upper)
     */
    static EnvDirective from_string(const std::string& env);
};

/**
 * @brief Which layer supplied the current value of a flag
 */
enum class ValueSource {
    Default,
    Environment,
    CommandLine,
};

/**
 * @brief "default", "environment" or "command-line"
 */
const char* source_name(ValueSource source) noexcept;

/**
 * @brief One registered flag.
 *
 * Flags are created by FlagSet::var() and live as long as their FlagSet.
 */
class Flag {
public:
    Flag(std::string name, FlagStorage storage, std::string usage, EnvDirective env);

    Flag(const Flag&) = delete;
    Flag& operator=(const Flag&) = delete;

    const std::string& name() const noexcept { return name_; }
    const std::string& usage() const noexcept { return usage_; }
    const EnvDirective& env_directive() const noexcept { return env_; }
    const FlagStorage& storage() const noexcept { return storage_; }
    FlagType type() const noexcept;

    /**
     * @brief Environment variable consulted by the last resolution pass.
     *
     * Empty before the first pass, for suppressed flags, and for flags
     * pinned by the command line.
     */
    const std::string& env_name() const noexcept { return env_name_; }

    /**
     * @brief True iff the last parse saw this flag on the command line
     */
    bool changed() const noexcept { return changed_; }

    ValueSource source() const noexcept { return source_; }

    /**
     * @brief True when the command line or the environment supplied the value
     */
    bool is_set() const noexcept { return source_ != ValueSource::Default; }

    /**
     * @brief Default value rendered as text (as shown in usage)
     */
    const std::string& default_text() const noexcept { return default_text_; }

    /**
     * @brief Convert text to the flag type and store it.
     *
     * StringList only records the raw text; FlagSet materializes it at the
     * end of the resolution pass.
     *
     * @return false if the text does not parse; storage is left untouched
     */
    bool set_from_text(const std::string& text);

private:
    friend class FlagSet;

    std::string name_;
    FlagStorage storage_;
    std::string usage_;
    EnvDirective env_;
    std::string default_text_;

    std::string env_name_;
    bool changed_ = false;
    ValueSource source_ = ValueSource::Default;

    // Duration flags are tokenized into this cell, then coerced.
    std::string arg_text_;
};

} // namespace envflag

#endif // ENVFLAG_FLAG_HPP
