/**
 * @file FlagSet.hpp
 * @brief Layered flag resolution: command line > environment > default
 *
 * A FlagSet owns a collection of Flags and the cxxopts parser they are
 * declared with. parse() tokenizes the command line, pins every flag that
 * was given explicitly, then runs the environment pass over the rest:
 *
 *   1. skip flags set on the command line
 *   2. skip flags whose environment directive is "-"
 *   3. env name = prefix + (explicit name | SCREAMING_SNAKE(flag name))
 *   4. unset or empty variable -> keep the current value (the default)
 *   5. otherwise convert the text into the flag type; failure throws
 *      EnvCoercionError
 *
 * String lists are split after every flag has been resolved.
 *
 * Example:
 * ```cpp
 * bool verbose = false;
 * std::int64_t port = 0;
 *
 * envflag::FlagSet flags("server");
 * flags.var(verbose, "verbose", false, "Log every request");
 * flags.var(port, "port", 8080, "Listen port", "HTTP_PORT");
 * flags.set_prefix("myapp");          // MYAPP_VERBOSE, MYAPP_HTTP_PORT
 * flags.parse(argc, argv);
 * ```
 *
 * Constraints: flags are registered before parse(); a FlagSet is parsed
 * once and may be re-resolved any number of times with reparse(). No
 * internal synchronization: callers serialize access.
 */

#ifndef ENVFLAG_FLAGSET_HPP
#define ENVFLAG_FLAGSET_HPP

#include "envflag/Errors.hpp"
#include "envflag/Flag.hpp"

#include <cxxopts.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace envflag {

/**
 * @brief What parse() does with malformed command-line input
 */
enum class ErrorHandling {
    ContinueOnError, ///< parse() returns false, message in error()
    ExitOnError,     ///< print message and usage to stderr, exit(2)
    PanicOnError,    ///< throw ArgumentParseError
};

class FlagSet {
public:
    /**
     * @brief Create an empty set
     * @param name Program name used in usage text and messages
     * @param handling Policy for command-line errors
     */
    explicit FlagSet(std::string name, ErrorHandling handling = ErrorHandling::ExitOnError);

    FlagSet(const FlagSet&) = delete;
    FlagSet& operator=(const FlagSet&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Register a flag bound to the caller's variable.
     *
     * The variable is set to value immediately and keeps receiving the
     * resolved value for as long as the FlagSet lives.
     *
     * @param storage Caller-owned variable; must outlive the FlagSet
     * @param name Flag identifier (command line name and env name seed)
     * @param value Default value
     * @param usage Help text
     * @param env "" to derive the env name, "-" to disable env lookup,
     *            otherwise the env variable name (upper-cased)
     * @return The registered flag
     * @throws DuplicateFlagError if name is already registered
     * @throws RegistrationError after parse() or for an unusable name
     */
    Flag& var(bool& storage, const std::string& name, bool value,
              const std::string& usage, const std::string& env = "");
    Flag& var(std::int64_t& storage, const std::string& name, std::int64_t value,
              const std::string& usage, const std::string& env = "");
    Flag& var(std::uint64_t& storage, const std::string& name, std::uint64_t value,
              const std::string& usage, const std::string& env = "");
    Flag& var(double& storage, const std::string& name, double value,
              const std::string& usage, const std::string& env = "");
    Flag& var(Duration& storage, const std::string& name, Duration value,
              const std::string& usage, const std::string& env = "");
    Flag& var(std::string& storage, const std::string& name, const std::string& value,
              const std::string& usage, const std::string& env = "");

    /**
     * @brief Register a comma-separated list; value is the default raw text
     */
    Flag& var(StringList& storage, const std::string& name, const std::string& value,
              const std::string& usage, const std::string& env = "");

    /**
     * @brief Any other storage type is not a flag type
     */
    template <typename T>
    Flag& var(T& storage, const std::string& name, const T& value,
              const std::string& usage, const std::string& env = "") = delete;

    /**
     * @brief Set the environment prefix used by the next resolution pass.
     *
     * The prefix is upper-cased and given a single trailing '_'.
     * Values already resolved are not touched until reparse().
     */
    void set_prefix(const std::string& prefix);
    const std::string& prefix() const noexcept { return prefix_; }

    // ========================================================================
    // Resolution
    // ========================================================================

    /**
     * @brief Parse arguments (without program name) and resolve the environment.
     *
     * Accepts "--name value", "--name=value", and the single-dash forms
     * "-name value" / "-name=value". Boolean flags take no value
     * ("--verbose") or an attached one ("--verbose=false"); attached values
     * accept the same spellings as the environment (1, t, TRUE, False, ...).
     * The token after a flag that takes a value is always that value, even
     * when it starts with '-'.
     *
     * If the command line is rejected, every variable keeps the value it
     * had before the call and no flag is marked as changed.
     *
     * @return false if the command line was rejected under ContinueOnError
     * @throws ParseStateError if called twice
     * @throws ArgumentParseError on bad input under PanicOnError
     * @throws EnvCoercionError if an environment value does not parse
     */
    bool parse(const std::vector<std::string>& arguments);

    /**
     * @brief parse() over argv[1..argc)
     */
    bool parse(int argc, const char* const* argv);

    /**
     * @brief Run the environment pass again.
     *
     * Picks up environment changes made after start-up. Flags set on the
     * command line stay pinned; the command line is not re-read.
     *
     * @throws EnvCoercionError if an environment value does not parse
     */
    void reparse();

    bool parsed() const noexcept { return parsed_; }

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Find a flag by name
     * @return nullptr if no such flag
     */
    Flag* lookup(const std::string& name);
    const Flag* lookup(const std::string& name) const;

    /**
     * @brief All flags in registration order
     */
    const std::vector<std::unique_ptr<Flag>>& flags() const noexcept { return flags_; }

    /**
     * @brief Call fn(const Flag&) for every flag in registration order
     */
    template <typename Fn>
    void visit_all(Fn&& fn) const {
        for (const auto& flag : flags_) fn(static_cast<const Flag&>(*flag));
    }

    /**
     * @brief Call fn(const Flag&) for flags set by the command line or env
     */
    template <typename Fn>
    void visit(Fn&& fn) const {
        for (const auto& flag : flags_) {
            if (flag->is_set()) fn(static_cast<const Flag&>(*flag));
        }
    }

    /**
     * @brief Arguments left over after flag parsing
     */
    const std::vector<std::string>& args() const noexcept { return args_; }

    const std::string& name() const noexcept { return name_; }
    ErrorHandling error_handling() const noexcept { return handling_; }

    /**
     * @brief Message of the last rejected command line (ContinueOnError)
     */
    const std::string& error() const noexcept { return error_; }

    /**
     * @brief Usage text rendered by cxxopts
     */
    std::string usage() const;

private:
    std::unique_ptr<Flag> make_flag(const std::string& name, FlagStorage storage,
                                    const std::string& usage, const std::string& env);
    Flag& install(std::unique_ptr<Flag> flag, const std::shared_ptr<const cxxopts::Value>& value);

    const Flag* flag_token(const std::string& arg) const;
    bool takes_next(const std::string& arg) const;
    std::vector<std::string> normalize_arguments(const std::vector<std::string>& arguments) const;
    bool help_requested(const std::vector<std::string>& arguments) const;
    bool fail(const std::string& message);
    bool help();

    void resolve_env();
    void materialize_lists();

    std::string name_;
    ErrorHandling handling_;
    std::string prefix_;
    cxxopts::Options options_;

    std::vector<std::unique_ptr<Flag>> flags_;
    std::map<std::string, Flag*> index_;

    bool parsed_ = false;
    std::vector<std::string> args_;
    std::string error_;
};

} // namespace envflag

#endif // ENVFLAG_FLAGSET_HPP
