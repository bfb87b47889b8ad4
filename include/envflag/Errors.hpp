/**
 * @file Errors.hpp
 * @brief Exception types for envflag registration and resolution errors
 *
 * Error taxonomy:
 * - FlagError: Base class
 * - UnsupportedTypeError: Declared type outside the supported set
 * - DuplicateFlagError: Flag name registered twice
 * - RegistrationError: Flag registered in an invalid state
 * - ParseStateError: FlagSet parsed more than once
 * - ArgumentParseError: Malformed command-line input (PanicOnError)
 * - HelpRequested: -h / --help seen on the command line (PanicOnError)
 * - EnvCoercionError: Environment value cannot be converted to the flag type
 * - DeclarationError: Malformed runtime flag declaration
 */

#ifndef ENVFLAG_ERRORS_HPP
#define ENVFLAG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace envflag {

/**
 * @brief Base class for all envflag exceptions
 */
class FlagError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A flag was declared with a type outside the supported set
 */
class UnsupportedTypeError : public FlagError {
public:
    /**
     * @brief Construct with the rejected type and the flag name
     * @param type Type name as written by the caller (e.g., "complex")
     * @param flag Name of the flag being declared
     */
    UnsupportedTypeError(std::string type, std::string flag)
        : FlagError("invalid type: '" + type + "' for flag '" + flag + "'")
        , type_(std::move(type))
        , flag_(std::move(flag))
    {}

    const std::string& type() const noexcept { return type_; }
    const std::string& flag() const noexcept { return flag_; }

private:
    std::string type_;
    std::string flag_;
};

/**
 * @brief A flag name was registered twice in the same FlagSet
 */
class DuplicateFlagError : public FlagError {
public:
    explicit DuplicateFlagError(std::string flag)
        : FlagError("flag redefined: " + flag)
        , flag_(std::move(flag))
    {}

    const std::string& flag() const noexcept { return flag_; }

private:
    std::string flag_;
};

/**
 * @brief Registration attempted with an empty name or after parse()
 */
class RegistrationError : public FlagError {
public:
    using FlagError::FlagError;
};

/**
 * @brief parse() called on a FlagSet that was already parsed
 */
class ParseStateError : public FlagError {
public:
    using FlagError::FlagError;
};

/**
 * @brief Malformed command-line input
 *
 * Only thrown under ErrorHandling::PanicOnError. The other policies
 * report the same message through FlagSet::error() or stderr.
 */
class ArgumentParseError : public FlagError {
public:
    using FlagError::FlagError;
};

/**
 * @brief The command line asked for usage text
 */
class HelpRequested : public ArgumentParseError {
public:
    explicit HelpRequested(std::string usage)
        : ArgumentParseError("help requested")
        , usage_(std::move(usage))
    {}

    /**
     * @brief Rendered usage text of the FlagSet
     */
    const std::string& usage() const noexcept { return usage_; }

private:
    std::string usage_;
};

/**
 * @brief An environment variable holds text that does not fit the flag type
 *
 * Always fatal to the resolution pass; the default is never used as a
 * fallback.
 */
class EnvCoercionError : public FlagError {
public:
    /**
     * @brief Construct with the variable, flag and offending text
     * @param env Environment variable name that was consulted
     * @param flag Flag the variable was resolved for
     * @param text Literal value that failed to parse
     */
    EnvCoercionError(std::string env, std::string flag, std::string text)
        : FlagError("invalid value \"" + text + "\" for env " + env +
                    " (flag " + flag + "): parse error")
        , env_(std::move(env))
        , flag_(std::move(flag))
        , text_(std::move(text))
    {}

    const std::string& env() const noexcept { return env_; }
    const std::string& flag() const noexcept { return flag_; }
    const std::string& text() const noexcept { return text_; }

private:
    std::string env_;
    std::string flag_;
    std::string text_;
};

/**
 * @brief Malformed runtime declaration ("name:type[@ENV][=default]")
 */
class DeclarationError : public FlagError {
public:
    /**
     * @brief Construct with the declaration text and the reason
     * @param text Declaration as given
     * @param reason What is wrong with it
     */
    DeclarationError(std::string text, std::string reason)
        : FlagError("invalid declaration '" + text + "': " + reason)
        , text_(std::move(text))
        , reason_(std::move(reason))
    {}

    const std::string& text() const noexcept { return text_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string text_;
    std::string reason_;
};

} // namespace envflag

#endif // ENVFLAG_ERRORS_HPP
