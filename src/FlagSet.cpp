/**
 * @file FlagSet.cpp
 * @brief Implementation of registration and the precedence pass
 */

#include "envflag/FlagSet.hpp"
#include "envflag/Names.hpp"

#include <cstddef>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <sstream>

namespace envflag {

namespace {

// One closure per flag that puts the variable back to its current value.
std::vector<std::function<void()>> save_storage(const std::vector<std::unique_ptr<Flag>>& flags) {
    std::vector<std::function<void()>> restore;
    restore.reserve(flags.size());
    for (const auto& flag : flags) {
        restore.push_back(std::visit([](auto* cell) -> std::function<void()> {
            auto saved = *cell;
            return [cell, saved] { *cell = saved; };
        }, flag->storage()));
    }
    return restore;
}

void restore_storage(const std::vector<std::function<void()>>& restore) {
    for (const auto& fn : restore) fn();
}

} // namespace

FlagSet::FlagSet(std::string name, ErrorHandling handling)
    : name_(std::move(name))
    , handling_(handling)
    , options_(name_)
{}

// ============================================================================
// Registration
// ============================================================================

std::unique_ptr<Flag> FlagSet::make_flag(const std::string& name, FlagStorage storage,
                                         const std::string& usage, const std::string& env) {
    if (parsed_) {
        throw RegistrationError("flag '" + name + "' registered after parse of '" + name_ + "'");
    }
    if (name.empty()) {
        throw RegistrationError("flag name must not be empty");
    }
    if (index_.count(name) != 0) {
        throw DuplicateFlagError(name);
    }
    return std::make_unique<Flag>(name, storage, usage, EnvDirective::from_string(env));
}

Flag& FlagSet::install(std::unique_ptr<Flag> flag,
                       const std::shared_ptr<const cxxopts::Value>& value) {
    try {
        options_.add_options()(flag->name_, flag->usage_, value);
    } catch (const cxxopts::exceptions::exception& e) {
        throw RegistrationError("cannot register flag '" + flag->name_ + "': " + e.what());
    }

    Flag* raw = flag.get();
    index_.emplace(raw->name_, raw);
    flags_.push_back(std::move(flag));
    return *raw;
}

Flag& FlagSet::var(bool& storage, const std::string& name, bool value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = value ? "true" : "false";
    // cxxopts writes the default back when the flag is absent, so it must
    // match the registered one.
    Flag& installed = install(std::move(flag),
                              cxxopts::value<bool>(storage)->default_value(value ? "true" : "false"));
    storage = value;
    return installed;
}

Flag& FlagSet::var(std::int64_t& storage, const std::string& name, std::int64_t value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = std::to_string(value);
    Flag& installed = install(std::move(flag), cxxopts::value<std::int64_t>(storage));
    storage = value;
    return installed;
}

Flag& FlagSet::var(std::uint64_t& storage, const std::string& name, std::uint64_t value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = std::to_string(value);
    Flag& installed = install(std::move(flag), cxxopts::value<std::uint64_t>(storage));
    storage = value;
    return installed;
}

Flag& FlagSet::var(double& storage, const std::string& name, double value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    std::ostringstream oss;
    oss << value;
    flag->default_text_ = oss.str();
    Flag& installed = install(std::move(flag), cxxopts::value<double>(storage));
    storage = value;
    return installed;
}

Flag& FlagSet::var(Duration& storage, const std::string& name, Duration value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = format_duration(value);
    std::string& text = flag->arg_text_;
    Flag& installed = install(std::move(flag), cxxopts::value<std::string>(text));
    storage = value;
    return installed;
}

Flag& FlagSet::var(std::string& storage, const std::string& name, const std::string& value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = value;
    Flag& installed = install(std::move(flag), cxxopts::value<std::string>(storage));
    storage = value;
    return installed;
}

Flag& FlagSet::var(StringList& storage, const std::string& name, const std::string& value,
                   const std::string& usage, const std::string& env) {
    auto flag = make_flag(name, &storage, usage, env);
    flag->default_text_ = value;
    Flag& installed = install(std::move(flag), cxxopts::value<std::string>(storage.raw_));
    storage.set_raw(value);
    return installed;
}

void FlagSet::set_prefix(const std::string& prefix) {
    prefix_ = normalize_prefix(prefix);
}

// ============================================================================
// Command line
// ============================================================================

const Flag* FlagSet::flag_token(const std::string& arg) const {
    if (arg.size() < 2 || arg[0] != '-') return nullptr;
    const size_t start = arg[1] == '-' ? 2 : 1;
    const size_t eq = arg.find('=');
    return lookup(arg.substr(start, eq == std::string::npos ? std::string::npos : eq - start));
}

bool FlagSet::takes_next(const std::string& arg) const {
    const Flag* flag = flag_token(arg);
    return flag != nullptr && flag->type() != FlagType::Bool &&
           arg.find('=') == std::string::npos;
}

std::vector<std::string> FlagSet::normalize_arguments(
        const std::vector<std::string>& arguments) const {
    std::vector<std::string> out;
    out.reserve(arguments.size());

    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg == "--") {
            out.insert(out.end(), arguments.begin() + static_cast<std::ptrdiff_t>(i),
                       arguments.end());
            break;
        }
        const Flag* flag = flag_token(arg);
        if (flag == nullptr) {
            out.push_back(arg);
            continue;
        }

        // "-name[=value]" -> "--name[=value]"; single-letter names stay
        // short options.
        std::string token = arg;
        if (arg[1] != '-' && flag->name_.size() > 1) token.insert(0, 1, '-');

        const size_t eq = token.find('=');
        if (eq != std::string::npos && flag->type() == FlagType::Bool) {
            // cxxopts only knows the lower-case spellings
            if (auto value = parse_bool(token.substr(eq + 1))) {
                token = token.substr(0, eq + 1) + (*value ? "true" : "false");
            }
        }
        out.push_back(token);

        // The value token is passed through as is, even if it looks like a flag.
        if (takes_next(arg) && i + 1 < arguments.size()) {
            out.push_back(arguments[++i]);
        }
    }
    return out;
}

bool FlagSet::help_requested(const std::vector<std::string>& arguments) const {
    for (size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];
        if (arg == "--") break;
        if ((arg == "-h" || arg == "--h") && index_.count("h") == 0) return true;
        if ((arg == "-help" || arg == "--help") && index_.count("help") == 0) return true;
        if (takes_next(arg)) ++i;
    }
    return false;
}

bool FlagSet::fail(const std::string& message) {
    error_ = message;
    switch (handling_) {
        case ErrorHandling::ContinueOnError:
            return false;
        case ErrorHandling::ExitOnError:
            std::cerr << message << "\n" << usage() << "\n";
            std::exit(2);
        case ErrorHandling::PanicOnError:
            throw ArgumentParseError(message);
    }
    return false;
}

bool FlagSet::help() {
    error_ = "help requested";
    switch (handling_) {
        case ErrorHandling::ContinueOnError:
            return false;
        case ErrorHandling::ExitOnError:
            std::cout << usage() << "\n";
            std::exit(0);
        case ErrorHandling::PanicOnError:
            throw HelpRequested(usage());
    }
    return false;
}

bool FlagSet::parse(int argc, const char* const* argv) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) arguments.emplace_back(argv[i]);
    return parse(arguments);
}

bool FlagSet::parse(const std::vector<std::string>& arguments) {
    if (parsed_) {
        throw ParseStateError("flag set '" + name_ + "' already parsed");
    }
    parsed_ = true;
    error_.clear();

    if (help_requested(arguments)) return help();

    const std::vector<std::string> tokens = normalize_arguments(arguments);
    std::vector<const char*> argv;
    argv.reserve(tokens.size() + 1);
    argv.push_back(name_.c_str());
    for (const auto& token : tokens) argv.push_back(token.c_str());

    // cxxopts writes each value as it goes; a rejected command line must
    // leave every variable as it was.
    const std::vector<std::function<void()>> restore = save_storage(flags_);

    std::vector<Flag*> given;
    std::vector<std::string> leftover;
    try {
        auto result = options_.parse(static_cast<int>(argv.size()), argv.data());
        for (auto& flag : flags_) {
            if (result.count(flag->name_) > 0) given.push_back(flag.get());
        }
        leftover = result.unmatched();
    } catch (const cxxopts::exceptions::exception& e) {
        restore_storage(restore);
        return fail(e.what());
    }

    for (Flag* flag : given) {
        if (flag->type() != FlagType::Duration) continue;
        if (!flag->set_from_text(flag->arg_text_)) {
            restore_storage(restore);
            return fail("invalid value \"" + flag->arg_text_ + "\" for flag -" +
                        flag->name_ + ": parse error");
        }
    }

    for (Flag* flag : given) {
        flag->changed_ = true;
        flag->source_ = ValueSource::CommandLine;
    }
    args_ = std::move(leftover);

    resolve_env();
    return true;
}

void FlagSet::reparse() {
    resolve_env();
}

// ============================================================================
// Environment pass
// ============================================================================

void FlagSet::resolve_env() {
    for (auto& flag : flags_) {
        // Explicitly set flag has the highest precedence
        if (flag->changed_ || flag->env_.policy == EnvPolicy::Suppressed) {
            flag->env_name_.clear();
            continue;
        }

        const std::string base = flag->env_.policy == EnvPolicy::Explicit
            ? flag->env_.name
            : to_screaming_snake(flag->name_);
        flag->env_name_ = apply_prefix(base, prefix_);

        const char* raw = std::getenv(flag->env_name_.c_str());
        if (raw == nullptr || *raw == '\0') continue;

        const std::string text(raw);
        if (!flag->set_from_text(text)) {
            throw EnvCoercionError(flag->env_name_, flag->name_, text);
        }
        flag->source_ = ValueSource::Environment;
    }

    materialize_lists();
}

void FlagSet::materialize_lists() {
    for (auto& flag : flags_) {
        if (auto* list = std::get_if<StringList*>(&flag->storage_)) {
            (*list)->materialize();
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

Flag* FlagSet::lookup(const std::string& name) {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

const Flag* FlagSet::lookup(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

std::string FlagSet::usage() const {
    return options_.help();
}

} // namespace envflag
