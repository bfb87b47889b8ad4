/**
 * @file Flag.cpp
 * @brief Implementation of Flag and its typed coercion
 */

#include "envflag/Flag.hpp"
#include "envflag/Names.hpp"

#include <type_traits>

namespace envflag {

const char* type_name(FlagType type) noexcept {
    switch (type) {
        case FlagType::Bool: return "bool";
        case FlagType::Int64: return "int64";
        case FlagType::Uint64: return "uint64";
        case FlagType::Double: return "float64";
        case FlagType::Duration: return "duration";
        case FlagType::String: return "string";
        case FlagType::StringList: return "list";
    }
    return "unknown";
}

const char* source_name(ValueSource source) noexcept {
    switch (source) {
        case ValueSource::Default: return "default";
        case ValueSource::Environment: return "environment";
        case ValueSource::CommandLine: return "command-line";
    }
    return "unknown";
}

EnvDirective EnvDirective::from_string(const std::string& env) {
    EnvDirective directive;
    if (env.empty()) {
        directive.policy = EnvPolicy::Auto;
    } else if (env == kNoEnv) {
        directive.policy = EnvPolicy::Suppressed;
    } else {
        directive.policy = EnvPolicy::Explicit;
        directive.name = to_upper(env);
    }
    return directive;
}

Flag::Flag(std::string name, FlagStorage storage, std::string usage, EnvDirective env)
    : name_(std::move(name))
    , storage_(storage)
    , usage_(std::move(usage))
    , env_(std::move(env))
{}

FlagType Flag::type() const noexcept {
    // Alternatives of FlagStorage are declared in FlagType order.
    return static_cast<FlagType>(storage_.index());
}

bool Flag::set_from_text(const std::string& text) {
    return std::visit([&text](auto* cell) -> bool {
        using T = std::remove_pointer_t<decltype(cell)>;

        if constexpr (std::is_same_v<T, bool>) {
            auto v = parse_bool(text);
            if (!v) return false;
            *cell = *v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            auto v = parse_int64(text);
            if (!v) return false;
            *cell = *v;
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            auto v = parse_uint64(text);
            if (!v) return false;
            *cell = *v;
        } else if constexpr (std::is_same_v<T, double>) {
            auto v = parse_double(text);
            if (!v) return false;
            *cell = *v;
        } else if constexpr (std::is_same_v<T, Duration>) {
            auto v = parse_duration(text);
            if (!v) return false;
            *cell = *v;
        } else if constexpr (std::is_same_v<T, std::string>) {
            *cell = text;
        } else {
            static_assert(std::is_same_v<T, StringList>, "unhandled flag storage type");
            cell->set_raw(text);
        }
        return true;
    }, storage_);
}

} // namespace envflag
