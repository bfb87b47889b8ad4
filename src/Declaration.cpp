/**
 * @file Declaration.cpp
 * @brief Implementation of runtime flag declarations
 */

#include "envflag/Declaration.hpp"
#include "envflag/Coerce.hpp"
#include "envflag/Errors.hpp"
#include "envflag/Names.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace envflag {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    /**
     * @brief Convert the declared default, or use fallback when there is none
     */
    template <typename T, typename Parser>
    T convert_default(const Declaration& decl, Parser parse, T fallback) {
        if (!decl.default_text) return fallback;
        auto value = parse(*decl.default_text);
        if (!value) {
            throw DeclarationError(decl.name, "default \"" + *decl.default_text +
                                   "\" is not a valid " + type_name(decl.type));
        }
        return *value;
    }
}

std::optional<FlagType> parse_type_name(const std::string& type) {
    static const std::map<std::string, FlagType> types = {
        {"bool", FlagType::Bool},
        {"int", FlagType::Int64},
        {"int64", FlagType::Int64},
        {"uint", FlagType::Uint64},
        {"uint64", FlagType::Uint64},
        {"float", FlagType::Double},
        {"float64", FlagType::Double},
        {"double", FlagType::Double},
        {"duration", FlagType::Duration},
        {"string", FlagType::String},
        {"list", FlagType::StringList},
        {"strings", FlagType::StringList},
    };

    auto it = types.find(to_lower(type));
    if (it == types.end()) return std::nullopt;
    return it->second;
}

Declaration parse_declaration(const std::string& text) {
    const size_t colon = text.find(':');
    if (colon == std::string::npos) {
        throw DeclarationError(text, "expected NAME:TYPE");
    }

    Declaration decl;
    decl.name = trim(text.substr(0, colon));
    if (decl.name.empty()) {
        throw DeclarationError(text, "missing flag name");
    }

    const std::string rest = text.substr(colon + 1);
    const size_t eq = rest.find('=');
    const std::string head = rest.substr(0, eq);
    if (eq != std::string::npos) {
        decl.default_text = rest.substr(eq + 1);
    }

    const size_t at = head.find('@');
    const std::string type = trim(head.substr(0, at));
    if (at != std::string::npos) {
        decl.env = trim(head.substr(at + 1));
        if (decl.env.empty()) {
            throw DeclarationError(text, "empty environment name after '@'");
        }
    }

    if (type.empty()) {
        throw DeclarationError(text, "missing type");
    }
    auto parsed = parse_type_name(type);
    if (!parsed) {
        throw UnsupportedTypeError(type, decl.name);
    }
    decl.type = *parsed;
    decl.usage = std::string(type_name(decl.type)) + " flag " + decl.name;
    return decl;
}

Flag& OwnedFlags::declare(FlagSet& flags, const Declaration& decl) {
    auto cell = std::make_unique<Cell>();
    Flag* flag = nullptr;

    switch (decl.type) {
        case FlagType::Bool: {
            auto& v = cell->emplace<bool>(convert_default(decl, parse_bool, false));
            flag = &flags.var(v, decl.name, v, decl.usage, decl.env);
            break;
        }
        case FlagType::Int64: {
            auto& v = cell->emplace<std::int64_t>(
                convert_default(decl, parse_int64, std::int64_t{0}));
            flag = &flags.var(v, decl.name, v, decl.usage, decl.env);
            break;
        }
        case FlagType::Uint64: {
            auto& v = cell->emplace<std::uint64_t>(
                convert_default(decl, parse_uint64, std::uint64_t{0}));
            flag = &flags.var(v, decl.name, v, decl.usage, decl.env);
            break;
        }
        case FlagType::Double: {
            auto& v = cell->emplace<double>(convert_default(decl, parse_double, 0.0));
            flag = &flags.var(v, decl.name, v, decl.usage, decl.env);
            break;
        }
        case FlagType::Duration: {
            auto& v = cell->emplace<Duration>(
                convert_default(decl, parse_duration, Duration::zero()));
            flag = &flags.var(v, decl.name, v, decl.usage, decl.env);
            break;
        }
        case FlagType::String: {
            auto& v = cell->emplace<std::string>(decl.default_text.value_or(""));
            flag = &flags.var(v, decl.name, std::string(v), decl.usage, decl.env);
            break;
        }
        case FlagType::StringList: {
            auto& v = cell->emplace<StringList>();
            flag = &flags.var(v, decl.name, decl.default_text.value_or(""), decl.usage, decl.env);
            break;
        }
    }

    cells_.emplace_back(decl.name, std::move(cell));
    return *flag;
}

const OwnedFlags::Cell* OwnedFlags::find(const std::string& name) const {
    for (const auto& entry : cells_) {
        if (entry.first == name) return entry.second.get();
    }
    return nullptr;
}

} // namespace envflag
