/**
 * @file Export.cpp
 * @brief Implementation of JSON / TOML snapshots
 */

#include "envflag/Export.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <type_traits>

namespace envflag {

nlohmann::json value_to_json(const Flag& flag) {
    return std::visit([](const auto* cell) -> nlohmann::json {
        using T = std::remove_cv_t<std::remove_pointer_t<decltype(cell)>>;

        if constexpr (std::is_same_v<T, Duration>) {
            return format_duration(*cell);
        } else if constexpr (std::is_same_v<T, StringList>) {
            return cell->value();
        } else {
            return *cell;
        }
    }, flag.storage());
}

nlohmann::json to_json(const FlagSet& flags) {
    nlohmann::json out = nlohmann::json::object();
    flags.visit_all([&out](const Flag& flag) {
        out[flag.name()] = value_to_json(flag);
    });
    return out;
}

nlohmann::json describe(const FlagSet& flags) {
    nlohmann::json out = nlohmann::json::object();
    flags.visit_all([&out](const Flag& flag) {
        nlohmann::json entry = {
            {"type", type_name(flag.type())},
            {"value", value_to_json(flag)},
            {"default", flag.default_text()},
            {"source", source_name(flag.source())},
            {"usage", flag.usage()},
        };
        if (flag.env_name().empty()) {
            entry["env"] = nullptr;
        } else {
            entry["env"] = flag.env_name();
        }
        out[flag.name()] = entry;
    });
    return out;
}

toml::table to_toml(const FlagSet& flags) {
    toml::table tbl;
    flags.visit_all([&tbl](const Flag& flag) {
        const std::string& key = flag.name();
        std::visit([&tbl, &key](const auto* cell) {
            using T = std::remove_cv_t<std::remove_pointer_t<decltype(cell)>>;

            if constexpr (std::is_same_v<T, std::uint64_t>) {
                // TOML integers are signed 64-bit
                if (*cell <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    tbl.insert(key, static_cast<std::int64_t>(*cell));
                } else {
                    tbl.insert(key, static_cast<double>(*cell));
                }
            } else if constexpr (std::is_same_v<T, Duration>) {
                tbl.insert(key, format_duration(*cell));
            } else if constexpr (std::is_same_v<T, StringList>) {
                toml::array arr;
                for (const auto& item : cell->value()) arr.push_back(item);
                tbl.insert(key, std::move(arr));
            } else {
                tbl.insert(key, *cell);
            }
        }, flag.storage());
    });
    return tbl;
}

std::string to_toml_string(const FlagSet& flags) {
    std::ostringstream oss;
    oss << to_toml(flags);
    return oss.str();
}

} // namespace envflag
