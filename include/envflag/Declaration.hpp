/**
 * @file Declaration.hpp
 * @brief Flags declared at runtime from text
 *
 * Syntax: NAME:TYPE[@ENV][=DEFAULT]
 *
 *   port:int=8080           int64, env derived from the name
 *   debug:bool              bool, default false
 *   hosts:list@UPSTREAMS=a,b
 *   token:string@-          never read from the environment
 *
 * Types: bool, int|int64, uint|uint64, float|float64|double, duration,
 * string, list|strings.
 */

#ifndef ENVFLAG_DECLARATION_HPP
#define ENVFLAG_DECLARATION_HPP

#include "envflag/Flag.hpp"
#include "envflag/FlagSet.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace envflag {

/**
 * @brief A parsed declaration
 */
struct Declaration {
    std::string name;
    FlagType type = FlagType::String;
    std::string env;                    ///< as passed to FlagSet::var ("", "-", NAME)
    std::optional<std::string> default_text;
    std::string usage;
};

/**
 * @brief Map a type name to a FlagType
 * @return nullopt for names outside the supported set
 */
std::optional<FlagType> parse_type_name(const std::string& type);

/**
 * @brief Parse NAME:TYPE[@ENV][=DEFAULT]
 * @throws UnsupportedTypeError if TYPE is not a supported type
 * @throws DeclarationError if the text is malformed
 */
Declaration parse_declaration(const std::string& text);

/**
 * @brief Storage for flags whose type is only known at runtime.
 *
 * Each declare() call allocates a cell, converts the default text into it
 * and registers it with the FlagSet. The OwnedFlags object must outlive
 * the FlagSet it registers with.
 */
class OwnedFlags {
public:
    using Cell = std::variant<bool, std::int64_t, std::uint64_t, double,
                              Duration, std::string, StringList>;

    /**
     * @brief Allocate, initialize and register one cell
     * @throws DeclarationError if the default does not convert
     * @throws DuplicateFlagError / RegistrationError from FlagSet::var
     */
    Flag& declare(FlagSet& flags, const Declaration& decl);

    /**
     * @brief Cell registered under name, or nullptr
     */
    const Cell* find(const std::string& name) const;

    size_t size() const noexcept { return cells_.size(); }

private:
    std::vector<std::pair<std::string, std::unique_ptr<Cell>>> cells_;
};

} // namespace envflag

#endif // ENVFLAG_DECLARATION_HPP
