#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "envflag/Declaration.hpp"
#include "envflag/Errors.hpp"
#include "envflag/Export.hpp"
#include "envflag/FlagSet.hpp"

using nlohmann::json;
using namespace envflag;

int main(int argc, char** argv) {
    // Everything after "--" belongs to the declared flags, not to us.
    std::vector<const char*> own_argv;
    std::vector<std::string> flag_args;
    bool after_separator = false;
    for (int i = 0; i < argc; ++i) {
        if (after_separator) {
            flag_args.emplace_back(argv[i]);
        } else if (i > 0 && std::string(argv[i]) == "--") {
            after_separator = true;
        } else {
            own_argv.push_back(argv[i]);
        }
    }

    cxxopts::Options options("envflag-resolve",
                             "Resolve typed flags from arguments, environment and defaults");
    options.positional_help("NAME:TYPE[@ENV][=DEFAULT]... [-- FLAG ARGS...]");

    try {
        options.add_options()
            ("p,prefix", "Environment variable prefix", cxxopts::value<std::string>()->default_value(""))
            ("f,format", "Output format: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("describe", "Print type, source and environment name of every flag")
            ("h,help", "Show help");

        auto result = options.parse(static_cast<int>(own_argv.size()), own_argv.data());
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Types: bool int uint float duration string list\n";
            return 0;
        }

        const std::vector<std::string>& decls = result.unmatched();
        if (decls.empty()) {
            std::cerr << "Error: no flag declarations given\n" << options.help() << "\n";
            return 1;
        }

        const std::string format = result["format"].as<std::string>();
        if (format != "json" && format != "toml") {
            std::cerr << "Error: unknown format '" << format << "'\n";
            return 1;
        }

        FlagSet flags("envflag-resolve", ErrorHandling::PanicOnError);
        OwnedFlags storage;
        for (const auto& text : decls) {
            storage.declare(flags, parse_declaration(text));
        }
        flags.set_prefix(result["prefix"].as<std::string>());

        try {
            flags.parse(flag_args);
        } catch (const HelpRequested& help) {
            std::cout << help.usage() << "\n";
            return 0;
        } catch (const ArgumentParseError& ape) {
            std::cerr << "Error: " << ape.what() << "\n" << flags.usage() << "\n";
            return 2;
        } catch (const EnvCoercionError& ece) {
            std::cerr << "Error: " << ece.what() << "\n";
            return 2;
        }

        if (result.count("describe")) {
            std::cout << describe(flags).dump(2) << "\n";
        } else if (format == "toml") {
            std::cout << to_toml_string(flags) << "\n";
        } else {
            std::cout << to_json(flags).dump(2) << "\n";
        }

        if (!flags.args().empty()) {
            std::cerr << "Ignored arguments: " << json(flags.args()).dump() << "\n";
        }
        return 0;

    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << options.help() << "\n";
        return 1;
    } catch (const FlagError& fe) {
        std::cerr << "Error: " << fe.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
