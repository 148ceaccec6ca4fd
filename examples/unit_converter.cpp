/**
 * @file unit_converter.cpp
 * @brief Command-line unit converter and unit expression renderer
 *
 * Usage:
 *   ./unit_converter <value> <from_unit> <to_unit> [family]
 *   ./unit_converter --render <unit_expr>
 *   ./unit_converter --list [family]
 *   ./unit_converter --config <file> ...
 *   ./unit_converter --help
 *
 * Examples:
 *   ./unit_converter 2 kilogram lb
 *   ./unit_converter 3 gallon l volume
 *   ./unit_converter --render "kg^3/m*s"
 *   ./unit_converter --list mass
 */

#include "Quantity.hpp"
#include "UnitFamilies.hpp"
#include "UnitRenderer.hpp"
#include "UnitErrors.hpp"
#include "ConfigReader.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

using namespace UALG;

void printHelp() {
    std::cout << "\n";
    std::cout << "UALG Unit Converter\n";
    std::cout << "===================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter <value> <from_unit> <to_unit> [family]\n";
    std::cout << "  unit_converter --render <unit_expr>\n";
    std::cout << "  unit_converter --list [family]\n";
    std::cout << "  unit_converter --config <file> ...\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 2 kilogram lb\n";
    std::cout << "  unit_converter 30 day s\n";
    std::cout << "  unit_converter 3 gallon l volume\n";
    std::cout << "  unit_converter --render \"kg^3/m*s\"\n";
    std::cout << "  unit_converter --list\n";
    std::cout << "  unit_converter --list mass\n\n";
    std::cout << "Families:\n";
    std::cout << "  mass, distance, time, current, amount, luminous_intensity, volume, energy\n";
    std::cout << "  (more can be defined in [family.<name>] sections of a config file)\n\n";
}

void listFamilies(const UnitFamilyRegistry& registry, const std::string& family_name = "") {
    std::cout << "\n";

    if (family_name.empty()) {
        std::cout << "Available Unit Families:\n";
        std::cout << "========================\n\n";

        for (const auto& name : registry.getFamilyNames()) {
            const ConversionResolver& resolver = registry.getResolver(name);
            std::cout << std::setw(25) << std::left << name
                      << " (" << resolver.family().units.size() << " units, standard "
                      << resolver.family().standard_unit << ")\n";
        }
        std::cout << "\nUse: unit_converter --list <family> to see units in a family\n\n";
        return;
    }

    if (!registry.hasFamily(family_name)) {
        std::cout << "Family '" << family_name << "' not found.\n";
        std::cout << "Use: unit_converter --list to see available families\n\n";
        return;
    }

    const UnitFamily& family = registry.getFamily(family_name);
    std::cout << "Units in family: " << family_name << "\n";
    std::cout << std::string(50, '=') << "\n\n";
    std::cout << std::setw(30) << std::left << "Name"
              << "In " << family.standard_unit << "\n";
    std::cout << std::string(50, '-') << "\n";

    for (const auto& pair : family.units) {
        std::cout << std::setw(30) << std::left << pair.first
                  << std::scientific << std::setprecision(6) << pair.second << "\n";
    }

    if (!family.si_units.empty()) {
        std::cout << "\nSI-prefixable: ";
        for (size_t i = 0; i < family.si_units.size(); ++i) {
            std::cout << (i > 0 ? ", " : "") << family.si_units[i];
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

int renderExpression(const std::string& expr) {
    try {
        UnitTermSequence units = parseUnitString(expr);
        Quantity q(1.0, units);

        std::cout << "\n";
        std::cout << "  Input:        " << expr << "\n";
        std::cout << "  Fractional:   " << q.unitString() << "\n";
        std::cout << "  Exponential:  " << q.expUnitString() << "\n\n";
        std::cout << "  Terms:\n";
        for (const auto& term : q.units()) {
            std::cout << "    " << std::setw(22) << std::left << dimensionName(term.dimension)
                      << formatExponent(term.exponent);
            if (term.prefix != SIPrefix::NONE) {
                std::cout << "  (" << prefixName(term.prefix) << ")";
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int performConversion(const UnitFamilyRegistry& registry, double value,
                      const std::string& from_unit, const std::string& to_unit,
                      std::string family_name) {
    if (family_name.empty()) {
        family_name = registry.findFamilyForUnit(from_unit);
        if (family_name.empty()) {
            std::cerr << "Error: Unknown source unit '" << from_unit << "'\n";
            std::cerr << "Use --list to see available units\n";
            return 1;
        }
    }

    try {
        const ConversionResolver& resolver = registry.getResolver(family_name);

        if (!resolver.hasUnit(to_unit)) {
            std::cerr << "Error: Unknown destination unit '" << to_unit
                      << "' for family " << family_name << "\n";
            std::cerr << "Use --list " << family_name << " to see available units\n";
            return 1;
        }

        double result = resolver.convert(value, from_unit, to_unit);
        Quantity standard = fromFamilyUnit(resolver, value, from_unit);

        std::cout << "\n";
        std::cout << "Conversion Result (" << family_name << "):\n";
        std::cout << "==================\n\n";
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "  Input:    " << value << " " << from_unit << "\n";
        std::cout << "  Output:   " << result << " " << to_unit << "\n";
        std::cout << "\n";
        std::cout << std::scientific << std::setprecision(6);
        std::cout << "  Standard: " << standard.value() << " " << standard.expUnitString() << "\n";
        std::cout << "\n";

        double factor = resolver.convert(1.0, from_unit, to_unit);
        std::cout << "Conversion Factor: 1 " << from_unit << " = "
                  << std::scientific << std::setprecision(9) << factor
                  << " " << to_unit << "\n\n";
    } catch (const UnitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    UnitFamilyRegistry& registry = UnitFamilyRegistry::getInstance();

    std::vector<std::string> args(argv + 1, argv + argc);

    // --config <file> may precede any command
    while (args.size() >= 2 && args[0] == "--config") {
        ConfigReader config;
        if (!config.loadFile(args[1])) {
            return 1;
        }
        try {
            for (const auto& family : config.parseUnitFamilies()) {
                registry.addFamily(family);
            }
        } catch (const UnitError& e) {
            std::cerr << "Error: " << args[1] << ": " << e.what() << "\n";
            return 1;
        }
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || (args.size() == 1 && args[0] == "--help")) {
        printHelp();
        return 0;
    }

    if (args[0] == "--list") {
        listFamilies(registry, args.size() >= 2 ? args[1] : "");
        return 0;
    }

    if (args[0] == "--render") {
        if (args.size() != 2) {
            std::cerr << "Error: --render takes exactly one unit expression\n";
            return 1;
        }
        return renderExpression(args[1]);
    }

    if (args.size() != 3 && args.size() != 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    double value;
    try {
        value = std::stod(args[0]);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value '" << args[0] << "'\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    }

    return performConversion(registry, value, args[1], args[2],
                             args.size() == 4 ? args[3] : "");
}
