#include "ConversionResolver.hpp"
#include "UnitErrors.hpp"
#include "UnitTerm.hpp"
#include <algorithm>

namespace UALG {

ConversionResolver::ConversionResolver(const UnitFamily& family)
    : family_(family),
      units_(expandTable(family.units, family.si_units)),
      aliases_(expandAliases(family.aliases, family.si_units)) {}

// =============================================================================
// Table Expansion
// =============================================================================

std::map<std::string, double> ConversionResolver::expandTable(
    const std::map<std::string, double>& base_table,
    const std::vector<std::string>& si_units) {
    std::map<std::string, double> units = base_table;

    for (const auto& unit : si_units) {
        auto it = base_table.find(unit);
        if (it == base_table.end()) {
            throw ConversionError("SI unit '" + unit + "' has no multiplier");
        }
        for (const auto& prefix : siPrefixes()) {
            units[prefix.symbol + unit] = it->second * prefix.magnitude;
        }
    }

    return units;
}

std::map<std::string, std::string> ConversionResolver::expandAliases(
    const std::map<std::string, std::string>& alias_table,
    const std::vector<std::string>& si_units) {
    std::map<std::string, std::string> aliases = alias_table;

    for (const auto& pair : alias_table) {
        const std::string& alias = pair.first;
        const std::string& unit = pair.second;
        if (std::find(si_units.begin(), si_units.end(), unit) == si_units.end()) {
            continue;
        }
        for (const auto& prefix : siPrefixes()) {
            aliases[prefix.name + alias] = prefix.symbol + unit;
        }
    }

    return aliases;
}

// =============================================================================
// Conversion
// =============================================================================

std::string ConversionResolver::resolveAlias(const std::string& name) const {
    auto it = aliases_.find(name);
    if (it != aliases_.end()) {
        return it->second;
    }
    return name;
}

bool ConversionResolver::hasUnit(const std::string& name) const {
    return units_.find(resolveAlias(name)) != units_.end();
}

double ConversionResolver::getMultiplier(const std::string& name) const {
    auto it = units_.find(resolveAlias(name));
    if (it == units_.end()) {
        throw ConversionError("Invalid unit '" + name + "' entered for " + family_.name + " value");
    }
    return it->second;
}

double ConversionResolver::convert(double value, const std::string& from_unit,
                                   const std::string& to_unit) const {
    if (from_unit == to_unit) {
        return value;
    }

    double from_multiplier = getMultiplier(from_unit);
    double to_multiplier = getMultiplier(to_unit);

    return value * (to_multiplier / from_multiplier);
}

double ConversionResolver::toStandard(double value, const std::string& from_unit) const {
    return convert(value, from_unit, family_.standard_unit);
}

double ConversionResolver::fromStandard(double value, const std::string& to_unit) const {
    return convert(value, family_.standard_unit, to_unit);
}

} // namespace UALG
