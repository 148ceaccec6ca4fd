#ifndef CONVERSION_RESOLVER_HPP
#define CONVERSION_RESOLVER_HPP

#include <string>
#include <map>
#include <vector>

namespace UALG {

/**
 * @brief Conversion data for one physical-quantity family (mass, distance, ...)
 *
 * Multipliers are relative to the standard unit, which has multiplier 1,
 * e.g. for mass (standard "g") lb = 453.592. Only units listed in si_units receive
 * SI-prefixed variants, and only aliases pointing at those units receive
 * prefixed alias names ("kilogram" -> "kg").
 */
struct UnitFamily {
    std::string name;                           // e.g. "mass"
    std::string standard_unit;                  // e.g. "g"
    std::string standard_expression;            // Parsable unit text, e.g. "m^3"
    std::map<std::string, double> units;        // name -> multiplier
    std::map<std::string, std::string> aliases; // alias -> unit name
    std::vector<std::string> si_units;          // SI-prefixable unit names

    UnitFamily() = default;

    UnitFamily(const std::string& n, const std::string& standard,
               const std::map<std::string, double>& unit_table,
               const std::map<std::string, std::string>& alias_table,
               const std::vector<std::string>& si,
               const std::string& expression = "")
        : name(n), standard_unit(standard),
          standard_expression(expression.empty() ? standard : expression),
          units(unit_table), aliases(alias_table), si_units(si) {}
};

/**
 * @brief Converts scalars between named units of one family
 *
 * The family's base tables are expanded once on construction:
 * - every SI-prefixable unit gains 20 prefixed entries ("kg", "mg", ...)
 * - every alias of an SI-prefixable unit gains 20 prefixed aliases
 *   ("kilogram" -> "kg")
 */
class ConversionResolver {
public:
    explicit ConversionResolver(const UnitFamily& family);
    ~ConversionResolver() = default;

    // =========================================================================
    // Table Expansion
    // =========================================================================

    /**
     * @brief Add prefix_symbol + unit -> multiplier * magnitude for every
     *        SI-prefixable unit
     * @throws ConversionError if an SI unit is missing from @p base_table
     */
    static std::map<std::string, double> expandTable(
        const std::map<std::string, double>& base_table,
        const std::vector<std::string>& si_units);

    /**
     * @brief Add prefix_name + alias -> prefix_symbol + unit for every alias
     *        whose target is SI-prefixable
     */
    static std::map<std::string, std::string> expandAliases(
        const std::map<std::string, std::string>& alias_table,
        const std::vector<std::string>& si_units);

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Convert a value between two units of the family
     *
     * Returns value * (to_multiplier / from_multiplier). Identical names
     * return the value untouched without any lookup.
     *
     * @throws ConversionError if either name is unknown
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    double toStandard(double value, const std::string& from_unit) const;
    double fromStandard(double value, const std::string& to_unit) const;

    /**
     * @brief Canonical unit name for an alias; other names are returned as-is
     */
    std::string resolveAlias(const std::string& name) const;

    bool hasUnit(const std::string& name) const;

    /**
     * @throws ConversionError if the name is unknown
     */
    double getMultiplier(const std::string& name) const;

    const UnitFamily& family() const { return family_; }
    const std::map<std::string, double>& units() const { return units_; }
    const std::map<std::string, std::string>& aliases() const { return aliases_; }

private:
    UnitFamily family_;
    std::map<std::string, double> units_;
    std::map<std::string, std::string> aliases_;
};

} // namespace UALG

#endif // CONVERSION_RESOLVER_HPP
