#ifndef UNIT_FAMILIES_HPP
#define UNIT_FAMILIES_HPP

#include "ConversionResolver.hpp"
#include <string>
#include <map>
#include <vector>

namespace UALG {

// =============================================================================
// Built-in Families
// =============================================================================

UnitFamily massFamily();                // standard: g
UnitFamily distanceFamily();            // standard: m
UnitFamily timeFamily();                // standard: s
UnitFamily currentFamily();             // standard: A
UnitFamily amountFamily();              // standard: mol
UnitFamily luminousIntensityFamily();   // standard: cd
UnitFamily volumeFamily();              // standard: cubic_meter (m^3)
UnitFamily energyFamily();              // standard: J (kg*m^2/s^2)

std::vector<UnitFamily> builtinFamilies();

/**
 * @brief Registry of unit families and their expanded conversion tables
 *
 * Pre-populated with the built-in families. addFamily() replaces an
 * existing family of the same name; it must not race with lookups.
 */
class UnitFamilyRegistry {
public:
    UnitFamilyRegistry();
    ~UnitFamilyRegistry() = default;

    static UnitFamilyRegistry& getInstance() {
        static UnitFamilyRegistry instance;
        return instance;
    }

    void addFamily(const UnitFamily& family);

    bool hasFamily(const std::string& name) const;

    /**
     * @throws ConversionError for an unknown family
     */
    const UnitFamily& getFamily(const std::string& name) const;

    /**
     * @throws ConversionError for an unknown family
     */
    const ConversionResolver& getResolver(const std::string& name) const;

    std::vector<std::string> getFamilyNames() const;

    /**
     * @brief Name of the first family that knows the unit, empty if none
     */
    std::string findFamilyForUnit(const std::string& unit_name) const;

private:
    std::map<std::string, ConversionResolver> resolvers_;
};

// Convenience function for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to,
                           const std::string& family) {
    return UnitFamilyRegistry::getInstance().getResolver(family).convert(value, from, to);
}

} // namespace UALG

#endif // UNIT_FAMILIES_HPP
