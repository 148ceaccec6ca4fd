#ifndef UALG_HPP
#define UALG_HPP

#include <string>

#define UALG_VERSION_MAJOR 0
#define UALG_VERSION_MINOR 1
#define UALG_VERSION_PATCH 0

namespace UALG {

// Forward declarations
class UnitParser;
class UnitTermSequence;
class ConversionResolver;
class UnitFamilyRegistry;
class Quantity;
class ConfigReader;

/**
 * @brief Notation used when a Quantity is turned into text
 */
enum class DisplayMode {
    FRACTIONAL,     // kg/m*s
    EXPONENTIAL     // kg*m^-1*s^-1
};

/**
 * @brief Per-Quantity arithmetic and display options
 *
 * implicit_dimensionless lets a bare scalar multiply or divide a Quantity
 * without being wrapped as a unit-bearing value. It is carried by each
 * Quantity rather than set globally, and results of an operation inherit
 * the options of the left-hand operand.
 */
struct QuantityOptions {
    DisplayMode display_mode;
    bool implicit_dimensionless;

    QuantityOptions(DisplayMode mode = DisplayMode::FRACTIONAL, bool implicit = false)
        : display_mode(mode), implicit_dimensionless(implicit) {}
};

/**
 * @brief Parse "fractional" / "exponential" (case-insensitive)
 * @throws ConfigError for any other value
 */
DisplayMode parseDisplayMode(const std::string& text);

std::string displayModeToString(DisplayMode mode);

} // namespace UALG

#endif // UALG_HPP
