#ifndef UNIT_RENDERER_HPP
#define UNIT_RENDERER_HPP

#include "UnitTerm.hpp"
#include <string>

namespace UALG {

/**
 * @brief Render units with negative exponents as a denominator
 *
 * Gives "m/s" rather than "m*s^-1". Exponents of magnitude 1 are omitted.
 * A reciprocal placeholder with no other numerator renders as "1" (1/m).
 * The slash is always present, so "m^3" renders as "m^3/".
 */
std::string toFractionalString(const UnitTermSequence& terms);

/**
 * @brief Render every nonzero term with its signed exponent
 *
 * Gives "m*s^-1" rather than "m/s". Only an exponent of exactly +1 is
 * omitted.
 */
std::string toExponentialString(const UnitTermSequence& terms);

/**
 * @brief Exponent text: integral values without a decimal point
 */
std::string formatExponent(double exponent);

} // namespace UALG

#endif // UNIT_RENDERER_HPP
