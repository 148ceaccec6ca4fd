#ifndef UNIT_ALGEBRA_HPP
#define UNIT_ALGEBRA_HPP

#include "UnitTerm.hpp"
#include <set>

namespace UALG {
namespace Algebra {

/**
 * @brief Combine two term sequences dimension by dimension
 *
 * For every dimension present in @p a or @p b the result holds exactly one
 * term whose exponent is a[dim] + sign * b[dim] (a missing term counts as
 * exponent 0). The prefix comes from @p a when it supplies the term,
 * otherwise from @p b. Dimensions of @p a come first in their original
 * order, followed by the dimensions only @p b has.
 *
 * The result is not rectified; zero exponents may remain.
 *
 * @param sign +1 for multiplication, -1 for division
 */
UnitTermSequence merge(const UnitTermSequence& a, const UnitTermSequence& b, int sign);

/**
 * @brief Sum the exponents of repeated dimensions
 *
 * The first occurrence keeps its position and prefix.
 */
UnitTermSequence collapse(const UnitTermSequence& terms);

/**
 * @brief Remove zero exponents and manage the reciprocal placeholder
 *
 * - zero-exponent terms are dropped
 * - with no genuine positive term left, exactly one {RECIPROCAL, +1} term
 *   is kept (or appended if none existed)
 * - with at least one genuine positive term, every RECIPROCAL term goes
 *
 * rectify(rectify(x)) == rectify(x)
 */
UnitTermSequence rectify(const UnitTermSequence& terms);

/**
 * @brief collapse() followed by rectify()
 */
UnitTermSequence normalize(const UnitTermSequence& terms);

/**
 * @brief Equal cardinality and every term of @p b found in @p a
 *
 * Terms match on dimension and exponent; prefixes are ignored.
 */
bool sameDimensions(const UnitTermSequence& a, const UnitTermSequence& b);

/**
 * @brief Multiply every exponent by @p factor (exponentiation)
 *
 * Non-integral factors give non-integral exponents; nothing is rounded.
 */
UnitTermSequence scaleExponents(const UnitTermSequence& terms, double factor);

std::set<Dimension> dimensionsPresent(const UnitTermSequence& terms);

} // namespace Algebra
} // namespace UALG

#endif // UNIT_ALGEBRA_HPP
