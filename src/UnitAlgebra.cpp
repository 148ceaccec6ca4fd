#include "UnitAlgebra.hpp"
#include <algorithm>
#include <vector>

namespace UALG {
namespace Algebra {

// =============================================================================
// Combination
// =============================================================================

UnitTermSequence collapse(const UnitTermSequence& terms) {
    std::vector<UnitTerm> result;
    result.reserve(terms.size());

    for (const auto& term : terms) {
        auto it = std::find_if(result.begin(), result.end(),
                               [&term](const UnitTerm& t) { return t.dimension == term.dimension; });
        if (it != result.end()) {
            it->exponent += term.exponent;
        } else {
            result.push_back(term);
        }
    }

    return UnitTermSequence(std::move(result));
}

UnitTermSequence merge(const UnitTermSequence& a, const UnitTermSequence& b, int sign) {
    UnitTermSequence lhs = collapse(a);
    UnitTermSequence rhs = collapse(b);

    std::vector<UnitTerm> result;
    result.reserve(lhs.size() + rhs.size());

    // Each dimension of a, combined with b's contribution if any
    for (const auto& term : lhs) {
        double exponent = term.exponent + sign * rhs.exponentOf(term.dimension);
        result.emplace_back(term.dimension, exponent, term.prefix);
    }

    // Dimensions only b supplies
    for (const auto& term : rhs) {
        if (!lhs.contains(term.dimension)) {
            result.emplace_back(term.dimension, sign * term.exponent, term.prefix);
        }
    }

    return UnitTermSequence(std::move(result));
}

// =============================================================================
// Normalization
// =============================================================================

UnitTermSequence rectify(const UnitTermSequence& terms) {
    int numerator_count = 0;
    for (const auto& term : terms) {
        if (!term.isReciprocal() && term.exponent > 0 && !isZeroExponent(term.exponent)) {
            numerator_count++;
        }
    }

    std::vector<UnitTerm> result;
    result.reserve(terms.size() + 1);
    bool has_reciprocal = false;

    for (const auto& term : terms) {
        if (term.isReciprocal()) {
            // Keep a single placeholder only when nothing else is on top
            if (numerator_count == 0 && !has_reciprocal) {
                result.emplace_back(Dimension::RECIPROCAL, 1.0, SIPrefix::NONE);
                has_reciprocal = true;
            }
            continue;
        }
        if (isZeroExponent(term.exponent)) {
            continue;
        }
        result.push_back(term);
    }

    if (numerator_count == 0 && !has_reciprocal) {
        result.emplace_back(Dimension::RECIPROCAL, 1.0, SIPrefix::NONE);
    }

    return UnitTermSequence(std::move(result));
}

UnitTermSequence normalize(const UnitTermSequence& terms) {
    return rectify(collapse(terms));
}

// =============================================================================
// Comparison
// =============================================================================

bool sameDimensions(const UnitTermSequence& a, const UnitTermSequence& b) {
    if (a.size() != b.size()) {
        return false;
    }

    size_t same_count = 0;
    for (const auto& term : b) {
        if (std::find(a.begin(), a.end(), term) != a.end()) {
            same_count++;
        }
    }

    return same_count == a.size();
}

UnitTermSequence scaleExponents(const UnitTermSequence& terms, double factor) {
    std::vector<UnitTerm> result;
    result.reserve(terms.size());
    for (const auto& term : terms) {
        result.emplace_back(term.dimension, term.exponent * factor, term.prefix);
    }
    return UnitTermSequence(std::move(result));
}

std::set<Dimension> dimensionsPresent(const UnitTermSequence& terms) {
    return terms.dimensions();
}

} // namespace Algebra
} // namespace UALG
