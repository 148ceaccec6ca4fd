#include "UnitTerm.hpp"
#include <cmath>
#include <stdexcept>

namespace UALG {

// =============================================================================
// Prefix Table
// =============================================================================

namespace {

const std::vector<PrefixInfo>& prefixTable() {
    static const std::vector<PrefixInfo> table = {
        {SIPrefix::YOCTO, "y",  "yocto", 1e-24},
        {SIPrefix::ZEPTO, "z",  "zepto", 1e-21},
        {SIPrefix::ATTO,  "a",  "atto",  1e-18},
        {SIPrefix::FEMTO, "f",  "femto", 1e-15},
        {SIPrefix::PICO,  "p",  "pico",  1e-12},
        {SIPrefix::NANO,  "n",  "nano",  1e-9},
        {SIPrefix::MICRO, "u",  "micro", 1e-6},
        {SIPrefix::MILLI, "m",  "milli", 1e-3},
        {SIPrefix::CENTI, "c",  "centi", 1e-2},
        {SIPrefix::DECI,  "d",  "deci",  1e-1},
        {SIPrefix::DECA,  "da", "deca",  1e1},
        {SIPrefix::HECTO, "h",  "hecto", 1e2},
        {SIPrefix::KILO,  "k",  "kilo",  1e3},
        {SIPrefix::MEGA,  "M",  "mega",  1e6},
        {SIPrefix::GIGA,  "G",  "giga",  1e9},
        {SIPrefix::TERA,  "T",  "tera",  1e12},
        {SIPrefix::PETA,  "P",  "peta",  1e15},
        {SIPrefix::EXA,   "E",  "exa",   1e18},
        {SIPrefix::ZETTA, "Z",  "zetta", 1e21},
        {SIPrefix::YOTTA, "Y",  "yotta", 1e24},
    };
    return table;
}

const PrefixInfo NO_PREFIX = {SIPrefix::NONE, "", "", 1.0};

} // namespace

const std::vector<PrefixInfo>& siPrefixes() {
    return prefixTable();
}

const PrefixInfo& prefixInfo(SIPrefix prefix) {
    if (prefix == SIPrefix::NONE) {
        return NO_PREFIX;
    }
    for (const auto& info : prefixTable()) {
        if (info.prefix == prefix) {
            return info;
        }
    }
    throw std::invalid_argument("Unknown SI prefix");
}

std::string prefixSymbol(SIPrefix prefix) {
    return prefixInfo(prefix).symbol;
}

std::string prefixName(SIPrefix prefix) {
    return prefixInfo(prefix).name;
}

double prefixMagnitude(SIPrefix prefix) {
    return prefixInfo(prefix).magnitude;
}

bool prefixFromSymbol(const std::string& symbol, SIPrefix& prefix) {
    for (const auto& info : prefixTable()) {
        if (symbol == info.symbol) {
            prefix = info.prefix;
            return true;
        }
    }
    return false;
}

// =============================================================================
// Dimension Helpers
// =============================================================================

std::string dimensionName(Dimension dim) {
    switch (dim) {
        case Dimension::TIME:                return "time";
        case Dimension::LENGTH:              return "length";
        case Dimension::MASS:                return "mass";
        case Dimension::CURRENT:             return "current";
        case Dimension::TEMPERATURE:         return "temperature";
        case Dimension::AMOUNT_OF_SUBSTANCE: return "amount_of_substance";
        case Dimension::LUMINOUS_INTENSITY:  return "luminous_intensity";
        case Dimension::RECIPROCAL:          return "reciprocal";
    }
    return "unknown";
}

std::string dimensionRootSymbol(Dimension dim) {
    switch (dim) {
        case Dimension::TIME:                return "s";
        case Dimension::LENGTH:              return "m";
        case Dimension::MASS:                return "g";
        case Dimension::CURRENT:             return "A";
        case Dimension::TEMPERATURE:         return "K";
        case Dimension::AMOUNT_OF_SUBSTANCE: return "mol";
        case Dimension::LUMINOUS_INTENSITY:  return "cd";
        case Dimension::RECIPROCAL:          return "1";
    }
    return "?";
}

// =============================================================================
// UnitTerm
// =============================================================================

bool exponentsEqual(double a, double b) {
    return std::abs(a - b) < EXPONENT_TOLERANCE;
}

bool isZeroExponent(double exponent) {
    return std::abs(exponent) < EXPONENT_TOLERANCE;
}

bool UnitTerm::operator==(const UnitTerm& other) const {
    return dimension == other.dimension && exponentsEqual(exponent, other.exponent);
}

std::string UnitTerm::symbol() const {
    if (isReciprocal()) {
        return dimensionRootSymbol(dimension);
    }
    return prefixSymbol(prefix) + dimensionRootSymbol(dimension);
}

// =============================================================================
// UnitTermSequence
// =============================================================================

const UnitTerm* UnitTermSequence::find(Dimension dim) const {
    for (const auto& term : terms_) {
        if (term.dimension == dim) {
            return &term;
        }
    }
    return nullptr;
}

double UnitTermSequence::exponentOf(Dimension dim) const {
    double total = 0.0;
    for (const auto& term : terms_) {
        if (term.dimension == dim) {
            total += term.exponent;
        }
    }
    return total;
}

std::set<Dimension> UnitTermSequence::dimensions() const {
    std::set<Dimension> result;
    for (const auto& term : terms_) {
        result.insert(term.dimension);
    }
    return result;
}

bool UnitTermSequence::operator==(const UnitTermSequence& other) const {
    if (terms_.size() != other.terms_.size()) {
        return false;
    }

    // Each term of other must pair with a distinct term of this
    std::vector<bool> matched(terms_.size(), false);
    for (const auto& term : other.terms_) {
        bool found = false;
        for (size_t i = 0; i < terms_.size(); ++i) {
            if (!matched[i] && terms_[i] == term) {
                matched[i] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

} // namespace UALG
