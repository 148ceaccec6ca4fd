#ifndef UNIT_TERM_HPP
#define UNIT_TERM_HPP

#include <string>
#include <vector>
#include <set>
#include <initializer_list>
#include <utility>

namespace UALG {

/**
 * @brief SI base dimensions plus the synthetic reciprocal marker
 *
 *      Dimension              | Root symbol
 *      time                   | s
 *      length                 | m
 *      mass                   | g   (kg = kilo + g)
 *      electric current       | A
 *      thermodynamic temp.    | K
 *      amount of substance    | mol
 *      luminous intensity     | cd
 *
 * RECIPROCAL only represents a bare "1" numerator (as in 1/m) when no
 * other numerator term exists.
 */
enum class Dimension {
    TIME,
    LENGTH,
    MASS,
    CURRENT,
    TEMPERATURE,
    AMOUNT_OF_SUBSTANCE,
    LUMINOUS_INTENSITY,
    RECIPROCAL
};

/**
 * @brief SI magnitude prefixes
 */
enum class SIPrefix {
    NONE,
    YOCTO,
    ZEPTO,
    ATTO,
    FEMTO,
    PICO,
    NANO,
    MICRO,
    MILLI,
    CENTI,
    DECI,
    DECA,
    HECTO,
    KILO,
    MEGA,
    GIGA,
    TERA,
    PETA,
    EXA,
    ZETTA,
    YOTTA
};

/**
 * @brief Static description of one SI prefix
 */
struct PrefixInfo {
    SIPrefix prefix;
    const char* symbol;     // e.g. "k", "da"
    const char* name;       // e.g. "kilo"
    double magnitude;       // e.g. 1e3
};

// Dimension helpers
std::string dimensionName(Dimension dim);
std::string dimensionRootSymbol(Dimension dim);

// Prefix helpers
const PrefixInfo& prefixInfo(SIPrefix prefix);
std::string prefixSymbol(SIPrefix prefix);
std::string prefixName(SIPrefix prefix);
double prefixMagnitude(SIPrefix prefix);

/**
 * @brief The 20 real SI prefixes, from yocto to yotta (NONE excluded)
 */
const std::vector<PrefixInfo>& siPrefixes();

/**
 * @brief Look up a prefix by its symbol ("k", "da", "u", ...)
 * @return true and sets @p prefix if the symbol is a known prefix
 */
bool prefixFromSymbol(const std::string& symbol, SIPrefix& prefix);

/**
 * @brief One dimensional factor of a compound unit
 *
 * The exponent is real so that exponentiation by non-integral powers can
 * propagate. The prefix is carried for rendering and conversion only; the
 * algebra treats prefixed and unprefixed terms of one dimension alike.
 */
struct UnitTerm {
    Dimension dimension;
    double exponent;
    SIPrefix prefix;

    UnitTerm(Dimension dim = Dimension::RECIPROCAL, double exp = 1.0,
             SIPrefix pre = SIPrefix::NONE)
        : dimension(dim), exponent(exp), prefix(pre) {}

    // Dimension and exponent equal; the prefix is not compared
    bool operator==(const UnitTerm& other) const;
    bool operator!=(const UnitTerm& other) const { return !(*this == other); }

    bool isReciprocal() const { return dimension == Dimension::RECIPROCAL; }

    // Prefix symbol + root symbol (e.g. "kg", "ms", "1")
    std::string symbol() const;
};

/**
 * @brief Tolerance used when comparing exponents
 */
constexpr double EXPONENT_TOLERANCE = 1e-10;

bool exponentsEqual(double a, double b);
bool isZeroExponent(double exponent);

/**
 * @brief Immutable ordered collection of unit terms
 *
 * Semantically a multiset keyed by dimension: two sequences compare equal
 * when they have the same cardinality and the same (dimension, exponent)
 * pairs in any order. A sequence is never modified after construction;
 * every algebra operation returns a new one.
 */
class UnitTermSequence {
public:
    using const_iterator = std::vector<UnitTerm>::const_iterator;

    UnitTermSequence() = default;
    UnitTermSequence(std::initializer_list<UnitTerm> terms) : terms_(terms) {}
    explicit UnitTermSequence(std::vector<UnitTerm> terms) : terms_(std::move(terms)) {}

    size_t size() const { return terms_.size(); }
    bool empty() const { return terms_.empty(); }

    const UnitTerm& operator[](size_t i) const { return terms_[i]; }
    const UnitTerm& at(size_t i) const { return terms_.at(i); }

    const_iterator begin() const { return terms_.begin(); }
    const_iterator end() const { return terms_.end(); }

    const std::vector<UnitTerm>& terms() const { return terms_; }

    /**
     * @brief First term for a dimension
     * @return Pointer into the sequence, or nullptr if absent
     */
    const UnitTerm* find(Dimension dim) const;

    bool contains(Dimension dim) const { return find(dim) != nullptr; }

    /**
     * @brief Exponent for a dimension, 0 when absent
     */
    double exponentOf(Dimension dim) const;

    std::set<Dimension> dimensions() const;

    // Multiset equality (order-independent)
    bool operator==(const UnitTermSequence& other) const;
    bool operator!=(const UnitTermSequence& other) const { return !(*this == other); }

private:
    std::vector<UnitTerm> terms_;
};

} // namespace UALG

#endif // UNIT_TERM_HPP
