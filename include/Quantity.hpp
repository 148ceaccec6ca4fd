#ifndef QUANTITY_HPP
#define QUANTITY_HPP

#include "UALG.hpp"
#include "UnitTerm.hpp"
#include "UnitParser.hpp"
#include "ConversionResolver.hpp"
#include <string>
#include <complex>
#include <ostream>
#include <type_traits>

namespace UALG {

class Quantity;

/**
 * @brief Classification of a value that may appear next to a Quantity
 */
enum class NumericKind {
    SCALAR,         // Plain real number supporting + - * /
    COMPLEX,        // Complex numbers: recognized but rejected
    UNSUPPORTED     // Anything else
};

/**
 * @brief Compile-time numeric-kind classifier
 */
template <typename T>
struct NumericTraits {
    static constexpr bool is_scalar = std::is_arithmetic<T>::value;
    static constexpr NumericKind kind = is_scalar ? NumericKind::SCALAR : NumericKind::UNSUPPORTED;
};

template <typename T>
struct NumericTraits<std::complex<T>> {
    static constexpr bool is_scalar = false;
    static constexpr NumericKind kind = NumericKind::COMPLEX;
};

/**
 * @brief Right-hand side of a Quantity operation
 *
 * A tagged union (Scalar | Quantity | Unsupported) built once per call so
 * each operator dispatches on a single switch. A Quantity operand is held
 * by reference and must outlive the call, which is always the case for
 * the temporaries the operators create.
 */
class Operand {
public:
    enum class Kind {
        SCALAR,
        QUANTITY,
        UNSUPPORTED
    };

    Operand(const Quantity& quantity)
        : kind_(Kind::QUANTITY), scalar_(0.0), quantity_(&quantity) {}

    template <typename T,
              typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
    Operand(T scalar)
        : kind_(Kind::SCALAR), scalar_(static_cast<double>(scalar)), quantity_(nullptr) {}

    template <typename T>
    Operand(const std::complex<T>&)
        : kind_(Kind::UNSUPPORTED), scalar_(0.0), quantity_(nullptr),
          description_("complex number") {}

    /**
     * @brief Operand of a type the library does not handle
     * @param description Shown in error messages
     */
    static Operand unsupported(const std::string& description) {
        Operand op;
        op.description_ = description;
        return op;
    }

    Kind kind() const { return kind_; }
    double scalar() const { return scalar_; }
    const Quantity& quantity() const { return *quantity_; }
    const std::string& description() const { return description_; }

private:
    Operand() : kind_(Kind::UNSUPPORTED), scalar_(0.0), quantity_(nullptr) {}

    Kind kind_;
    double scalar_;
    const Quantity* quantity_;
    std::string description_;
};

/**
 * @brief A numeric value carrying a compound physical unit
 *
 * Arithmetic enforces dimensional consistency:
 * - addition/subtraction need identical units
 * - multiplication/division combine units, cancelling dimensions
 * - exponentiation scales every exponent
 * - comparisons return false instead of raising on mismatched units
 *
 * The units are normalized on construction and never shared: every
 * operation returns a Quantity owning its own term sequence. Results keep
 * the options of the left-hand operand.
 */
class Quantity {
public:
    /**
     * @param value Numerical value
     * @param unit_text Units in fractional or exponential notation
     * @throws ParseError for malformed unit text
     */
    Quantity(double value, const std::string& unit_text,
             const QuantityOptions& options = QuantityOptions());

    /**
     * @brief Parse @p unit_text with a custom symbol table
     */
    Quantity(double value, const std::string& unit_text, const UnitParser& parser,
             const QuantityOptions& options = QuantityOptions());

    Quantity(double value, const UnitTermSequence& units,
             const QuantityOptions& options = QuantityOptions());

    // =========================================================================
    // Accessors
    // =========================================================================

    double value() const { return value_; }
    const UnitTermSequence& units() const { return units_; }

    const QuantityOptions& options() const { return options_; }
    DisplayMode displayMode() const { return options_.display_mode; }
    void setDisplayMode(DisplayMode mode) { options_.display_mode = mode; }
    bool implicitDimensionless() const { return options_.implicit_dimensionless; }
    void setImplicitDimensionless(bool enabled) { options_.implicit_dimensionless = enabled; }

    bool hasSameUnits(const Quantity& other) const;

    // =========================================================================
    // Rendering
    // =========================================================================

    // Negative exponents as denominator, e.g. "kg/m*s"
    std::string unitString() const;

    // Signed exponents, e.g. "kg*m^-1*s^-1"
    std::string expUnitString() const;

    /**
     * @brief "<value> <units>" in the current display mode
     */
    std::string toString() const;

    // =========================================================================
    // Family Conversion
    // =========================================================================

    /**
     * @brief Value expressed in another unit of a family
     *
     * The Quantity is taken to hold the family's standard unit.
     *
     * @throws UnitMismatchError if the units differ from the family's standard expression
     * @throws ConversionError if the unit is not part of the family
     */
    double valueIn(const ConversionResolver& resolver, const std::string& unit_name) const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Quantity add(const Operand& other) const;
    Quantity subtract(const Operand& other) const;
    Quantity multiply(const Operand& other) const;
    Quantity divide(const Operand& other) const;

    // floor(a / b); units as for divide()
    Quantity floorDiv(const Operand& other) const;

    /**
     * @throws NotSupportedError for a Quantity or complex exponent
     */
    Quantity pow(const Operand& power) const;

    /**
     * @throws NotSupportedError always
     */
    Quantity mod(const Operand& other) const;
    void divmod(const Operand& other) const;

    // In-place variants
    Quantity& operator+=(const Operand& other);
    Quantity& operator-=(const Operand& other);
    Quantity& operator*=(const Operand& other);
    Quantity& operator/=(const Operand& other);
    Quantity& floorDivAssign(const Operand& other);
    Quantity& powAssign(const Operand& power);

    // Unary
    Quantity operator-() const;
    Quantity operator+() const;

    // =========================================================================
    // Comparison (false on mismatched units or non-Quantity operands)
    // =========================================================================

    bool lessThan(const Operand& other) const;
    bool lessEqual(const Operand& other) const;
    bool equals(const Operand& other) const;

    // =========================================================================
    // Numeric Conversions
    // =========================================================================

    explicit operator double() const { return value_; }
    explicit operator bool() const { return value_ != 0.0; }
    int toInt() const { return static_cast<int>(value_); }

private:
    enum class Operation {
        ADD,
        SUBTRACT,
        MULTIPLY,
        DIVIDE,
        FLOOR_DIVIDE
    };

    double value_;
    UnitTermSequence units_;
    QuantityOptions options_;

    Quantity combine(Operation op, const Operand& other) const;
};

// =============================================================================
// Unary Value Transformations
// =============================================================================

Quantity abs(const Quantity& q);
Quantity round(const Quantity& q, int ndigits = 0);     // Halves round to even
Quantity trunc(const Quantity& q);
Quantity floor(const Quantity& q);
Quantity ceil(const Quantity& q);

// =============================================================================
// Operators
// =============================================================================

inline Quantity operator+(const Quantity& lhs, const Operand& rhs) { return lhs.add(rhs); }
inline Quantity operator-(const Quantity& lhs, const Operand& rhs) { return lhs.subtract(rhs); }
inline Quantity operator*(const Quantity& lhs, const Operand& rhs) { return lhs.multiply(rhs); }
inline Quantity operator/(const Quantity& lhs, const Operand& rhs) { return lhs.divide(rhs); }
inline Quantity operator%(const Quantity& lhs, const Operand& rhs) { return lhs.mod(rhs); }

inline bool operator<(const Quantity& lhs, const Operand& rhs) { return lhs.lessThan(rhs); }
inline bool operator<=(const Quantity& lhs, const Operand& rhs) { return lhs.lessEqual(rhs); }
inline bool operator==(const Quantity& lhs, const Operand& rhs) { return lhs.equals(rhs); }
inline bool operator!=(const Quantity& lhs, const Operand& rhs) { return !lhs.equals(rhs); }

bool operator>(const Quantity& lhs, const Operand& rhs);
bool operator>=(const Quantity& lhs, const Operand& rhs);

Quantity pow(const Quantity& base, const Operand& power);

// Scalar on the left

/**
 * @brief lhs / rhs for a bare scalar lhs; the units of @p rhs are inverted
 * @throws UnitlessNumberError unless rhs allows implicit dimensionless values
 */
Quantity scalarDivide(double lhs, const Quantity& rhs);

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
Quantity operator+(T lhs, const Quantity& rhs) { return rhs.add(lhs); }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
Quantity operator-(T lhs, const Quantity& rhs) { return (-rhs).add(lhs); }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
Quantity operator*(T lhs, const Quantity& rhs) { return rhs.multiply(lhs); }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
Quantity operator/(T lhs, const Quantity& rhs) { return scalarDivide(static_cast<double>(lhs), rhs); }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator<(T, const Quantity&) { return false; }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator<=(T, const Quantity&) { return false; }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator==(T, const Quantity&) { return false; }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator>(T, const Quantity&) { return false; }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator>=(T, const Quantity&) { return false; }

template <typename T,
          typename std::enable_if<NumericTraits<T>::is_scalar, int>::type = 0>
bool operator!=(T, const Quantity&) { return true; }

std::ostream& operator<<(std::ostream& os, const Quantity& q);

// =============================================================================
// Family Construction
// =============================================================================

/**
 * @brief Build a Quantity from a value in any unit of a family
 *
 * The value is converted to the family's standard unit and the Quantity
 * carries the family's standard expression, e.g. 2 "lb" in the mass family
 * gives 907.184 "g".
 *
 * @throws ConversionError if the unit is not part of the family
 */
Quantity fromFamilyUnit(const ConversionResolver& resolver, double value,
                        const std::string& unit_name,
                        const QuantityOptions& options = QuantityOptions());

/**
 * @brief As above, looking the family up in the shared registry
 */
Quantity fromFamilyUnit(const std::string& family_name, double value,
                        const std::string& unit_name,
                        const QuantityOptions& options = QuantityOptions());

} // namespace UALG

#endif // QUANTITY_HPP
