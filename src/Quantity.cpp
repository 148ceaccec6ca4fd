#include "Quantity.hpp"
#include "UnitAlgebra.hpp"
#include "UnitRenderer.hpp"
#include "UnitFamilies.hpp"
#include "UnitErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace UALG {

// =============================================================================
// Display Mode
// =============================================================================

DisplayMode parseDisplayMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "fractional" || lower == "frac" || lower == "fraction") {
        return DisplayMode::FRACTIONAL;
    }
    if (lower == "exponential" || lower == "exp" || lower == "exponent") {
        return DisplayMode::EXPONENTIAL;
    }
    throw ConfigError("Unknown display mode: " + text);
}

std::string displayModeToString(DisplayMode mode) {
    return mode == DisplayMode::EXPONENTIAL ? "exponential" : "fractional";
}

// =============================================================================
// Construction
// =============================================================================

Quantity::Quantity(double value, const std::string& unit_text, const QuantityOptions& options)
    : Quantity(value, unit_text, UnitParserManager::getInstance(), options) {}

Quantity::Quantity(double value, const std::string& unit_text, const UnitParser& parser,
                   const QuantityOptions& options)
    : value_(value), units_(Algebra::normalize(parser.parse(unit_text))), options_(options) {}

Quantity::Quantity(double value, const UnitTermSequence& units, const QuantityOptions& options)
    : value_(value), units_(Algebra::normalize(units)), options_(options) {}

bool Quantity::hasSameUnits(const Quantity& other) const {
    return Algebra::sameDimensions(units_, other.units_);
}

// =============================================================================
// Rendering
// =============================================================================

std::string Quantity::unitString() const {
    return toFractionalString(units_);
}

std::string Quantity::expUnitString() const {
    return toExponentialString(units_);
}

std::string Quantity::toString() const {
    // Shortest precision that reads back as the same double
    std::string number;
    for (int precision = std::numeric_limits<double>::digits10;
         precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream out;
        out << std::setprecision(precision) << value_;
        number = out.str();

        std::istringstream in(number);
        double parsed = 0.0;
        if (in >> parsed && parsed == value_) {
            break;
        }
    }

    std::stringstream ss;
    ss << number << " "
       << (options_.display_mode == DisplayMode::FRACTIONAL ? unitString() : expUnitString());
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Quantity& q) {
    return os << q.toString();
}

double Quantity::valueIn(const ConversionResolver& resolver, const std::string& unit_name) const {
    const std::string& expression = resolver.family().standard_expression;
    UnitTermSequence expected = Algebra::normalize(UnitParserManager::getInstance().parse(expression));
    if (!Algebra::sameDimensions(units_, expected)) {
        throw UnitMismatchError("Can not express " + unitString() + " in the " + resolver.family().name +
                                " family, whose standard unit is " + expression);
    }
    return resolver.fromStandard(value_, unit_name);
}

// =============================================================================
// Arithmetic
// =============================================================================

Quantity Quantity::combine(Operation op, const Operand& other) const {
    auto apply = [op](double a, double b) {
        switch (op) {
            case Operation::ADD:          return a + b;
            case Operation::SUBTRACT:     return a - b;
            case Operation::MULTIPLY:     return a * b;
            case Operation::DIVIDE:       return a / b;
            case Operation::FLOOR_DIVIDE: return std::floor(a / b);
        }
        return a;
    };
    bool additive = (op == Operation::ADD || op == Operation::SUBTRACT);

    switch (other.kind()) {
        case Operand::Kind::UNSUPPORTED:
            throw NotSupportedError("The type of the value (" + other.description() +
                                    ") either has not been implemented or is non-numeric.");

        case Operand::Kind::SCALAR:
            if (additive) {
                throw UnitlessNumberError("Can not add or subtract a dimensionless value to a value with units.");
            }
            if (!options_.implicit_dimensionless) {
                throw UnitlessNumberError("Can not multiply or divide by a dimensionless number without "
                                          "explicitly declaring it as one or enabling implicit_dimensionless.");
            }
            return Quantity(apply(value_, other.scalar()), units_, options_);

        case Operand::Kind::QUANTITY: {
            const Quantity& rhs = other.quantity();
            if (additive) {
                if (!hasSameUnits(rhs)) {
                    throw UnitMismatchError("Can not add or subtract values with different units: " +
                                            unitString() + " and " + rhs.unitString());
                }
                return Quantity(apply(value_, rhs.value_), units_, options_);
            }
            int sign = (op == Operation::MULTIPLY) ? 1 : -1;
            UnitTermSequence units = Algebra::rectify(Algebra::merge(units_, rhs.units_, sign));
            return Quantity(apply(value_, rhs.value_), units, options_);
        }
    }

    throw NotSupportedError("Unknown operand kind");
}

Quantity Quantity::add(const Operand& other) const {
    return combine(Operation::ADD, other);
}

Quantity Quantity::subtract(const Operand& other) const {
    return combine(Operation::SUBTRACT, other);
}

Quantity Quantity::multiply(const Operand& other) const {
    return combine(Operation::MULTIPLY, other);
}

Quantity Quantity::divide(const Operand& other) const {
    return combine(Operation::DIVIDE, other);
}

Quantity Quantity::floorDiv(const Operand& other) const {
    return combine(Operation::FLOOR_DIVIDE, other);
}

Quantity Quantity::pow(const Operand& power) const {
    switch (power.kind()) {
        case Operand::Kind::QUANTITY:
            throw NotSupportedError("The exponent has units, which is not allowed.");
        case Operand::Kind::UNSUPPORTED:
            throw NotSupportedError("Exponents of type " + power.description() + " are not supported.");
        case Operand::Kind::SCALAR:
            break;
    }

    double p = power.scalar();
    UnitTermSequence units = Algebra::rectify(Algebra::scaleExponents(units_, p));
    return Quantity(std::pow(value_, p), units, options_);
}

Quantity pow(const Quantity& base, const Operand& power) {
    return base.pow(power);
}

Quantity Quantity::mod(const Operand&) const {
    throw NotSupportedError("Modulo is not supported for quantities.");
}

void Quantity::divmod(const Operand&) const {
    throw NotSupportedError("Divmod is not supported for quantities.");
}

Quantity scalarDivide(double lhs, const Quantity& rhs) {
    if (!rhs.implicitDimensionless()) {
        throw UnitlessNumberError("Can not divide a dimensionless number by a value with units without "
                                  "enabling implicit_dimensionless.");
    }
    UnitTermSequence units = Algebra::rectify(Algebra::scaleExponents(rhs.units(), -1.0));
    return Quantity(lhs / rhs.value(), units, rhs.options());
}

// =============================================================================
// In-place Arithmetic
// =============================================================================

Quantity& Quantity::operator+=(const Operand& other) {
    *this = combine(Operation::ADD, other);
    return *this;
}

Quantity& Quantity::operator-=(const Operand& other) {
    *this = combine(Operation::SUBTRACT, other);
    return *this;
}

Quantity& Quantity::operator*=(const Operand& other) {
    *this = combine(Operation::MULTIPLY, other);
    return *this;
}

Quantity& Quantity::operator/=(const Operand& other) {
    *this = combine(Operation::DIVIDE, other);
    return *this;
}

Quantity& Quantity::floorDivAssign(const Operand& other) {
    *this = combine(Operation::FLOOR_DIVIDE, other);
    return *this;
}

Quantity& Quantity::powAssign(const Operand& power) {
    *this = pow(power);
    return *this;
}

// =============================================================================
// Unary
// =============================================================================

Quantity Quantity::operator-() const {
    return Quantity(-value_, units_, options_);
}

Quantity Quantity::operator+() const {
    return *this;
}

Quantity abs(const Quantity& q) {
    return Quantity(std::abs(q.value()), q.units(), q.options());
}

Quantity round(const Quantity& q, int ndigits) {
    double scale = std::pow(10.0, ndigits);
    return Quantity(std::nearbyint(q.value() * scale) / scale, q.units(), q.options());
}

Quantity trunc(const Quantity& q) {
    return Quantity(std::trunc(q.value()), q.units(), q.options());
}

Quantity floor(const Quantity& q) {
    return Quantity(std::floor(q.value()), q.units(), q.options());
}

Quantity ceil(const Quantity& q) {
    return Quantity(std::ceil(q.value()), q.units(), q.options());
}

// =============================================================================
// Comparison
// =============================================================================

bool Quantity::lessThan(const Operand& other) const {
    if (other.kind() == Operand::Kind::QUANTITY && hasSameUnits(other.quantity())) {
        return value_ < other.quantity().value_;
    }
    return false;
}

bool Quantity::lessEqual(const Operand& other) const {
    if (other.kind() == Operand::Kind::QUANTITY && hasSameUnits(other.quantity())) {
        return value_ <= other.quantity().value_;
    }
    return false;
}

bool Quantity::equals(const Operand& other) const {
    if (other.kind() == Operand::Kind::QUANTITY && hasSameUnits(other.quantity())) {
        return value_ == other.quantity().value_;
    }
    return false;
}

bool operator>(const Quantity& lhs, const Operand& rhs) {
    return rhs.kind() == Operand::Kind::QUANTITY && rhs.quantity().lessThan(lhs);
}

bool operator>=(const Quantity& lhs, const Operand& rhs) {
    return rhs.kind() == Operand::Kind::QUANTITY && rhs.quantity().lessEqual(lhs);
}

// =============================================================================
// Family Construction
// =============================================================================

Quantity fromFamilyUnit(const ConversionResolver& resolver, double value,
                        const std::string& unit_name, const QuantityOptions& options) {
    double standard_value = resolver.toStandard(value, unit_name);
    return Quantity(standard_value, resolver.family().standard_expression, options);
}

Quantity fromFamilyUnit(const std::string& family_name, double value,
                        const std::string& unit_name, const QuantityOptions& options) {
    return fromFamilyUnit(UnitFamilyRegistry::getInstance().getResolver(family_name),
                          value, unit_name, options);
}

} // namespace UALG
