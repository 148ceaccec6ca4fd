#ifndef UNIT_ERRORS_HPP
#define UNIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace UALG {

/**
 * @brief Base class for every error raised by the unit algebra library
 *
 * All errors are raised synchronously at the point of violation and are
 * never recovered internally; the caller decides what to do with them.
 */
class UnitError : public std::runtime_error {
public:
    explicit UnitError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Malformed unit text (multiple '/', unknown symbol, misplaced
 *        digits, malformed exponent)
 */
class ParseError : public UnitError {
public:
    explicit ParseError(const std::string& what) : UnitError(what) {}
};

/**
 * @brief Addition or subtraction between incompatible unit signatures
 */
class UnitMismatchError : public UnitError {
public:
    explicit UnitMismatchError(const std::string& what) : UnitError(what) {}
};

/**
 * @brief A bare scalar used where a unit-bearing value is required
 *
 * Raised for scalar addition/subtraction, and for scalar multiplication
 * or division when implicit dimensionless handling is disabled.
 */
class UnitlessNumberError : public UnitError {
public:
    explicit UnitlessNumberError(const std::string& what) : UnitError(what) {}
};

/**
 * @brief Unknown unit, alias or family name during conversion
 */
class ConversionError : public UnitError {
public:
    explicit ConversionError(const std::string& what) : UnitError(what) {}
};

/**
 * @brief Operation or operand type that is deliberately unsupported
 *        (complex numbers, modulo, divmod)
 */
class NotSupportedError : public UnitError {
public:
    explicit NotSupportedError(const std::string& what) : UnitError(what) {}
};

/**
 * @brief Malformed configuration entry
 */
class ConfigError : public UnitError {
public:
    explicit ConfigError(const std::string& what) : UnitError(what) {}
};

} // namespace UALG

#endif // UNIT_ERRORS_HPP
