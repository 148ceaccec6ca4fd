#ifndef UNIT_PARSER_HPP
#define UNIT_PARSER_HPP

#include "UnitTerm.hpp"
#include <string>
#include <map>
#include <set>
#include <vector>

namespace UALG {

/**
 * @brief Parser for unit expressions in fractional or exponential notation
 *
 * Grammar:
 *
 *     expr      := numerator ('/' numerator)?
 *     numerator := term ('*' term)*
 *     term      := '1' | symbol ('^' signed_int)?
 *
 * Both "m*kg^2/s^2" and "m*kg^2*s^-2" are accepted. Grouping characters
 * ()[]{} are stripped and carry no meaning. A symbol may carry one SI
 * prefix ("km", "ms", "dam") when the remainder is SI-prefixable and the
 * whole symbol is not itself a known unit ("min" is minutes, not
 * milli-inches).
 *
 * The output is the raw term list in encounter order; repeated dimensions
 * and zero exponents are left for the algebra to normalize.
 */
class UnitParser {
public:
    /**
     * @brief Parser with the default symbol table
     */
    UnitParser();
    ~UnitParser() = default;

    /**
     * @brief Parse a unit expression
     * @throws ParseError on malformed input or unknown symbols
     */
    UnitTermSequence parse(const std::string& unit_text) const;

    // =========================================================================
    // Symbol Table
    // =========================================================================

    /**
     * @brief Register a symbol for a dimension
     * @param si_prefixable Whether SI prefixes may be attached to it
     */
    void addSymbol(const std::string& symbol, Dimension dim, bool si_prefixable = false);

    bool hasSymbol(const std::string& symbol) const;
    bool isPrefixable(const std::string& symbol) const;

    /**
     * @throws ParseError if the symbol is unknown
     */
    Dimension getDimension(const std::string& symbol) const;

    std::vector<std::string> getSymbols() const;

    /**
     * @brief Split a symbol into its SI prefix and the remaining symbol
     *
     * A symbol found verbatim in the table takes no prefix. Otherwise a
     * leading prefix ("da" before single letters) is removed when what
     * remains is SI-prefixable.
     *
     * @param[out] trimmed Symbol without prefix
     * @param[out] prefix  Detected prefix, SIPrefix::NONE if none
     * @return false if no interpretation is found
     */
    bool separatePrefix(const std::string& symbol, std::string& trimmed,
                        SIPrefix& prefix) const;

private:
    std::map<std::string, Dimension> symbols_;
    std::set<std::string> prefixable_;

    void initializeSymbols();

    UnitTerm parseToken(const std::string& token, bool denominator) const;

    // String utilities
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

/**
 * @brief Shared parser holding the default symbol table
 */
class UnitParserManager {
public:
    static const UnitParser& getInstance() {
        static const UnitParser instance;
        return instance;
    }

private:
    UnitParserManager() = default;
};

// Convenience function for quick access
inline UnitTermSequence parseUnitString(const std::string& unit_text) {
    return UnitParserManager::getInstance().parse(unit_text);
}

} // namespace UALG

#endif // UNIT_PARSER_HPP
