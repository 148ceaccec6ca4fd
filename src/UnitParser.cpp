#include "UnitParser.hpp"
#include "UnitErrors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace UALG {

// =============================================================================
// Symbol Table
// =============================================================================

UnitParser::UnitParser() {
    initializeSymbols();
}

void UnitParser::initializeSymbols() {
    // SI base units; these are the only symbols that take prefixes
    addSymbol("s", Dimension::TIME, true);
    addSymbol("m", Dimension::LENGTH, true);
    addSymbol("g", Dimension::MASS, true);
    addSymbol("A", Dimension::CURRENT, true);
    addSymbol("K", Dimension::TEMPERATURE, true);
    addSymbol("mol", Dimension::AMOUNT_OF_SUBSTANCE, true);
    addSymbol("cd", Dimension::LUMINOUS_INTENSITY, true);

    // Time
    addSymbol("min", Dimension::TIME);
    addSymbol("hr", Dimension::TIME);
    addSymbol("h", Dimension::TIME);
    addSymbol("day", Dimension::TIME);
    addSymbol("week", Dimension::TIME);
    addSymbol("yr", Dimension::TIME);

    // Length
    addSymbol("ft", Dimension::LENGTH);
    addSymbol("inch", Dimension::LENGTH);
    addSymbol("in", Dimension::LENGTH);
    addSymbol("yd", Dimension::LENGTH);
    addSymbol("mi", Dimension::LENGTH);
    addSymbol("fathom", Dimension::LENGTH);
    addSymbol("chain", Dimension::LENGTH);
    addSymbol("link", Dimension::LENGTH);
    addSymbol("rod", Dimension::LENGTH);
    addSymbol("ly", Dimension::LENGTH);
    addSymbol("pc", Dimension::LENGTH);
    addSymbol("au", Dimension::LENGTH);
    addSymbol("ang", Dimension::LENGTH);
    addSymbol("fermi", Dimension::LENGTH);

    // Mass
    addSymbol("tonne", Dimension::MASS);
    addSymbol("oz", Dimension::MASS);
    addSymbol("lb", Dimension::MASS);
    addSymbol("gr", Dimension::MASS);
    addSymbol("stone", Dimension::MASS);
    addSymbol("carat", Dimension::MASS);
    addSymbol("ct", Dimension::MASS);

    // Current
    addSymbol("amp", Dimension::CURRENT);
    addSymbol("ampere", Dimension::CURRENT);

    // Temperature (scale only; no offsets)
    addSymbol("degC", Dimension::TEMPERATURE);
    addSymbol("degF", Dimension::TEMPERATURE);
    addSymbol("degR", Dimension::TEMPERATURE);

    // Luminous intensity
    addSymbol("cp", Dimension::LUMINOUS_INTENSITY);
    addSymbol("hk", Dimension::LUMINOUS_INTENSITY);
}

void UnitParser::addSymbol(const std::string& symbol, Dimension dim, bool si_prefixable) {
    if (symbol.empty() ||
        !std::all_of(symbol.begin(), symbol.end(),
                     [](unsigned char c) { return std::isalpha(c); })) {
        throw ParseError("Unit symbols must be alphabetic: '" + symbol + "'");
    }
    symbols_[symbol] = dim;
    if (si_prefixable) {
        prefixable_.insert(symbol);
    }
}

bool UnitParser::hasSymbol(const std::string& symbol) const {
    return symbols_.find(symbol) != symbols_.end();
}

bool UnitParser::isPrefixable(const std::string& symbol) const {
    return prefixable_.find(symbol) != prefixable_.end();
}

Dimension UnitParser::getDimension(const std::string& symbol) const {
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        throw ParseError("Unknown unit symbol: '" + symbol + "'");
    }
    return it->second;
}

std::vector<std::string> UnitParser::getSymbols() const {
    std::vector<std::string> result;
    for (const auto& pair : symbols_) {
        result.push_back(pair.first);
    }
    return result;
}

bool UnitParser::separatePrefix(const std::string& symbol, std::string& trimmed,
                                SIPrefix& prefix) const {
    if (hasSymbol(symbol)) {
        trimmed = symbol;
        prefix = SIPrefix::NONE;
        return true;
    }

    // "da" is the only two-letter prefix
    for (size_t len : {size_t(2), size_t(1)}) {
        if (symbol.size() <= len) continue;

        SIPrefix candidate;
        std::string rest = symbol.substr(len);
        if (prefixFromSymbol(symbol.substr(0, len), candidate) && isPrefixable(rest)) {
            trimmed = rest;
            prefix = candidate;
            return true;
        }
    }

    return false;
}

// =============================================================================
// Parsing
// =============================================================================

UnitTermSequence UnitParser::parse(const std::string& unit_text) const {
    std::string text = unit_text;
    text.erase(std::remove_if(text.begin(), text.end(),
                              [](char c) {
                                  return c == '(' || c == ')' || c == '[' ||
                                         c == ']' || c == '{' || c == '}';
                              }),
               text.end());

    std::vector<std::string> segments = split(text, '/');
    if (segments.size() > 2) {
        throw ParseError("More than one divisor (i.e. '/') is not allowed: '" + unit_text + "'");
    }

    std::vector<UnitTerm> terms;
    for (const auto& token : split(segments[0], '*')) {
        terms.push_back(parseToken(token, false));
    }
    if (segments.size() == 2) {
        for (const auto& token : split(segments[1], '*')) {
            terms.push_back(parseToken(token, true));
        }
    }

    return UnitTermSequence(std::move(terms));
}

UnitTerm UnitParser::parseToken(const std::string& token, bool denominator) const {
    std::string item = trim(token);
    if (item.empty()) {
        throw ParseError("Empty unit term");
    }

    size_t caret = item.find('^');
    std::string symbol = item.substr(0, caret);
    int order = 1;

    if (caret != std::string::npos) {
        if (item.find('^', caret + 1) != std::string::npos) {
            throw ParseError("Unit has more than one '^': '" + item + "'");
        }
        std::string exp_text = item.substr(caret + 1);
        if (exp_text.empty()) {
            throw ParseError("Unit has '^' but no exponent: '" + item + "'");
        }

        size_t digits_start = (exp_text[0] == '+' || exp_text[0] == '-') ? 1 : 0;
        if (digits_start == exp_text.size() ||
            !std::all_of(exp_text.begin() + digits_start, exp_text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw ParseError("Exponent should be a signed integer (i.e. \"m^2\" not \"m^2.5\" or \"m^k\"): '" +
                             item + "'");
        }
        try {
            order = std::stoi(exp_text);
        } catch (const std::out_of_range&) {
            throw ParseError("Exponent out of range: '" + item + "'");
        }
    }

    if (symbol == "1") {
        if (denominator) {
            throw ParseError("May not have numbers in the denominator except in exponents: '" + item + "'");
        }
        if (caret != std::string::npos) {
            throw ParseError("1 must be alone when using an inverse unit: '" + item + "'");
        }
        return UnitTerm(Dimension::RECIPROCAL, 1.0, SIPrefix::NONE);
    }

    if (symbol.empty() ||
        !std::all_of(symbol.begin(), symbol.end(),
                     [](unsigned char c) { return std::isalpha(c); })) {
        throw ParseError("Numbers are not allowed in units except for in the case of inverse units, "
                         "1/m, and exponents, m^2: '" + item + "'");
    }

    std::string trimmed;
    SIPrefix prefix = SIPrefix::NONE;
    if (!separatePrefix(symbol, trimmed, prefix)) {
        throw ParseError("Unknown unit symbol: '" + symbol + "'");
    }

    double exponent = denominator ? -order : order;
    return UnitTerm(getDimension(trimmed), exponent, prefix);
}

// =============================================================================
// String Utilities
// =============================================================================

std::string UnitParser::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> UnitParser::split(const std::string& str, char delim) const {
    // Empty items are kept so that "m**s" and "m/" can be rejected
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos;
    while ((pos = str.find(delim, start)) != std::string::npos) {
        result.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    result.push_back(str.substr(start));
    return result;
}

} // namespace UALG
