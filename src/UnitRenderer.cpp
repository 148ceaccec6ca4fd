#include "UnitRenderer.hpp"
#include <sstream>
#include <cmath>
#include <vector>

namespace UALG {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& delim) {
    std::stringstream ss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) ss << delim;
        ss << parts[i];
    }
    return ss.str();
}

} // namespace

std::string formatExponent(double exponent) {
    double rounded = std::round(exponent);
    std::stringstream ss;
    if (exponentsEqual(exponent, rounded)) {
        ss << static_cast<long long>(rounded);
    } else {
        ss << exponent;
    }
    return ss.str();
}

std::string toFractionalString(const UnitTermSequence& terms) {
    std::vector<std::string> num_list;
    std::vector<std::string> denom_list;
    bool has_reciprocal = false;

    for (const auto& term : terms) {
        if (isZeroExponent(term.exponent)) {
            continue;
        }
        if (term.isReciprocal()) {
            has_reciprocal = true;
            continue;
        }

        double magnitude = std::abs(term.exponent);
        std::string unit = term.symbol();
        if (!exponentsEqual(magnitude, 1.0)) {
            unit += "^" + formatExponent(magnitude);
        }

        if (term.exponent > 0) {
            num_list.push_back(unit);
        } else {
            denom_list.push_back(unit);
        }
    }

    if (num_list.empty() && has_reciprocal) {
        num_list.push_back("1");
    }

    return join(num_list, "*") + "/" + join(denom_list, "*");
}

std::string toExponentialString(const UnitTermSequence& terms) {
    std::vector<std::string> unit_list;

    for (const auto& term : terms) {
        if (isZeroExponent(term.exponent)) {
            continue;
        }
        std::string unit = term.symbol();
        if (!exponentsEqual(term.exponent, 1.0)) {
            unit += "^" + formatExponent(term.exponent);
        }
        unit_list.push_back(unit);
    }

    return join(unit_list, "*");
}

} // namespace UALG
