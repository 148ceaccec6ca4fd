#include "ConfigReader.hpp"
#include "UnitErrors.hpp"
#include "UnitParser.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace UALG {

namespace {

const std::string FAMILY_SECTION_PREFIX = "family.";

} // namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    bool ok = parseStream(file);
    file.close();
    return ok;
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream input(text);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    std::cerr << "Warning: Cannot parse [" << section << "]:" << key
              << " = '" << val << "' as boolean" << std::endl;
    return default_val;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

// =============================================================================
// Domain Parsing
// =============================================================================

QuantityOptions ConfigReader::parseQuantityOptions() const {
    QuantityOptions options;

    if (!hasSection("quantity")) {
        return options;
    }

    if (hasKey("quantity", "display_mode")) {
        options.display_mode = parseDisplayMode(getString("quantity", "display_mode"));
    }
    options.implicit_dimensionless = getBool("quantity", "implicit_dimensionless", false);

    return options;
}

UnitFamily ConfigReader::parseUnitFamily(const std::string& section) const {
    if (!hasSection(section)) {
        throw ConfigError("No [" + section + "] section found");
    }

    UnitFamily family;
    family.name = section.find(FAMILY_SECTION_PREFIX) == 0
                      ? section.substr(FAMILY_SECTION_PREFIX.size())
                      : section;
    if (family.name.empty()) {
        throw ConfigError("Unit family section [" + section + "] has no name");
    }

    family.standard_unit = getString(section, "standard_unit");
    if (family.standard_unit.empty()) {
        throw ConfigError("[" + section + "] requires a standard_unit");
    }
    family.standard_expression = getString(section, "standard_expression", family.standard_unit);

    for (const auto& entry : getStringArray(section, "units")) {
        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("[" + section + "] unit entry must be name:multiplier, got '" + entry + "'");
        }
        std::string name = trim(entry.substr(0, colon));
        std::string multiplier = trim(entry.substr(colon + 1));
        if (name.empty()) {
            throw ConfigError("[" + section + "] unit entry has no name: '" + entry + "'");
        }

        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(multiplier, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != multiplier.size() || !(value > 0.0)) {
            throw ConfigError("[" + section + "] invalid multiplier for unit '" + name +
                              "': '" + multiplier + "'");
        }
        family.units[name] = value;
    }

    for (const auto& entry : getStringArray(section, "aliases")) {
        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("[" + section + "] alias entry must be alias:unit, got '" + entry + "'");
        }
        std::string alias = trim(entry.substr(0, colon));
        std::string target = trim(entry.substr(colon + 1));
        if (alias.empty() || target.empty()) {
            throw ConfigError("[" + section + "] incomplete alias entry: '" + entry + "'");
        }
        family.aliases[alias] = target;
    }

    family.si_units = getStringArray(section, "si_units");

    if (family.units.find(family.standard_unit) == family.units.end()) {
        throw ConfigError("[" + section + "] standard_unit '" + family.standard_unit +
                          "' has no multiplier in units");
    }
    for (const auto& unit : family.si_units) {
        if (family.units.find(unit) == family.units.end()) {
            throw ConfigError("[" + section + "] SI unit '" + unit + "' has no multiplier in units");
        }
    }

    try {
        parseUnitString(family.standard_expression);
    } catch (const ParseError& e) {
        throw ConfigError("[" + section + "] standard_expression '" + family.standard_expression +
                          "' is not a unit expression: " + e.what());
    }

    return family;
}

std::vector<UnitFamily> ConfigReader::parseUnitFamilies() const {
    std::vector<UnitFamily> families;
    for (const auto& section : getSectionsMatching(FAMILY_SECTION_PREFIX)) {
        families.push_back(parseUnitFamily(section));
    }
    return families;
}

} // namespace UALG
