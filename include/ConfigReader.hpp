#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "UALG.hpp"
#include "ConversionResolver.hpp"
#include <string>
#include <map>
#include <vector>
#include <istream>

namespace UALG {

/**
 * @brief INI-style configuration reader
 *
 * Reads Quantity display/arithmetic options and user-defined unit families
 * so that new conversion tables can be added without code changes.
 *
 * Example:
 * @code
 * [quantity]
 * display_mode = exponential
 * implicit_dimensionless = true
 *
 * [family.length_survey]
 * standard_unit = furlong
 * standard_expression = m
 * units = furlong:1.0, league:23.99
 * aliases = fur:furlong
 * @endcode
 */
class ConfigReader {
public:
    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration from in-memory text
    bool loadString(const std::string& text);

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;

    // =========================================================================
    // Domain Parsing
    // =========================================================================

    /**
     * @brief Options from the [quantity] section (defaults if absent)
     * @throws ConfigError for an unknown display_mode
     */
    QuantityOptions parseQuantityOptions() const;

    /**
     * @brief Build a unit family from a [family.<name>] section
     *
     * The family name is the part of the section name after "family.".
     *
     * @throws ConfigError for a missing section, a missing standard_unit,
     *         malformed "name:multiplier" or "alias:unit" entries,
     *         SI/standard units without a multiplier, or a
     *         standard_expression the unit parser rejects
     */
    UnitFamily parseUnitFamily(const std::string& section) const;

    // Every [family.*] section, in section-name order
    std::vector<UnitFamily> parseUnitFamilies() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& input);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace UALG

#endif // CONFIG_READER_HPP
