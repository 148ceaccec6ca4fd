/**
 * @file test_conversion_resolver.cpp
 * @brief Unit tests for ConversionResolver
 */

#include <gtest/gtest.h>
#include "ConversionResolver.hpp"
#include "UnitFamilies.hpp"
#include "UnitErrors.hpp"
#include <cmath>

using namespace UALG;

class ConversionResolverTest : public ::testing::Test {
protected:
    void SetUp() override {}

    ConversionResolver mass{massFamily()};
    ConversionResolver distance{distanceFamily()};
    ConversionResolver time{timeFamily()};
    ConversionResolver volume{volumeFamily()};
};

// ============================================================================
// Table Expansion Tests
// ============================================================================

TEST_F(ConversionResolverTest, ExpandTableAddsPrefixedUnits) {
    std::map<std::string, double> base = {{"g", 1.0}, {"lb", 453.592}};
    auto table = ConversionResolver::expandTable(base, {"g"});

    EXPECT_EQ(table.size(), 22u);
    EXPECT_DOUBLE_EQ(table.at("kg"), 1000.0);
    EXPECT_DOUBLE_EQ(table.at("mg"), 0.001);
    EXPECT_DOUBLE_EQ(table.at("dag"), 10.0);
    EXPECT_DOUBLE_EQ(table.at("lb"), 453.592);
    EXPECT_EQ(table.count("klb"), 0u);
}

TEST_F(ConversionResolverTest, ExpandTableMissingSIUnit) {
    std::map<std::string, double> base = {{"lb", 453.592}};
    EXPECT_THROW(ConversionResolver::expandTable(base, {"g"}), ConversionError);
}

TEST_F(ConversionResolverTest, ExpandAliasesOnlyForSIUnits) {
    std::map<std::string, std::string> aliases = {{"gram", "g"}, {"pound", "lb"}};
    auto table = ConversionResolver::expandAliases(aliases, {"g"});

    EXPECT_EQ(table.size(), 22u);
    EXPECT_EQ(table.at("kilogram"), "kg");
    EXPECT_EQ(table.at("microgram"), "ug");
    EXPECT_EQ(table.at("pound"), "lb");
    EXPECT_EQ(table.count("kilopound"), 0u);
}

// ============================================================================
// Conversion Tests
// ============================================================================

TEST_F(ConversionResolverTest, RatioIsTargetOverSource) {
    // value * (to_multiplier / from_multiplier)
    EXPECT_DOUBLE_EQ(mass.convert(1.0, "kg", "g"), 0.001);
    EXPECT_DOUBLE_EQ(mass.convert(1.0, "g", "kg"), 1000.0);
    EXPECT_DOUBLE_EQ(mass.convert(3.0, "g", "lb"), 3.0 * 453.592);
    EXPECT_DOUBLE_EQ(time.convert(2.0, "s", "min"), 120.0);
}

TEST_F(ConversionResolverTest, PrefixedConversion) {
    EXPECT_DOUBLE_EQ(mass.convert(1500.0, "g", "mg"), 1.5);
    EXPECT_DOUBLE_EQ(time.convert(1500.0, "s", "ms"), 1.5);
    EXPECT_NEAR(distance.convert(1.0, "mm", "km"), 1e6, 1e-6);
}

TEST_F(ConversionResolverTest, AliasConversion) {
    EXPECT_NEAR(mass.convert(2.0, "kilogram", "lb"), 0.907184, 1e-12);
    EXPECT_NEAR(mass.convert(16.0, "pound", "oz"), 1.0, 1e-4);
    EXPECT_NEAR(distance.convert(1.0, "km", "mile"), 1.609344, 1e-9);
    EXPECT_NEAR(distance.convert(12.0, "in", "foot"), 144.0, 1e-9);
    EXPECT_NEAR(time.convert(24.0, "day", "hour"), 1.0, 1e-12);
}

TEST_F(ConversionResolverTest, VolumeConversion) {
    EXPECT_NEAR(volume.convert(1000.0, "l", "ml"), 1.0, 1e-9);
    EXPECT_NEAR(volume.convert(1.0, "kiloliter", "cubic_meter"), 1.0, 1e-12);
    EXPECT_NEAR(volume.convert(1.0, "l", "gallon"), 3.78541, 1e-5);
}

TEST_F(ConversionResolverTest, IdenticalNamesSkipLookup) {
    EXPECT_DOUBLE_EQ(mass.convert(5.0, "bogus", "bogus"), 5.0);
}

TEST_F(ConversionResolverTest, UnknownUnits) {
    EXPECT_THROW(mass.convert(1.0, "furlong", "g"), ConversionError);
    EXPECT_THROW(mass.convert(1.0, "g", "furlong"), ConversionError);
    EXPECT_THROW(mass.getMultiplier("klb"), ConversionError);
}

TEST_F(ConversionResolverTest, ConvertInverse) {
    double there = distance.convert(7.5, "yd", "fathom");
    EXPECT_NEAR(distance.convert(there, "fathom", "yd"), 7.5, 1e-12);
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST_F(ConversionResolverTest, ResolveAlias) {
    EXPECT_EQ(mass.resolveAlias("lbs"), "lb");
    EXPECT_EQ(mass.resolveAlias("kilogram"), "kg");
    EXPECT_EQ(mass.resolveAlias("lb"), "lb");
    EXPECT_EQ(mass.resolveAlias("xyz"), "xyz");
}

TEST_F(ConversionResolverTest, HasUnit) {
    EXPECT_TRUE(mass.hasUnit("Mg"));
    EXPECT_TRUE(mass.hasUnit("gram"));
    EXPECT_TRUE(mass.hasUnit("mcg"));
    EXPECT_FALSE(mass.hasUnit("m"));
}

TEST_F(ConversionResolverTest, StandardUnit) {
    EXPECT_DOUBLE_EQ(mass.toStandard(453.592, "lb"), 1.0);
    EXPECT_DOUBLE_EQ(mass.fromStandard(1.0, "lb"), 453.592);
    EXPECT_DOUBLE_EQ(mass.toStandard(2.0, "g"), 2.0);
    EXPECT_DOUBLE_EQ(mass.getMultiplier("g"), 1.0);
    EXPECT_EQ(mass.family().standard_unit, "g");
}
