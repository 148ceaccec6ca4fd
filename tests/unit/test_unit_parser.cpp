/**
 * @file test_unit_parser.cpp
 * @brief Unit tests for UnitParser
 */

#include <gtest/gtest.h>
#include "UnitParser.hpp"
#include "UnitErrors.hpp"

using namespace UALG;

class UnitParserTest : public ::testing::Test {
protected:
    void SetUp() override {}

    void expectTerm(const UnitTerm& term, Dimension dim, double exponent,
                    SIPrefix prefix = SIPrefix::NONE) {
        EXPECT_EQ(term.dimension, dim);
        EXPECT_DOUBLE_EQ(term.exponent, exponent);
        EXPECT_EQ(term.prefix, prefix);
    }

    UnitParser parser;
};

// ============================================================================
// Grammar Tests
// ============================================================================

TEST_F(UnitParserTest, FractionalWithExponent) {
    UnitTermSequence terms = parser.parse("kg^3/m*s");

    ASSERT_EQ(terms.size(), 3u);
    expectTerm(terms[0], Dimension::MASS, 3.0, SIPrefix::KILO);
    expectTerm(terms[1], Dimension::LENGTH, -1.0);
    expectTerm(terms[2], Dimension::TIME, -1.0);
}

TEST_F(UnitParserTest, ExponentialNotation) {
    UnitTermSequence terms = parser.parse("kg^3*m^-1*s^-1");

    ASSERT_EQ(terms.size(), 3u);
    expectTerm(terms[0], Dimension::MASS, 3.0, SIPrefix::KILO);
    expectTerm(terms[1], Dimension::LENGTH, -1.0);
    expectTerm(terms[2], Dimension::TIME, -1.0);
}

TEST_F(UnitParserTest, DenominatorExponentsAreNegated) {
    UnitTermSequence terms = parser.parse("m/s^2");

    ASSERT_EQ(terms.size(), 2u);
    expectTerm(terms[1], Dimension::TIME, -2.0);

    terms = parser.parse("m/s^-2");
    expectTerm(terms[1], Dimension::TIME, 2.0);
}

TEST_F(UnitParserTest, ExplicitPositiveExponent) {
    UnitTermSequence terms = parser.parse("m^+2");
    ASSERT_EQ(terms.size(), 1u);
    expectTerm(terms[0], Dimension::LENGTH, 2.0);
}

TEST_F(UnitParserTest, ReciprocalNumerator) {
    UnitTermSequence terms = parser.parse("1/m");

    ASSERT_EQ(terms.size(), 2u);
    expectTerm(terms[0], Dimension::RECIPROCAL, 1.0);
    expectTerm(terms[1], Dimension::LENGTH, -1.0);
}

TEST_F(UnitParserTest, GroupingCharactersAreStripped) {
    UnitTermSequence grouped = parser.parse("(kg)/[m*s]");
    UnitTermSequence plain = parser.parse("kg/m*s");
    EXPECT_EQ(grouped, plain);
    EXPECT_EQ(parser.parse("{m}^2").size(), 1u);
}

TEST_F(UnitParserTest, WhitespaceAroundTokens) {
    UnitTermSequence terms = parser.parse(" kg / m * s ");
    ASSERT_EQ(terms.size(), 3u);
    expectTerm(terms[0], Dimension::MASS, 1.0, SIPrefix::KILO);
}

TEST_F(UnitParserTest, RawTermsAreNotCollapsed) {
    UnitTermSequence terms = parser.parse("m*m/m");
    ASSERT_EQ(terms.size(), 3u);
    expectTerm(terms[2], Dimension::LENGTH, -1.0);
}

// ============================================================================
// Prefix Resolution Tests
// ============================================================================

TEST_F(UnitParserTest, SinglePrefixes) {
    expectTerm(parser.parse("mm")[0], Dimension::LENGTH, 1.0, SIPrefix::MILLI);
    expectTerm(parser.parse("ms")[0], Dimension::TIME, 1.0, SIPrefix::MILLI);
    expectTerm(parser.parse("ug")[0], Dimension::MASS, 1.0, SIPrefix::MICRO);
    expectTerm(parser.parse("kmol")[0], Dimension::AMOUNT_OF_SUBSTANCE, 1.0, SIPrefix::KILO);
    expectTerm(parser.parse("hm")[0], Dimension::LENGTH, 1.0, SIPrefix::HECTO);
    expectTerm(parser.parse("MA")[0], Dimension::CURRENT, 1.0, SIPrefix::MEGA);
}

TEST_F(UnitParserTest, DecaIsTriedBeforeDeci) {
    expectTerm(parser.parse("dam")[0], Dimension::LENGTH, 1.0, SIPrefix::DECA);
    expectTerm(parser.parse("das")[0], Dimension::TIME, 1.0, SIPrefix::DECA);
    expectTerm(parser.parse("dm")[0], Dimension::LENGTH, 1.0, SIPrefix::DECI);
}

TEST_F(UnitParserTest, VerbatimSymbolsTakeNoPrefix) {
    // "min" is minutes, not milli-"in"; "h" is hours, not hecto
    expectTerm(parser.parse("min")[0], Dimension::TIME, 1.0);
    expectTerm(parser.parse("h")[0], Dimension::TIME, 1.0);
    expectTerm(parser.parse("cd")[0], Dimension::LUMINOUS_INTENSITY, 1.0);
    expectTerm(parser.parse("mol")[0], Dimension::AMOUNT_OF_SUBSTANCE, 1.0);
    expectTerm(parser.parse("mi")[0], Dimension::LENGTH, 1.0);
}

TEST_F(UnitParserTest, NonPrefixableUnitsRejectPrefixes) {
    EXPECT_THROW(parser.parse("kft"), ParseError);
    EXPECT_THROW(parser.parse("klb"), ParseError);
}

TEST_F(UnitParserTest, SeparatePrefix) {
    std::string trimmed;
    SIPrefix prefix = SIPrefix::NONE;

    EXPECT_TRUE(parser.separatePrefix("kg", trimmed, prefix));
    EXPECT_EQ(trimmed, "g");
    EXPECT_EQ(prefix, SIPrefix::KILO);

    EXPECT_TRUE(parser.separatePrefix("ft", trimmed, prefix));
    EXPECT_EQ(trimmed, "ft");
    EXPECT_EQ(prefix, SIPrefix::NONE);

    EXPECT_FALSE(parser.separatePrefix("zzz", trimmed, prefix));
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(UnitParserTest, MoreThanOneDivisor) {
    EXPECT_THROW(parser.parse("m/s/kg"), ParseError);
}

TEST_F(UnitParserTest, MalformedExponents) {
    EXPECT_THROW(parser.parse("m^"), ParseError);
    EXPECT_THROW(parser.parse("m^2^3"), ParseError);
    EXPECT_THROW(parser.parse("m^2.5"), ParseError);
    EXPECT_THROW(parser.parse("m^k"), ParseError);
    EXPECT_THROW(parser.parse("m^-"), ParseError);
    EXPECT_THROW(parser.parse("m^99999999999"), ParseError);
}

TEST_F(UnitParserTest, MisplacedNumbers) {
    EXPECT_THROW(parser.parse("m2"), ParseError);
    EXPECT_THROW(parser.parse("m/1"), ParseError);
    EXPECT_THROW(parser.parse("1^2/m"), ParseError);
    EXPECT_THROW(parser.parse("2/m"), ParseError);
}

TEST_F(UnitParserTest, EmptyTerms) {
    EXPECT_THROW(parser.parse(""), ParseError);
    EXPECT_THROW(parser.parse("m**s"), ParseError);
    EXPECT_THROW(parser.parse("m/"), ParseError);
    EXPECT_THROW(parser.parse("^2"), ParseError);
}

TEST_F(UnitParserTest, UnknownSymbol) {
    EXPECT_THROW(parser.parse("furlong"), ParseError);
    EXPECT_THROW(parser.getDimension("furlong"), ParseError);
}

// ============================================================================
// Symbol Table Tests
// ============================================================================

TEST_F(UnitParserTest, DefaultSymbolTable) {
    EXPECT_TRUE(parser.hasSymbol("lb"));
    EXPECT_TRUE(parser.hasSymbol("degF"));
    EXPECT_TRUE(parser.isPrefixable("g"));
    EXPECT_FALSE(parser.isPrefixable("lb"));
    EXPECT_EQ(parser.getDimension("fathom"), Dimension::LENGTH);
    EXPECT_EQ(parser.getDimension("degC"), Dimension::TEMPERATURE);
    EXPECT_EQ(parser.getSymbols().size(), 41u);
}

TEST_F(UnitParserTest, AddSymbol) {
    parser.addSymbol("furlong", Dimension::LENGTH);
    UnitTermSequence terms = parser.parse("furlong/s");
    ASSERT_EQ(terms.size(), 2u);
    expectTerm(terms[0], Dimension::LENGTH, 1.0);

    // The shared parser is unaffected
    EXPECT_THROW(parseUnitString("furlong"), ParseError);
}

TEST_F(UnitParserTest, AddPrefixableSymbol) {
    parser.addSymbol("furlong", Dimension::LENGTH, true);
    expectTerm(parser.parse("kfurlong")[0], Dimension::LENGTH, 1.0, SIPrefix::KILO);
}

TEST_F(UnitParserTest, AddSymbolRejectsDigits) {
    EXPECT_THROW(parser.addSymbol("m2", Dimension::LENGTH), ParseError);
    EXPECT_THROW(parser.addSymbol("", Dimension::LENGTH), ParseError);
}
