/**
 * @file test_unit_term.cpp
 * @brief Unit tests for dimensions, SI prefixes and term sequences
 */

#include <gtest/gtest.h>
#include "UnitTerm.hpp"

using namespace UALG;

class UnitTermTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

// ============================================================================
// Prefix Tests
// ============================================================================

TEST_F(UnitTermTest, PrefixTableHasTwentyEntries) {
    EXPECT_EQ(siPrefixes().size(), 20u);
    EXPECT_EQ(siPrefixes().front().prefix, SIPrefix::YOCTO);
    EXPECT_EQ(siPrefixes().back().prefix, SIPrefix::YOTTA);
}

TEST_F(UnitTermTest, PrefixSymbolsAndNames) {
    EXPECT_EQ(prefixSymbol(SIPrefix::KILO), "k");
    EXPECT_EQ(prefixSymbol(SIPrefix::MICRO), "u");
    EXPECT_EQ(prefixSymbol(SIPrefix::DECA), "da");
    EXPECT_EQ(prefixName(SIPrefix::MILLI), "milli");
    EXPECT_EQ(prefixName(SIPrefix::GIGA), "giga");
    EXPECT_EQ(prefixSymbol(SIPrefix::NONE), "");
}

TEST_F(UnitTermTest, PrefixMagnitudes) {
    EXPECT_DOUBLE_EQ(prefixMagnitude(SIPrefix::KILO), 1e3);
    EXPECT_DOUBLE_EQ(prefixMagnitude(SIPrefix::NANO), 1e-9);
    EXPECT_DOUBLE_EQ(prefixMagnitude(SIPrefix::YOTTA), 1e24);
    EXPECT_DOUBLE_EQ(prefixMagnitude(SIPrefix::NONE), 1.0);
}

TEST_F(UnitTermTest, PrefixFromSymbol) {
    SIPrefix prefix = SIPrefix::NONE;
    EXPECT_TRUE(prefixFromSymbol("da", prefix));
    EXPECT_EQ(prefix, SIPrefix::DECA);
    EXPECT_TRUE(prefixFromSymbol("M", prefix));
    EXPECT_EQ(prefix, SIPrefix::MEGA);
    EXPECT_FALSE(prefixFromSymbol("x", prefix));
    EXPECT_FALSE(prefixFromSymbol("", prefix));
}

// ============================================================================
// UnitTerm Tests
// ============================================================================

TEST_F(UnitTermTest, RootSymbols) {
    EXPECT_EQ(dimensionRootSymbol(Dimension::TIME), "s");
    EXPECT_EQ(dimensionRootSymbol(Dimension::LENGTH), "m");
    EXPECT_EQ(dimensionRootSymbol(Dimension::MASS), "g");
    EXPECT_EQ(dimensionRootSymbol(Dimension::AMOUNT_OF_SUBSTANCE), "mol");
    EXPECT_EQ(dimensionRootSymbol(Dimension::RECIPROCAL), "1");
}

TEST_F(UnitTermTest, SymbolCombinesPrefixAndRoot) {
    EXPECT_EQ(UnitTerm(Dimension::MASS, 3.0, SIPrefix::KILO).symbol(), "kg");
    EXPECT_EQ(UnitTerm(Dimension::TIME, -1.0, SIPrefix::MILLI).symbol(), "ms");
    EXPECT_EQ(UnitTerm(Dimension::LENGTH, 1.0).symbol(), "m");
}

TEST_F(UnitTermTest, DefaultTermIsReciprocal) {
    UnitTerm term;
    EXPECT_TRUE(term.isReciprocal());
    EXPECT_DOUBLE_EQ(term.exponent, 1.0);
    EXPECT_EQ(term.symbol(), "1");
}

TEST_F(UnitTermTest, EqualityIgnoresPrefix) {
    EXPECT_EQ(UnitTerm(Dimension::LENGTH, 1.0, SIPrefix::KILO),
              UnitTerm(Dimension::LENGTH, 1.0, SIPrefix::NONE));
    EXPECT_NE(UnitTerm(Dimension::LENGTH, 1.0), UnitTerm(Dimension::TIME, 1.0));
}

TEST_F(UnitTermTest, ExponentTolerance) {
    EXPECT_EQ(UnitTerm(Dimension::LENGTH, 2.0), UnitTerm(Dimension::LENGTH, 2.0 + 1e-12));
    EXPECT_NE(UnitTerm(Dimension::LENGTH, 2.0), UnitTerm(Dimension::LENGTH, 2.001));
    EXPECT_TRUE(isZeroExponent(1e-11));
    EXPECT_FALSE(isZeroExponent(1e-6));
}

// ============================================================================
// UnitTermSequence Tests
// ============================================================================

TEST_F(UnitTermTest, SequenceLookup) {
    UnitTermSequence seq = {
        UnitTerm(Dimension::LENGTH, 1.0),
        UnitTerm(Dimension::TIME, -2.0),
        UnitTerm(Dimension::LENGTH, 2.0)
    };

    EXPECT_EQ(seq.size(), 3u);
    EXPECT_TRUE(seq.contains(Dimension::TIME));
    EXPECT_FALSE(seq.contains(Dimension::MASS));
    ASSERT_NE(seq.find(Dimension::LENGTH), nullptr);
    EXPECT_DOUBLE_EQ(seq.find(Dimension::LENGTH)->exponent, 1.0);
    EXPECT_DOUBLE_EQ(seq.exponentOf(Dimension::LENGTH), 3.0);
    EXPECT_DOUBLE_EQ(seq.exponentOf(Dimension::MASS), 0.0);
    EXPECT_EQ(seq.dimensions().size(), 2u);
}

TEST_F(UnitTermTest, SequenceEqualityIsOrderIndependent) {
    UnitTermSequence a = {UnitTerm(Dimension::LENGTH, 1.0), UnitTerm(Dimension::TIME, -1.0)};
    UnitTermSequence b = {UnitTerm(Dimension::TIME, -1.0), UnitTerm(Dimension::LENGTH, 1.0)};
    UnitTermSequence c = {UnitTerm(Dimension::LENGTH, 1.0)};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST_F(UnitTermTest, SequenceEqualityIsSymmetric) {
    // Uncollapsed sequences with a repeated dimension
    UnitTermSequence metre_second = {UnitTerm(Dimension::LENGTH, 1.0), UnitTerm(Dimension::TIME, 1.0)};
    UnitTermSequence metre_metre = {UnitTerm(Dimension::LENGTH, 1.0), UnitTerm(Dimension::LENGTH, 1.0)};

    EXPECT_FALSE(metre_second == metre_metre);
    EXPECT_FALSE(metre_metre == metre_second);
    EXPECT_TRUE(metre_metre == metre_metre);

    UnitTermSequence twice = {UnitTerm(Dimension::MASS, 1.0), UnitTerm(Dimension::MASS, 1.0),
                              UnitTerm(Dimension::TIME, 1.0)};
    UnitTermSequence once = {UnitTerm(Dimension::MASS, 1.0), UnitTerm(Dimension::TIME, 1.0),
                             UnitTerm(Dimension::TIME, 1.0)};
    EXPECT_FALSE(twice == once);
    EXPECT_FALSE(once == twice);
}

TEST_F(UnitTermTest, EmptySequence) {
    UnitTermSequence seq;
    EXPECT_TRUE(seq.empty());
    EXPECT_FALSE(seq.contains(Dimension::RECIPROCAL));
}
