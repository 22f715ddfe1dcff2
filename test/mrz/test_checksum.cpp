/**
 * @file test_checksum.cpp
 * @brief Check digit arithmetic and the look-alike substitution table
 */

#include <gtest/gtest.h>

#include "mrz/checksum.h"
#include "mrz/substitution.h"
#include "mrz_test_utils.h"

using namespace passport;
using namespace passport::testing;

// ==================== CheckDigit ====================

/**
 * @brief Character values: digits, letters and the filler
 */
TEST(CheckDigit, CharValue) {
    EXPECT_EQ(CheckDigit::charValue('0'), 0);
    EXPECT_EQ(CheckDigit::charValue('9'), 9);
    EXPECT_EQ(CheckDigit::charValue('A'), 10);
    EXPECT_EQ(CheckDigit::charValue('Z'), 35);
    EXPECT_EQ(CheckDigit::charValue('<'), 0);
    EXPECT_EQ(CheckDigit::charValue('a'), -1);
    EXPECT_EQ(CheckDigit::charValue('#'), -1);
}

/**
 * @brief Every check digit of the ICAO specimen
 */
TEST(CheckDigit, SpecimenFields) {
    const std::string& l2 = kSpecimenLine2;
    EXPECT_EQ(CheckDigit::compute(l2.substr(0, 9)), 6);
    EXPECT_EQ(CheckDigit::compute(l2.substr(13, 6)), 2);
    EXPECT_EQ(CheckDigit::compute(l2.substr(21, 6)), 9);
    EXPECT_EQ(CheckDigit::compute(l2.substr(28, 14)), 1);
    EXPECT_EQ(CheckDigit::compute(l2.substr(0, 10) + l2.substr(13, 7) + l2.substr(21, 22)), 0);
}

TEST(CheckDigit, InvalidCharacterGivesMinusOne) {
    EXPECT_EQ(CheckDigit::compute("L89890#C3"), -1);
    EXPECT_FALSE(CheckDigit::verify("L89890#C3", '6'));
}

/**
 * @brief '<' as a check digit stands for an empty optional field
 */
TEST(CheckDigit, FillerCheckDigit) {
    EXPECT_EQ(CheckDigit::declaredValue('<'), 0);
    EXPECT_EQ(CheckDigit::declaredValue('7'), 7);
    EXPECT_EQ(CheckDigit::declaredValue('O'), -1);
    EXPECT_TRUE(CheckDigit::verify("<<<<<<<<<<<<<<", '<'));
    EXPECT_TRUE(CheckDigit::verify("<<<<<<<<<<<<<<", '0'));
}

TEST(CheckDigit, VerifyRejectsWrongDigit) {
    EXPECT_TRUE(CheckDigit::verify("740812", '2'));
    EXPECT_FALSE(CheckDigit::verify("740812", '3'));
    EXPECT_FALSE(CheckDigit::verify("740812", 'Z'));
}

// ==================== SubstitutionTable ====================

/**
 * @brief Default pairs are symmetric
 */
TEST(SubstitutionTable, DefaultPairs) {
    SubstitutionTable table;
    EXPECT_EQ(table.partner('0'), 'O');
    EXPECT_EQ(table.partner('O'), '0');
    EXPECT_EQ(table.partner('1'), 'I');
    EXPECT_EQ(table.partner('S'), '5');
    EXPECT_EQ(table.partner('B'), '8');
    EXPECT_EQ(table.partner('A'), '\0');
    EXPECT_FALSE(table.isAmbiguous('<'));
    EXPECT_EQ(table.describe(), "0O 1I 5S 8B");
}

TEST(SubstitutionTable, DigitAndLetterCapability) {
    SubstitutionTable table;
    EXPECT_TRUE(table.canBeDigit('O'));
    EXPECT_TRUE(table.canBeDigit('7'));
    EXPECT_FALSE(table.canBeDigit('A'));
    EXPECT_TRUE(table.canBeLetter('8'));
    EXPECT_FALSE(table.canBeLetter('7'));
}

/**
 * @brief A configured table replaces the defaults
 */
TEST(SubstitutionTable, CustomPairs) {
    SubstitutionTable table({{'2', 'Z'}});
    EXPECT_EQ(table.partner('Z'), '2');
    EXPECT_EQ(table.partner('0'), '\0');
    EXPECT_EQ(table.describe(), "2Z");
}
