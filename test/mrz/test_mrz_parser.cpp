/**
 * @file test_mrz_parser.cpp
 * @brief TD3 field decoding, checksum validation and self-correction
 */

#include <gtest/gtest.h>

#include "mrz/mrz_parser.h"
#include "mrz_test_utils.h"

using namespace passport;
using namespace passport::testing;

namespace {

ParsedMrz Parse(const std::string& line1, const std::string& line2) {
    auto block = MRZBlock::create(line1, line2);
    EXPECT_TRUE(block.has_value()) << line1 << " / " << line2;
    if (!block) {
        return ParsedMrz();
    }
    return MrzParser().parse(*block);
}

const MRZField& Field(const ParsedMrz& parsed, const char* name) {
    const MRZField* f = parsed.find(name);
    EXPECT_NE(f, nullptr) << name;
    static const MRZField kEmpty;
    return f ? *f : kEmpty;
}

std::string Replace(std::string line, size_t pos, char c) {
    line[pos] = c;
    return line;
}

} // namespace

// ==================== MRZBlock ====================

TEST(MRZBlock, RejectsWrongLengthOrAlphabet) {
    EXPECT_TRUE(MRZBlock::create(kSpecimenLine1, kSpecimenLine2).has_value());
    EXPECT_FALSE(MRZBlock::create(kSpecimenLine1.substr(1), kSpecimenLine2).has_value());
    EXPECT_FALSE(MRZBlock::create(kSpecimenLine1, Replace(kSpecimenLine2, 3, 'x')).has_value());
}

// ==================== Valid block ====================

/**
 * @brief The specimen decodes to its documented values, all high confidence
 */
TEST(MrzParser, SpecimenAllFieldsValid) {
    ParsedMrz parsed = Parse(kSpecimenLine1, kSpecimenLine2);

    EXPECT_TRUE(parsed.blockValid);
    EXPECT_TRUE(parsed.namesSeparated);
    EXPECT_EQ(Field(parsed, mrz_field::kDocumentType).value, "P");
    EXPECT_EQ(Field(parsed, mrz_field::kIssuingCountry).value, "UTO");
    EXPECT_EQ(Field(parsed, mrz_field::kSurname).value, "ERIKSSON");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).value, "ANNA MARIA");
    EXPECT_EQ(Field(parsed, mrz_field::kPassportNumber).value, "L898902C3");
    EXPECT_EQ(Field(parsed, mrz_field::kPassportNumber).raw, "L898902C36");
    EXPECT_EQ(Field(parsed, mrz_field::kNationality).value, "UTO");
    EXPECT_EQ(Field(parsed, mrz_field::kDateOfBirth).value, "740812");
    EXPECT_EQ(Field(parsed, mrz_field::kSex).value, "F");
    EXPECT_EQ(Field(parsed, mrz_field::kExpiryDate).value, "120415");
    EXPECT_EQ(Field(parsed, mrz_field::kPersonalNumber).value, "ZE184226B");

    for (const auto& entry : parsed.fields) {
        EXPECT_EQ(entry.second.confidence, FieldConfidence::High) << entry.first;
        EXPECT_FALSE(entry.second.corrected) << entry.first;
    }
}

/**
 * @brief Generated lines with an empty personal number validate
 */
TEST(MrzParser, GeneratedBlockValid) {
    ParsedMrz parsed = Parse(MakeLine1("NOVAK", "PETR JAN", "CZE"),
                             MakeLine2("CZ1234567", "CZE", "850101", "M", "300101"));
    EXPECT_TRUE(parsed.blockValid);
    EXPECT_EQ(Field(parsed, mrz_field::kPersonalNumber).value, "");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).value, "PETR JAN");
}

// ==================== Checksum failures ====================

/**
 * @brief A wrong date digit flags the date and the composite, nothing else
 */
TEST(MrzParser, AlteredBirthDigitFlagsOnlyBirthDate) {
    ParsedMrz parsed = Parse(kSpecimenLine1, Replace(kSpecimenLine2, 18, '3'));

    EXPECT_FALSE(parsed.blockValid);
    const MRZField& birth = Field(parsed, mrz_field::kDateOfBirth);
    EXPECT_FALSE(birth.checksumValid);
    EXPECT_EQ(birth.confidence, FieldConfidence::Low);
    EXPECT_EQ(birth.value, "740813");
    EXPECT_FALSE(Field(parsed, mrz_field::kComposite).checksumValid);

    EXPECT_EQ(Field(parsed, mrz_field::kPassportNumber).confidence, FieldConfidence::High);
    EXPECT_EQ(Field(parsed, mrz_field::kExpiryDate).confidence, FieldConfidence::High);
    EXPECT_EQ(Field(parsed, mrz_field::kPersonalNumber).confidence, FieldConfidence::High);
    EXPECT_EQ(Field(parsed, mrz_field::kSurname).confidence, FieldConfidence::High);
}

// ==================== Self-correction ====================

/**
 * @brief 'O' in a date position is read back as '0'
 */
TEST(MrzParser, BirthDateLetterCorrected) {
    ParsedMrz parsed = Parse(kSpecimenLine1, Replace(kSpecimenLine2, 15, 'O'));

    const MRZField& birth = Field(parsed, mrz_field::kDateOfBirth);
    EXPECT_TRUE(birth.checksumValid);
    EXPECT_TRUE(birth.corrected);
    EXPECT_EQ(birth.value, "740812");
    EXPECT_EQ(birth.raw, "74O8122");
    EXPECT_EQ(birth.confidence, FieldConfidence::High);
    EXPECT_TRUE(Field(parsed, mrz_field::kComposite).checksumValid);
    EXPECT_TRUE(parsed.blockValid);
}

/**
 * @brief Exactly one substitution variant passes: value replaced
 */
TEST(MrzParser, PassportNumberUniquelyCorrected) {
    std::string line2 = MakeLine2("XK4037297", "UTO", "740812", "F", "300415");
    ASSERT_EQ(line2[9], '9');
    ParsedMrz parsed = Parse(kSpecimenLine1, Replace(line2, 3, 'O'));

    const MRZField& number = Field(parsed, mrz_field::kPassportNumber);
    EXPECT_TRUE(number.corrected);
    EXPECT_FALSE(number.ambiguous);
    EXPECT_EQ(number.value, "XK4037297");
    EXPECT_EQ(number.confidence, FieldConfidence::High);
    EXPECT_TRUE(Field(parsed, mrz_field::kComposite).checksumValid);
}

/**
 * @brief Two variants pass: keep what was read, flag ambiguous and low
 */
TEST(MrzParser, PassportNumberAmbiguous) {
    ParsedMrz parsed = Parse(kSpecimenLine1, Replace(kSpecimenLine2, 5, 'O'));

    const MRZField& number = Field(parsed, mrz_field::kPassportNumber);
    EXPECT_TRUE(number.ambiguous);
    EXPECT_FALSE(number.corrected);
    EXPECT_FALSE(number.checksumValid);
    EXPECT_EQ(number.value, "L8989O2C3");
    EXPECT_EQ(number.confidence, FieldConfidence::Low);
    EXPECT_FALSE(parsed.blockValid);
}

/**
 * @brief A misread check digit is not explained away by reading digits as letters
 *
 * 276465040 checks to 4; read as 7, the single variant 27646S040 would pass.
 */
TEST(MrzParser, MisreadCheckDigitStaysLow) {
    std::string line2 = MakeLine2("276465040", "UTO", "740812", "F", "300415");
    ASSERT_EQ(line2[9], '4');
    ParsedMrz parsed = Parse(kSpecimenLine1, Replace(line2, 9, '7'));

    const MRZField& number = Field(parsed, mrz_field::kPassportNumber);
    EXPECT_FALSE(number.checksumValid);
    EXPECT_FALSE(number.corrected);
    EXPECT_TRUE(number.ambiguous);
    EXPECT_EQ(number.value, "276465040");
    EXPECT_EQ(number.confidence, FieldConfidence::Low);
    EXPECT_FALSE(parsed.blockValid);
}

/**
 * @brief Without a substitution table nothing is corrected
 */
TEST(MrzParser, EmptySubstitutionTableDisablesCorrection) {
    ParserConfig config;
    config.substitutions = SubstitutionTable(std::vector<std::pair<char, char>>{});
    auto block = MRZBlock::create(kSpecimenLine1, Replace(kSpecimenLine2, 15, 'O'));
    ASSERT_TRUE(block.has_value());

    ParsedMrz parsed = MrzParser(config).parse(*block);
    const MRZField* birth = parsed.find(mrz_field::kDateOfBirth);
    ASSERT_NE(birth, nullptr);
    EXPECT_FALSE(birth->corrected);
    EXPECT_FALSE(birth->checksumValid);
    EXPECT_EQ(birth->value, "74O812");
    EXPECT_FALSE(birth->plausible);
}

// ==================== Names ====================

TEST(MrzParser, SurnameOnly) {
    ParsedMrz parsed = Parse(MakeLine1("ERIKSSON", ""), kSpecimenLine2);
    EXPECT_TRUE(parsed.namesSeparated);
    EXPECT_EQ(Field(parsed, mrz_field::kSurname).value, "ERIKSSON");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).value, "");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).confidence, FieldConfidence::High);
}

/**
 * @brief A single '<' between names means the boundary was misread
 */
TEST(MrzParser, MissingNameBoundaryIsLow) {
    ParsedMrz parsed = Parse(PadFiller("P<UTOERIKSSON<ANNA"), kSpecimenLine2);
    EXPECT_FALSE(parsed.namesSeparated);
    EXPECT_EQ(Field(parsed, mrz_field::kSurname).value, "ERIKSSON ANNA");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).confidence, FieldConfidence::Low);
}

TEST(MrzParser, SingleLetterGivenTokensDropped) {
    ParsedMrz parsed = Parse(PadFiller("P<UTOERIKSSON<<ANNA<K<MARIA"), kSpecimenLine2);
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).value, "ANNA MARIA");
}

TEST(MrzParser, CompoundSurname) {
    ParsedMrz parsed = Parse(MakeLine1("DE<LA<CRUZ", "JUAN"), kSpecimenLine2);
    EXPECT_EQ(Field(parsed, mrz_field::kSurname).value, "DE LA CRUZ");
    EXPECT_EQ(Field(parsed, mrz_field::kGivenNames).value, "JUAN");
}

// ==================== Other fields ====================

/**
 * @brief '<' in the sex position is an unspecified sex, still plausible
 */
TEST(MrzParser, UnspecifiedSex) {
    ParsedMrz parsed = Parse(kSpecimenLine1, MakeLine2("L898902C3", "UTO", "740812", "<", "120415"));
    const MRZField& sex = Field(parsed, mrz_field::kSex);
    EXPECT_EQ(sex.value, "");
    EXPECT_TRUE(sex.plausible);
    EXPECT_EQ(sex.confidence, FieldConfidence::High);
}

TEST(MrzParser, InvalidSexIsLow) {
    ParsedMrz parsed = Parse(kSpecimenLine1, MakeLine2("L898902C3", "UTO", "740812", "X", "120415"));
    EXPECT_EQ(Field(parsed, mrz_field::kSex).confidence, FieldConfidence::Low);
}

TEST(MrzParser, PlausibleDate) {
    EXPECT_TRUE(MrzParser::isPlausibleDate("740812"));
    EXPECT_FALSE(MrzParser::isPlausibleDate("741312"));
    EXPECT_FALSE(MrzParser::isPlausibleDate("740800"));
    EXPECT_FALSE(MrzParser::isPlausibleDate("7408"));
    EXPECT_FALSE(MrzParser::isPlausibleDate("74O812"));
}

TEST(MrzParser, StripFiller) {
    EXPECT_EQ(MrzParser::stripFiller("ANNA<MARIA<<<<"), "ANNA MARIA");
    EXPECT_EQ(MrzParser::stripFiller("<<<<"), "");
    EXPECT_EQ(MrzParser::stripFiller("<A<<B<"), "A B");
}
