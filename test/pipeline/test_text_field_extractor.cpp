/**
 * @file test_text_field_extractor.cpp
 * @brief Label-driven reading of the printed zone
 */

#include <gtest/gtest.h>

#include "pipeline/record_assembler.h"
#include "pipeline/text_field_extractor.h"
#include "fakes/fake_ocr_engine.h"

using namespace passport;
using namespace passport::testing;

namespace {

std::vector<OcrLine> DataPage() {
    return FakeOcrEngine::Lines({
        "REPUBLIC OF UTOPIA",
        "Passport No.",
        "L898902C3",
        "Surname / Nom",
        "ERIKSSON",
        "Given names",
        "Anna Maria",
        "Nationality",
        "THAI",
        "Date of birth",
        "12 AUG 1974",
        "Sex",
        "F",
        "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<",
    });
}

} // namespace

// ==================== Extraction ====================

TEST(TextFieldExtractor, ReadsLabelledFields) {
    TextFields fields = TextFieldExtractor().extract(DataPage());

    EXPECT_EQ(fields.lastName, "ERIKSSON");
    EXPECT_EQ(fields.givenNames, "ANNA MARIA");
    EXPECT_EQ(fields.passportNumber, "L898902C3");
    EXPECT_EQ(fields.nationality, "THA");
    EXPECT_EQ(fields.dateOfBirth, "12/08/1974");
    EXPECT_EQ(fields.gender, "F");
    EXPECT_FALSE(fields.empty());
}

/**
 * @brief Value on the label line itself
 */
TEST(TextFieldExtractor, ValueOnSameLine) {
    TextFields fields = TextFieldExtractor().extract(FakeOcrEngine::Lines({
        "Surname: DE LA CRUZ", "Date of birth 05/03/1990", "Sex: MALE"}));
    EXPECT_EQ(fields.lastName, "DE LA CRUZ");
    EXPECT_EQ(fields.dateOfBirth, "05/03/1990");
    EXPECT_EQ(fields.gender, "M");
}

TEST(TextFieldExtractor, NothingToRead) {
    TextFields fields = TextFieldExtractor().extract(FakeOcrEngine::Lines({"VISA", "ENTRY STAMP"}));
    EXPECT_TRUE(fields.empty());
}

TEST(TextFieldExtractor, CountryCode) {
    EXPECT_EQ(TextFieldExtractor::countryCode("Thailand"), "THA");
    EXPECT_EQ(TextFieldExtractor::countryCode("UNITED STATES OF AMERICA"), "USA");
    EXPECT_EQ(TextFieldExtractor::countryCode("BRITISH CITIZEN"), "GBR");
    EXPECT_EQ(TextFieldExtractor::countryCode("UTOPIAN"), "");
}

// ==================== Merging ====================

/**
 * @brief Only empty fields are filled, and filled fields stay low confidence
 */
TEST(TextFieldExtractor, MergeFillsOnlyEmptyFields) {
    PassportRecord record = RecordAssembler().placeholder(PassportImageRegion());
    record.setValue(field::kPassportNumber, "XK4037297");

    TextFields fields = TextFieldExtractor().extract(DataPage());
    int filled = TextFieldExtractor::mergeInto(record, fields);

    EXPECT_EQ(filled, 6);
    EXPECT_EQ(record.passportNumber, "XK4037297");
    EXPECT_FALSE(record.isLowConfidence(field::kPassportNumber));
    EXPECT_EQ(record.lastName, "ERIKSSON");
    EXPECT_EQ(record.firstName, "ANNA");
    EXPECT_EQ(record.middleName, "MARIA");
    EXPECT_TRUE(record.isLowConfidence(field::kLastName));
    EXPECT_TRUE(record.isLowConfidence(field::kDateOfBirth));
}

TEST(TextFieldExtractor, MergeNothing) {
    PassportRecord record;
    EXPECT_EQ(TextFieldExtractor::mergeInto(record, TextFields()), 0);
}
