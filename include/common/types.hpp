#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace passport {

/**
 * Record field names, shared by the assembler, the JSON layer and the exporter
 */
namespace field {
constexpr const char* kFirstName      = "first_name";
constexpr const char* kMiddleName     = "middle_name";
constexpr const char* kLastName       = "last_name";
constexpr const char* kGender         = "gender";
constexpr const char* kPassportNumber = "passport_number";
constexpr const char* kNationality    = "nationality";
constexpr const char* kDateOfBirth    = "date_of_birth";
} // namespace field

/// Record field order (fresh workbook columns follow it)
constexpr std::array<const char*, 7> kRecordFields = {
    field::kFirstName, field::kMiddleName, field::kLastName, field::kGender,
    field::kPassportNumber, field::kNationality, field::kDateOfBirth
};

/**
 * @brief One passport as returned to the reviewer and written to the workbook
 */
struct PassportRecord {
    std::string firstName;
    std::string middleName;
    std::string lastName;
    std::string gender;          // "M", "F" or "" (unspecified)
    std::string passportNumber;
    std::string nationality;     // ICAO 3-letter code, filler stripped
    std::string dateOfBirth;     // DD/MM/YYYY, or the raw MRZ digits when invalid

    float confidence = 0.0f;     // fraction of scored fields at high confidence

    std::vector<std::string> lowConfidenceFields;
    std::vector<std::string> missingFields;     // required but empty
    std::vector<std::string> ambiguousFields;   // both substitution candidates checksum
    std::vector<std::string> correctedFields;   // silently self-corrected

    std::vector<uint8_t> thumbnailJpeg;
    std::vector<uint8_t> fullImageJpeg;

    int sourcePage = 0;
    int regionIndex = 0;
    bool mrzFound = false;

    /**
     * @brief Field value by record field name
     * @throws std::invalid_argument for an unknown name
     */
    const std::string& value(const std::string& name) const;

    /**
     * @brief Reviewer edit: store the value, clear the field's low/missing flags
     *        and recompute confidence
     * @throws std::invalid_argument for an unknown name
     */
    void setValue(const std::string& name, const std::string& newValue);

    /// Confidence = share of record fields not flagged low
    void updateConfidence();

    bool isLowConfidence(const std::string& name) const;

    /// Flag a field low confidence once
    void flagLow(const std::string& name);

    /// Flag a field missing once
    void flagMissing(const std::string& name);

private:
    std::string& mutableValue(const std::string& name);
};

} // namespace passport
