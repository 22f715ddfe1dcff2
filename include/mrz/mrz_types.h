#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace passport {

constexpr int kTd3LineLength = 44;
constexpr char kFiller = '<';

enum class FieldConfidence { High, Low };

/**
 * @brief Two TD3 lines of exactly 44 characters from [A-Z0-9<]
 */
class MRZBlock {
public:
    /**
     * @brief Validate and build a block
     * @return nullopt if either line has the wrong length or a character outside the MRZ alphabet
     */
    static std::optional<MRZBlock> create(const std::string& line1, const std::string& line2,
                                          std::vector<float> charConfidences1 = {},
                                          std::vector<float> charConfidences2 = {});

    static bool isMrzChar(char c);

    const std::string& line1() const { return line1_; }
    const std::string& line2() const { return line2_; }

    /**
     * @brief Mean OCR confidence over [begin, begin+length) of a line
     * @return nullopt when that line carries no per-character confidences
     */
    std::optional<float> meanConfidence(int line, int begin, int length) const;

private:
    MRZBlock() = default;

    std::string line1_;
    std::string line2_;
    std::vector<float> conf1_;   // empty or kTd3LineLength entries
    std::vector<float> conf2_;
};

/**
 * @brief One decoded MRZ field
 */
struct MRZField {
    std::string name;
    int line = 2;                 // 1 or 2
    int begin = 0;                // first character in the line
    int length = 0;
    std::string raw;              // characters as recognised
    std::string value;            // decoded (possibly self-corrected, filler stripped)
    bool hasCheckDigit = false;
    bool checksumValid = true;    // true for fields without a check digit
    bool corrected = false;       // substitution changed the value
    bool ambiguous = false;       // a substitution candidate passed but was not taken
    bool plausible = true;        // charset / range check for fields without checksum
    FieldConfidence confidence = FieldConfidence::High;
};

/**
 * @brief MRZ field names (parser output keys)
 */
namespace mrz_field {
constexpr const char* kDocumentType   = "document_type";
constexpr const char* kIssuingCountry = "issuing_country";
constexpr const char* kSurname        = "surname";
constexpr const char* kGivenNames     = "given_names";
constexpr const char* kPassportNumber = "passport_number";
constexpr const char* kNationality    = "nationality";
constexpr const char* kDateOfBirth    = "date_of_birth";
constexpr const char* kSex            = "sex";
constexpr const char* kExpiryDate     = "expiry_date";
constexpr const char* kPersonalNumber = "personal_number";
constexpr const char* kComposite      = "composite";
} // namespace mrz_field

/**
 * @brief Parser output
 */
struct ParsedMrz {
    std::map<std::string, MRZField> fields;
    bool blockValid = false;      // every check digit passed
    bool namesSeparated = true;   // line 1 contains the "<<" surname boundary

    const MRZField* find(const std::string& name) const;
};

} // namespace passport
