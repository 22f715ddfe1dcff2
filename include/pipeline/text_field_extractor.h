#pragma once

#include "common/types.hpp"
#include "recognition/ocr_engine.h"

#include <string>
#include <vector>

namespace passport {

/**
 * @brief Field values read from the printed (visual) zone of a data page
 */
struct TextFields {
    std::string lastName;
    std::string givenNames;
    std::string passportNumber;
    std::string dateOfBirth;   // DD/MM/YYYY
    std::string gender;        // "M" / "F"
    std::string nationality;   // 3-letter code

    bool empty() const;
};

/**
 * @brief Label-driven extraction used when the MRZ is missing or incomplete
 *
 * Looks for labels such as "SURNAME" or "DATE OF BIRTH" and takes the value
 * on the same line or one of the next lines. Results are never trusted:
 * merged fields stay flagged low confidence.
 */
class TextFieldExtractor {
public:
    TextFields extract(const std::vector<OcrLine>& lines) const;

    /**
     * @brief Fill only the empty fields of record; filled fields are flagged low
     * @return number of fields filled
     */
    static int mergeInto(PassportRecord& record, const TextFields& text);

    /// "THAILAND" / "THAI" -> "THA"; empty when unknown
    static std::string countryCode(const std::string& text);

private:
    std::string valueAfterLabel(const std::vector<std::string>& lines,
                                const std::vector<std::string>& labels) const;
    std::string findDate(const std::vector<std::string>& lines) const;
    std::string findGender(const std::vector<std::string>& lines) const;
};

} // namespace passport
