#pragma once

#include "mrz/mrz_types.h"
#include "mrz/substitution.h"

#include <string>

namespace passport {

/**
 * @brief MRZ parser settings
 */
struct ParserConfig {
    SubstitutionTable substitutions;
    int maxAmbiguousPositions = 10;   // per field; more are left uncorrected

    void Show() const;
};

/**
 * @brief Decodes a TD3 block into fields and validates its check digits
 *
 * A field whose check digit fails is kept and marked low confidence. When
 * turning look-alike letters into digits (see SubstitutionTable) yields exactly
 * one checksum-valid variant, that variant becomes the value. When several
 * variants pass, or a passing variant needs a digit read as a letter, the field
 * is marked ambiguous and keeps the recognised characters.
 * Name fields are never substituted.
 */
class MrzParser {
public:
    explicit MrzParser(const ParserConfig& config = ParserConfig());

    ParsedMrz parse(const MRZBlock& block) const;

    /**
     * @brief YYMMDD with month 01-12 and day 01-31
     */
    static bool isPlausibleDate(const std::string& yymmdd);

    /**
     * @brief Strip filler and surrounding spaces
     */
    static std::string stripFiller(const std::string& raw);

private:
    struct CheckedSpan {
        const char* name;
        int begin;
        int length;
        int checkPos;
        bool numeric;
    };

    /// @param resolved receives field + check digit after any self-correction
    MRZField parseChecked(const std::string& line2, const CheckedSpan& span,
                          std::string& resolved) const;
    MRZField parseComposite(const std::string& line2) const;
    void parseNames(const std::string& line1, ParsedMrz& out) const;

    ParserConfig config_;
};

} // namespace passport
