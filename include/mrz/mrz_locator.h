#pragma once

#include "mrz/mrz_types.h"
#include "mrz/substitution.h"
#include "recognition/ocr_engine.h"

#include <optional>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief MRZ locator settings
 */
struct LocatorConfig {
    int expectedWidth = kTd3LineLength;
    int widthTolerance = 2;
    float minCharsetRatio = 0.85f;   // per line, before normalisation
    float minFitScore = 0.75f;       // pair score needed to report a block
    float minLayoutScore = 0.80f;    // share of positions matching the TD3 layout
    bool repairSplitLines = true;    // rejoin a "P<" line cut in pieces by the detector

    void Show() const;
};

/**
 * @brief Locator output
 */
struct LocatorResult {
    std::optional<MRZBlock> block;
    float confidence = 0.0f;         // fit score of the chosen pair, [0,1]
    int firstLineIndex = -1;         // index of line 1 in the input lines
    float charsetRatio = 0.0f;
    int widthDeviation = 0;

    bool found() const { return block.has_value(); }
};

/**
 * @brief Finds the two-line TD3 block inside a region's OCR lines
 *
 * Every consecutive pair of lines is scored on length, share of MRZ-alphabet
 * characters and TD3 layout (digit/letter positions, allowing the usual OCR
 * look-alikes). Ties go to the higher charset ratio, then the width closest
 * to 44, then the lower pair on the page.
 */
class MrzLocator {
public:
    explicit MrzLocator(const LocatorConfig& config = LocatorConfig(),
                        const SubstitutionTable& substitutions = SubstitutionTable());

    LocatorResult locate(const std::vector<OcrLine>& lines) const;

    /**
     * @brief Uppercase, drop whitespace, map filler look-alikes ('«' ...) to '<'
     *
     * Non-ASCII glyphs that are not filler look-alikes become '?' so the
     * character count stays aligned with per-character confidences.
     */
    static std::string normalizeText(const std::string& text, const std::vector<float>& charConf,
                                     std::vector<float>& outConf);

private:
    struct CleanLine {
        std::string text;
        std::vector<float> conf;
        int sourceIndex = 0;
        float charsetRatio = 0.0f;
    };

    std::vector<CleanLine> cleanLines(const std::vector<OcrLine>& lines) const;
    void repairSplitLine1(std::vector<CleanLine>& lines) const;
    std::string fitToWidth(const std::string& text, std::vector<float>& conf) const;
    float layoutScore(const std::string& line1, const std::string& line2) const;

    LocatorConfig config_;
    SubstitutionTable substitutions_;
};

} // namespace passport
