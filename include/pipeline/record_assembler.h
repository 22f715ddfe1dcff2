#pragma once

#include "common/types.hpp"
#include "mrz/mrz_types.h"
#include "segmentation/document_segmenter.h"

#include <opencv2/core.hpp>
#include <string>

namespace passport {

/**
 * @brief Record assembly settings
 */
struct AssemblerConfig {
    int centuryPivot = 30;            // YY <= pivot -> 20YY, else 19YY
    float minCharConfidence = 0.5f;   // mean OCR confidence for fields without a checksum
    int thumbnailMaxSide = 100;
    int thumbnailQuality = 70;
    int fullImageMaxSide = 800;
    int fullImageQuality = 85;

    void Show() const;
};

/**
 * @brief Turns parsed MRZ fields into a reviewable PassportRecord
 */
class RecordAssembler {
public:
    explicit RecordAssembler(const AssemblerConfig& config = AssemblerConfig());

    /**
     * @brief Build a record from a parsed block
     * @param parsed parser output for block
     * @param block the located MRZ (per-character OCR confidences)
     * @param region source region (images, page/region index)
     */
    PassportRecord assemble(const ParsedMrz& parsed, const MRZBlock& block,
                            const PassportImageRegion& region) const;

    /**
     * @brief Manual-entry row: every field empty and flagged low confidence
     */
    PassportRecord placeholder(const PassportImageRegion& region) const;

    /**
     * @brief YYMMDD -> DD/MM/YYYY; input returned unchanged when not a plausible date
     */
    static std::string formatDate(const std::string& yymmdd, int centuryPivot);

    /**
     * @brief Recompute confidence as the share of record fields not flagged low
     */
    static void updateConfidence(PassportRecord& record);

private:
    void attachImages(PassportRecord& record, const PassportImageRegion& region) const;
    bool ocrConfidenceLow(const MRZBlock& block, const MRZField& field) const;

    AssemblerConfig config_;
};

} // namespace passport
