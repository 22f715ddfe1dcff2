#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief One recognised text line, top-to-bottom reading order
 */
struct OcrLine {
    std::string text;
    float confidence = 0.0f;               // mean over the line, [0,1]
    std::vector<float> charConfidences;    // one per character of text, may be empty
    cv::Rect box;                          // in the recognised image, may be empty
};

/**
 * @brief Text recognition capability consumed by the pipeline
 *
 * Implementations must be callable from several worker threads at once.
 * A failure is reported by throwing OcrError.
 */
class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    /**
     * @brief Load models / warm up
     * @return false when the engine cannot be used
     */
    virtual bool initialize() { return true; }

    /**
     * @brief Recognise all text lines in an image
     * @param image BGR region image
     * @return lines sorted top-to-bottom
     * @throws OcrError on backend failure
     */
    virtual std::vector<OcrLine> recognize(const cv::Mat& image) = 0;

    virtual std::string name() const = 0;
};

} // namespace passport
