#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace passport {

/**
 * @brief Quadrilateral text box from the detector
 */
struct DetectedBox {
    std::vector<cv::Point2f> points;   // clockwise from top-left, source image coordinates
    float score = 0.0f;

    cv::Rect boundingRect() const;
};

/**
 * @brief DB (Differentiable Binarization) post-processing
 *
 * Probability map -> threshold -> contours -> scored, unclipped boxes mapped
 * back to the source image.
 */
class DBPostProcessor {
public:
    DBPostProcessor(float thresh = 0.3f,
                    float boxThresh = 0.6f,
                    int maxCandidates = 1500,
                    float unclipRatio = 1.5f);

    /**
     * @brief Extract boxes from a probability map
     * @param pred CV_32FC1 probability map (model output size)
     * @param srcH source image height
     * @param srcW source image width
     * @param paddedH height of the padded image fed to the resize (0 = srcH)
     * @param paddedW width of the padded image fed to the resize (0 = srcW)
     */
    std::vector<DetectedBox> process(const cv::Mat& pred, int srcH, int srcW,
                                     int paddedH = 0, int paddedW = 0) const;

private:
    float boxScoreFast(const cv::Mat& pred, const std::vector<cv::Point>& contour) const;
    std::vector<cv::Point2f> unclip(const std::vector<cv::Point2f>& box) const;

    float thresh_;
    float boxThresh_;
    int maxCandidates_;
    float unclipRatio_;
};

} // namespace passport
