#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace passport {

/**
 * @brief Geometry helpers shared by the segmenter and the OCR backend
 */
class Geometry {
public:
    static float distance(const cv::Point2f& p1, const cv::Point2f& p2);

    /**
     * @brief Order four points as top-left, top-right, bottom-right, bottom-left
     * @param points input points (4)
     * @return ordered points; input returned unchanged if it is not 4 points
     */
    static std::vector<cv::Point2f> orderPointsClockwise(const std::vector<cv::Point2f>& points);

    /**
     * @brief Perspective-crop a rotated quadrilateral at its native size
     * @param image source image
     * @param box four corners (any order)
     * @return upright crop, empty Mat if box is not 4 points or degenerate
     */
    static cv::Mat getRotateCropImage(const cv::Mat& image,
                                      const std::vector<cv::Point2f>& box);

    /**
     * @brief Perspective-crop a quadrilateral to a fixed height (text line input)
     */
    static cv::Mat cropTextRegion(const cv::Mat& image,
                                  const std::vector<cv::Point2f>& box,
                                  int dstHeight = 48);

    /**
     * @brief Corners of the minimum-area rectangle, ordered clockwise
     */
    static std::vector<cv::Point2f> getMinBoxPoints(const std::vector<cv::Point>& points);

    static float calculateIoU(const cv::Rect& rect1, const cv::Rect& rect2);

    /**
     * @brief Intersection area divided by the smaller rectangle's area
     *
     * Catches the nested case IoU misses (a small box inside a large one).
     */
    static float overlapRatio(const cv::Rect& rect1, const cv::Rect& rect2);
};

} // namespace passport
