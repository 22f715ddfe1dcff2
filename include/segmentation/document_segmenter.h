#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief One passport sub-image cut from a scanned page
 */
struct PassportImageRegion {
    int pageIndex = 0;
    int regionIndex = 0;
    cv::Rect boundingBox;        // in page pixel coordinates
    float rotationHint = 0.0f;   // skew of the detected rectangle, degrees
    bool fullPage = false;       // fallback region covering the whole page
    cv::Mat image;               // deskewed crop, shares no buffer with the page
};

/**
 * @brief Segmenter settings
 */
struct SegmenterConfig {
    int workMaxSide = 1000;          // longest side of the analysis copy
    float targetAspect = 1.42f;      // passport data page, long side / short side
    float aspectTolerance = 0.25f;   // relative
    float minAreaRatio = 0.05f;      // of page area
    float maxAreaRatio = 0.95f;      // larger candidates are the page border
    float minFillRatio = 0.80f;      // contour area / bounding rotated rect area
    float mergeIoU = 0.30f;
    float mergeContainment = 0.80f;  // intersection over the smaller rect
    int maxRegions = 3;
    float deskewMinAngle = 2.0f;     // degrees; below this the crop stays axis-aligned
    int cannyLow = 30;
    int cannyHigh = 100;

    void Show() const;
};

/**
 * @brief Result of segmenting one page
 */
struct SegmentationResult {
    std::vector<PassportImageRegion> regions;   // 1..maxRegions, reading order
    bool fallbackUsed = false;                  // no passport-shaped region found
};

/**
 * @brief Splits a scanned page into passport-shaped regions
 *
 * Works on a downscaled grayscale copy: edges, closing, external contours,
 * then an aspect/area/fill filter. Never fails; worst case is one
 * full-page region.
 */
class DocumentSegmenter {
public:
    explicit DocumentSegmenter(const SegmenterConfig& config = SegmenterConfig());

    /**
     * @brief Segment one page
     * @param page BGR or gray page image
     * @param pageIndex copied into each region
     */
    SegmentationResult segment(const cv::Mat& page, int pageIndex = 0) const;

    const SegmenterConfig& config() const { return config_; }

private:
    struct Candidate {
        cv::Rect rect;               // page coordinates
        cv::RotatedRect rotated;     // page coordinates
    };

    std::vector<Candidate> findCandidates(const cv::Mat& page, double& scale) const;
    std::vector<Candidate> mergeOverlapping(std::vector<Candidate> candidates) const;
    PassportImageRegion cropRegion(const cv::Mat& page, const Candidate& candidate) const;

    SegmenterConfig config_;
};

} // namespace passport
