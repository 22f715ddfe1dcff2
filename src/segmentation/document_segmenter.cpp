#include "segmentation/document_segmenter.h"
#include "common/geometry.h"
#include "common/logger.hpp"
#include "preprocessing/image_ops.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace passport {

void SegmenterConfig::Show() const {
    LOG_INFO("SegmenterConfig:");
    LOG_INFO("  workMaxSide={}, targetAspect={:.2f} (+/-{:.0f}%)",
             workMaxSide, targetAspect, aspectTolerance * 100.0f);
    LOG_INFO("  area=[{:.2f}, {:.2f}] of page, minFill={:.2f}, maxRegions={}",
             minAreaRatio, maxAreaRatio, minFillRatio, maxRegions);
    LOG_INFO("  merge: IoU>{:.2f} or containment>{:.2f}", mergeIoU, mergeContainment);
}

DocumentSegmenter::DocumentSegmenter(const SegmenterConfig& config)
    : config_(config) {
}

SegmentationResult DocumentSegmenter::segment(const cv::Mat& page, int pageIndex) const {
    SegmentationResult result;
    if (page.empty()) {
        LOG_WARN("Page {} is empty, nothing to segment", pageIndex);
        result.fallbackUsed = true;
        return result;
    }

    double scale = 1.0;
    auto candidates = mergeOverlapping(findCandidates(page, scale));

    // Keep the largest ones, then restore reading order
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.rect.area() > b.rect.area();
    });
    if (static_cast<int>(candidates.size()) > config_.maxRegions) {
        LOG_DEBUG("Page {}: {} candidates, keeping the {} largest",
                  pageIndex, candidates.size(), config_.maxRegions);
        candidates.resize(config_.maxRegions);
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        int rowTolerance = std::min(a.rect.height, b.rect.height) / 2;
        if (std::abs(a.rect.y - b.rect.y) > rowTolerance) {
            return a.rect.y < b.rect.y;
        }
        return a.rect.x < b.rect.x;
    });

    for (const auto& candidate : candidates) {
        PassportImageRegion region = cropRegion(page, candidate);
        if (region.image.empty()) {
            continue;
        }
        region.pageIndex = pageIndex;
        region.regionIndex = static_cast<int>(result.regions.size());
        result.regions.push_back(std::move(region));
    }

    if (result.regions.empty()) {
        LOG_INFO("Page {}: no passport-shaped region, using the whole page", pageIndex);
        PassportImageRegion region;
        region.pageIndex = pageIndex;
        region.boundingBox = cv::Rect(0, 0, page.cols, page.rows);
        region.fullPage = true;
        region.image = page.clone();
        result.regions.push_back(std::move(region));
        result.fallbackUsed = true;
        return result;
    }

    LOG_DEBUG_EXEC(([&] {
        for (const auto& r : result.regions) {
            LOG_DEBUG("Page {} region {}: [{}, {}, {}x{}] skew={:.1f}", pageIndex, r.regionIndex,
                      r.boundingBox.x, r.boundingBox.y, r.boundingBox.width,
                      r.boundingBox.height, r.rotationHint);
        }
    }));
    return result;
}

std::vector<DocumentSegmenter::Candidate> DocumentSegmenter::findCandidates(
    const cv::Mat& page, double& scale) const {
    cv::Mat work = ImageOps::resizeByMaxLen(page, config_.workMaxSide, &scale);
    cv::Mat gray = ImageOps::toGray(work);

    cv::Mat blurred, edges;
    cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
    cv::Canny(blurred, edges, config_.cannyLow, config_.cannyHigh);

    // Close gaps in the page outline so it comes back as one contour
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
    cv::morphologyEx(edges, edges, cv::MORPH_CLOSE, kernel);
    cv::dilate(edges, edges, cv::Mat(), cv::Point(-1, -1), 1);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double pageArea = static_cast<double>(work.cols) * work.rows;
    const cv::Rect pageRect(0, 0, page.cols, page.rows);
    std::vector<Candidate> candidates;

    for (const auto& contour : contours) {
        cv::RotatedRect rr = cv::minAreaRect(contour);
        double rrArea = static_cast<double>(rr.size.width) * rr.size.height;
        if (rrArea < config_.minAreaRatio * pageArea || rrArea > config_.maxAreaRatio * pageArea) {
            continue;
        }

        float longSide = std::max(rr.size.width, rr.size.height);
        float shortSide = std::min(rr.size.width, rr.size.height);
        if (shortSide < 1.0f) {
            continue;
        }
        float aspect = longSide / shortSide;
        if (std::fabs(aspect - config_.targetAspect) / config_.targetAspect > config_.aspectTolerance) {
            continue;
        }

        std::vector<cv::Point> hull;
        cv::convexHull(contour, hull);
        double fill = cv::contourArea(hull) / rrArea;
        if (fill < config_.minFillRatio) {
            continue;
        }

        cv::Rect box = cv::boundingRect(contour);
        Candidate candidate;
        candidate.rect = cv::Rect(static_cast<int>(box.x / scale), static_cast<int>(box.y / scale),
                                  static_cast<int>(std::ceil(box.width / scale)),
                                  static_cast<int>(std::ceil(box.height / scale))) & pageRect;
        candidate.rotated = cv::RotatedRect(
            cv::Point2f(static_cast<float>(rr.center.x / scale), static_cast<float>(rr.center.y / scale)),
            cv::Size2f(static_cast<float>(rr.size.width / scale), static_cast<float>(rr.size.height / scale)),
            rr.angle);
        candidates.push_back(candidate);
    }

    LOG_DEBUG("Segmenter: {} contours, {} passport-shaped", contours.size(), candidates.size());
    return candidates;
}

std::vector<DocumentSegmenter::Candidate> DocumentSegmenter::mergeOverlapping(
    std::vector<Candidate> candidates) const {
    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t i = 0; i < candidates.size() && !merged; ++i) {
            for (size_t j = i + 1; j < candidates.size(); ++j) {
                const cv::Rect& a = candidates[i].rect;
                const cv::Rect& b = candidates[j].rect;
                if (Geometry::calculateIoU(a, b) <= config_.mergeIoU &&
                    Geometry::overlapRatio(a, b) <= config_.mergeContainment) {
                    continue;
                }

                cv::Rect unionRect = a | b;
                Candidate& keep = candidates[i];
                if (unionRect == b) {
                    keep.rotated = candidates[j].rotated;
                } else if (unionRect != a) {
                    // Grown beyond both inputs: no single skew applies any more
                    keep.rotated = cv::RotatedRect(
                        cv::Point2f(unionRect.x + unionRect.width / 2.0f,
                                    unionRect.y + unionRect.height / 2.0f),
                        cv::Size2f(static_cast<float>(unionRect.width),
                                   static_cast<float>(unionRect.height)),
                        0.0f);
                }
                keep.rect = unionRect;
                candidates.erase(candidates.begin() + j);
                merged = true;
                break;
            }
        }
    }
    return candidates;
}

PassportImageRegion DocumentSegmenter::cropRegion(const cv::Mat& page, const Candidate& candidate) const {
    PassportImageRegion region;
    region.boundingBox = candidate.rect;

    // minAreaRect angles come back in [0, 90); fold to a signed skew
    float skew = candidate.rotated.angle;
    if (skew > 45.0f) skew -= 90.0f;
    if (skew < -45.0f) skew += 90.0f;
    region.rotationHint = skew;

    if (std::fabs(skew) >= config_.deskewMinAngle) {
        cv::Point2f vertices[4];
        candidate.rotated.points(vertices);
        region.image = Geometry::getRotateCropImage(page, std::vector<cv::Point2f>(vertices, vertices + 4));
    }
    if (region.image.empty() && candidate.rect.area() > 0) {
        region.image = page(candidate.rect).clone();
    }
    return region;
}

} // namespace passport
