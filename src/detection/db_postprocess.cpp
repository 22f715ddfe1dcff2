#include "detection/db_postprocess.h"
#include "common/geometry.h"
#include "common/logger.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace passport {

namespace {

float polygonArea(const std::vector<cv::Point2f>& box) {
    float area = 0.0f;
    const size_t n = box.size();
    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += box[i].x * box[j].y - box[j].x * box[i].y;
    }
    return std::abs(area) / 2.0f;
}

float polygonLength(const std::vector<cv::Point2f>& box) {
    float length = 0.0f;
    const size_t n = box.size();
    for (size_t i = 0; i < n; ++i) {
        length += Geometry::distance(box[i], box[(i + 1) % n]);
    }
    return length;
}

} // namespace

cv::Rect DetectedBox::boundingRect() const {
    if (points.empty()) {
        return cv::Rect();
    }
    return cv::boundingRect(points);
}

DBPostProcessor::DBPostProcessor(float thresh, float boxThresh, int maxCandidates, float unclipRatio)
    : thresh_(thresh),
      boxThresh_(boxThresh),
      maxCandidates_(maxCandidates),
      unclipRatio_(unclipRatio) {
}

std::vector<DetectedBox> DBPostProcessor::process(const cv::Mat& pred, int srcH, int srcW,
                                                  int paddedH, int paddedW) const {
    std::vector<DetectedBox> boxes;
    if (pred.empty()) {
        return boxes;
    }
    if (paddedH <= 0) paddedH = srcH;
    if (paddedW <= 0) paddedW = srcW;

    cv::Mat bitmap;
    cv::threshold(pred, bitmap, thresh_, 255, cv::THRESH_BINARY);
    bitmap.convertTo(bitmap, CV_8UC1);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

    // Model output space -> padded space; padding sits right/bottom so this is source space too
    const float scaleX = static_cast<float>(paddedW) / pred.cols;
    const float scaleY = static_cast<float>(paddedH) / pred.rows;

    const int count = std::min(static_cast<int>(contours.size()), maxCandidates_);
    for (int i = 0; i < count; ++i) {
        const auto& contour = contours[i];
        float score = boxScoreFast(pred, contour);
        if (score < boxThresh_) {
            continue;
        }

        cv::RotatedRect rect = cv::minAreaRect(contour);
        if (std::min(rect.size.width, rect.size.height) < 3.0f) {
            continue;
        }

        DetectedBox box;
        box.score = score;
        for (const auto& pt : unclip(Geometry::getMinBoxPoints(contour))) {
            box.points.emplace_back(std::clamp(pt.x * scaleX, 0.0f, static_cast<float>(srcW - 1)),
                                    std::clamp(pt.y * scaleY, 0.0f, static_cast<float>(srcH - 1)));
        }
        boxes.push_back(std::move(box));
    }

    LOG_DEBUG("DB postprocess: {} contours, {} boxes (thresh={:.2f}, boxThresh={:.2f})",
              contours.size(), boxes.size(), thresh_, boxThresh_);
    return boxes;
}

float DBPostProcessor::boxScoreFast(const cv::Mat& pred, const std::vector<cv::Point>& contour) const {
    cv::Rect rect = cv::boundingRect(contour) & cv::Rect(0, 0, pred.cols, pred.rows);
    if (rect.area() <= 0) {
        return 0.0f;
    }

    cv::Mat mask = cv::Mat::zeros(rect.size(), CV_8UC1);
    std::vector<cv::Point> local;
    local.reserve(contour.size());
    for (const auto& pt : contour) {
        local.emplace_back(pt.x - rect.x, pt.y - rect.y);
    }
    cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{local}, cv::Scalar(1));
    return static_cast<float>(cv::mean(pred(rect), mask)[0]);
}

std::vector<cv::Point2f> DBPostProcessor::unclip(const std::vector<cv::Point2f>& box) const {
    float length = polygonLength(box);
    if (length <= 0.0f) {
        return box;
    }
    // Offset distance of the DB paper: area * ratio / perimeter
    float distance = polygonArea(box) * unclipRatio_ / length;

    cv::Point2f center(0, 0);
    for (const auto& pt : box) {
        center += pt;
    }
    center.x /= box.size();
    center.y /= box.size();

    std::vector<cv::Point2f> grown;
    grown.reserve(box.size());
    for (const auto& pt : box) {
        cv::Point2f v = pt - center;
        float len = std::sqrt(v.x * v.x + v.y * v.y);
        if (len > 0.0f) {
            v *= (len + distance) / len;
        }
        grown.push_back(center + v);
    }
    return grown;
}

} // namespace passport
