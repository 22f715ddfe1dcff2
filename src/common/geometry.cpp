#include "common/geometry.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace passport {

float Geometry::distance(const cv::Point2f& p1, const cv::Point2f& p2) {
    float dx = p1.x - p2.x;
    float dy = p1.y - p2.y;
    return std::sqrt(dx * dx + dy * dy);
}

std::vector<cv::Point2f> Geometry::orderPointsClockwise(const std::vector<cv::Point2f>& points) {
    if (points.size() != 4) {
        return points;
    }

    std::vector<cv::Point2f> pts = points;
    cv::Point2f center(0, 0);
    for (const auto& pt : pts) {
        center += pt;
    }
    center.x /= 4;
    center.y /= 4;

    // Angle about the centre gives clockwise order in image coordinates
    std::sort(pts.begin(), pts.end(), [&center](const cv::Point2f& a, const cv::Point2f& b) {
        return std::atan2(a.y - center.y, a.x - center.x) <
               std::atan2(b.y - center.y, b.x - center.x);
    });

    int topLeft = 0;
    for (int i = 1; i < 4; ++i) {
        if (pts[i].x + pts[i].y < pts[topLeft].x + pts[topLeft].y) {
            topLeft = i;
        }
    }

    std::vector<cv::Point2f> ordered;
    ordered.reserve(4);
    for (int i = 0; i < 4; ++i) {
        ordered.push_back(pts[(topLeft + i) % 4]);
    }
    return ordered;
}

cv::Mat Geometry::getRotateCropImage(const cv::Mat& image,
                                     const std::vector<cv::Point2f>& box) {
    if (box.size() != 4) {
        return cv::Mat();
    }
    std::vector<cv::Point2f> ordered = orderPointsClockwise(box);
    int width = static_cast<int>(std::max(distance(ordered[0], ordered[1]),
                                          distance(ordered[2], ordered[3])));
    int height = static_cast<int>(std::max(distance(ordered[0], ordered[3]),
                                           distance(ordered[1], ordered[2])));
    if (width < 2 || height < 2) {
        return cv::Mat();
    }

    std::vector<cv::Point2f> dst = {
        cv::Point2f(0, 0),
        cv::Point2f(static_cast<float>(width - 1), 0),
        cv::Point2f(static_cast<float>(width - 1), static_cast<float>(height - 1)),
        cv::Point2f(0, static_cast<float>(height - 1))
    };
    cv::Mat M = cv::getPerspectiveTransform(ordered, dst);
    cv::Mat warped;
    cv::warpPerspective(image, warped, M, cv::Size(width, height),
                        cv::INTER_LINEAR, cv::BORDER_REPLICATE);
    return warped;
}

cv::Mat Geometry::cropTextRegion(const cv::Mat& image,
                                 const std::vector<cv::Point2f>& box,
                                 int dstHeight) {
    if (box.size() != 4) {
        return cv::Mat();
    }
    std::vector<cv::Point2f> ordered = orderPointsClockwise(box);
    float maxWidth = std::max(distance(ordered[0], ordered[1]), distance(ordered[2], ordered[3]));
    float maxHeight = std::max(distance(ordered[0], ordered[3]), distance(ordered[1], ordered[2]));
    if (maxHeight < 1.0f || maxWidth < 1.0f) {
        return cv::Mat();
    }

    int dstWidth = std::max(1, static_cast<int>(maxWidth * dstHeight / maxHeight));
    std::vector<cv::Point2f> dst = {
        cv::Point2f(0, 0),
        cv::Point2f(static_cast<float>(dstWidth - 1), 0),
        cv::Point2f(static_cast<float>(dstWidth - 1), static_cast<float>(dstHeight - 1)),
        cv::Point2f(0, static_cast<float>(dstHeight - 1))
    };
    cv::Mat M = cv::getPerspectiveTransform(ordered, dst);
    cv::Mat warped;
    cv::warpPerspective(image, warped, M, cv::Size(dstWidth, dstHeight));
    return warped;
}

std::vector<cv::Point2f> Geometry::getMinBoxPoints(const std::vector<cv::Point>& points) {
    cv::RotatedRect rect = cv::minAreaRect(points);
    cv::Point2f vertices[4];
    rect.points(vertices);
    return orderPointsClockwise(std::vector<cv::Point2f>(vertices, vertices + 4));
}

float Geometry::calculateIoU(const cv::Rect& rect1, const cv::Rect& rect2) {
    float interArea = static_cast<float>((rect1 & rect2).area());
    float unionArea = static_cast<float>(rect1.area() + rect2.area()) - interArea;
    if (unionArea <= 0.0f) {
        return 0.0f;
    }
    return interArea / unionArea;
}

float Geometry::overlapRatio(const cv::Rect& rect1, const cv::Rect& rect2) {
    float smaller = static_cast<float>(std::min(rect1.area(), rect2.area()));
    if (smaller <= 0.0f) {
        return 0.0f;
    }
    return static_cast<float>((rect1 & rect2).area()) / smaller;
}

} // namespace passport
