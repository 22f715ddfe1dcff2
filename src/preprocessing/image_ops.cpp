#include "preprocessing/image_ops.h"
#include "common/logger.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace passport {

cv::Mat ImageOps::resizeByMaxLen(const cv::Mat& image, int maxSide, double* scale) {
    double ratio = 1.0;
    int longest = std::max(image.rows, image.cols);
    if (maxSide > 0 && longest > maxSide) {
        ratio = static_cast<double>(maxSide) / longest;
    }
    if (scale) *scale = ratio;
    if (ratio == 1.0) {
        return image;
    }

    int w = std::max(1, static_cast<int>(std::lround(image.cols * ratio)));
    int h = std::max(1, static_cast<int>(std::lround(image.rows * ratio)));
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return resized;
}

cv::Mat ImageOps::padToRatio(const cv::Mat& image, float targetRatio, const cv::Scalar& padValue) {
    float ratio = static_cast<float>(image.cols) / image.rows;
    cv::Mat padded;
    if (ratio < targetRatio) {
        int padW = static_cast<int>(image.rows * targetRatio) - image.cols;
        cv::copyMakeBorder(image, padded, 0, 0, 0, padW, cv::BORDER_CONSTANT, padValue);
    } else if (ratio > targetRatio) {
        int padH = static_cast<int>(image.cols / targetRatio) - image.rows;
        cv::copyMakeBorder(image, padded, 0, padH, 0, 0, cv::BORDER_CONSTANT, padValue);
    } else {
        padded = image;
    }
    return padded;
}

cv::Mat ImageOps::toGray(const cv::Mat& image) {
    cv::Mat gray;
    switch (image.channels()) {
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        default: gray = image; break;
    }
    if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

cv::Mat ImageOps::rotate(const cv::Mat& image, double angleDeg) {
    if (image.empty() || std::fabs(angleDeg) < 1e-6) {
        return image;
    }

    cv::Point2f center(image.cols / 2.0f, image.rows / 2.0f);
    cv::Mat M = cv::getRotationMatrix2D(center, angleDeg, 1.0);

    double cosA = std::fabs(M.at<double>(0, 0));
    double sinA = std::fabs(M.at<double>(0, 1));
    int newW = static_cast<int>(image.rows * sinA + image.cols * cosA);
    int newH = static_cast<int>(image.rows * cosA + image.cols * sinA);

    // Shift so the rotated page stays centred on the grown canvas
    M.at<double>(0, 2) += newW / 2.0 - center.x;
    M.at<double>(1, 2) += newH / 2.0 - center.y;

    cv::Mat rotated;
    cv::warpAffine(image, rotated, M, cv::Size(newW, newH), cv::INTER_CUBIC,
                   cv::BORDER_CONSTANT, cv::Scalar(255, 255, 255));
    return rotated;
}

cv::Mat ImageOps::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return cv::Mat();
    }
    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    if (image.empty()) {
        LOG_DEBUG("imdecode failed for {} bytes", bytes.size());
    }
    return image;
}

std::vector<uint8_t> ImageOps::encodeJpeg(const cv::Mat& image, int maxSide, int quality) {
    std::vector<uint8_t> out;
    if (image.empty()) {
        return out;
    }
    cv::Mat resized = resizeByMaxLen(image, maxSide);
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", resized, out, params)) {
        LOG_WARN("JPEG encoding failed for {}x{} image", resized.cols, resized.rows);
        out.clear();
    }
    return out;
}

std::string ImageOps::sniffFormat(const std::vector<uint8_t>& bytes) {
    auto startsWith = [&bytes](const char* magic) {
        size_t n = std::strlen(magic);
        return bytes.size() >= n && std::memcmp(bytes.data(), magic, n) == 0;
    };
    if (startsWith("%PDF")) return "pdf";
    if (startsWith("PK\x03\x04")) return "zip";
    if (startsWith("GIF8")) return "gif";
    return "";
}

} // namespace passport
