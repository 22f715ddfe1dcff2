#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace passport {

/**
 * @brief Image preprocessing and encoding helpers
 */
class ImageOps {
public:
    /**
     * @brief Scale so the longest side is at most maxSide (never upscales)
     * @param scale receives the applied factor when non-null
     */
    static cv::Mat resizeByMaxLen(const cv::Mat& image, int maxSide, double* scale = nullptr);

    /**
     * @brief Pad on the right/bottom up to targetRatio (width / height) with a constant colour
     */
    static cv::Mat padToRatio(const cv::Mat& image, float targetRatio,
                              const cv::Scalar& padValue = cv::Scalar(114, 114, 114));

    /**
     * @brief Single-channel 8-bit copy (BGR, BGRA or gray input)
     */
    static cv::Mat toGray(const cv::Mat& image);

    /**
     * @brief Rotate about the centre by any angle, growing the canvas and filling with white
     * @param angleDeg counter-clockwise degrees; 0 returns the input unchanged
     */
    static cv::Mat rotate(const cv::Mat& image, double angleDeg);

    /**
     * @brief Decode an encoded raster (JPEG, PNG, BMP, TIFF, WebP ...)
     * @return empty Mat when the bytes are not a decodable image
     */
    static cv::Mat decode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Resize to maxSide and JPEG-encode
     * @return encoded bytes, empty on failure
     */
    static std::vector<uint8_t> encodeJpeg(const cv::Mat& image, int maxSide, int quality);

    /**
     * @brief Sniff well-known non-raster containers (PDF, ZIP) for error messages
     * @return short format name, or empty string when unknown
     */
    static std::string sniffFormat(const std::vector<uint8_t>& bytes);
};

} // namespace passport
