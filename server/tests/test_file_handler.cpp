/**
 * @file test_file_handler.cpp
 * @brief Base64 payload decoding
 */

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include "file_handler.h"

using namespace passport_server;

// A valid 1x1 PNG
const std::string VALID_PNG_BASE64 =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mP8z8DwHwAFBQIAX8jx0gAAAABJRU5ErkJggg==";

// ==================== DecodeBase64Data ====================

/**
 * @brief Plain payload decodes to a readable image
 */
TEST(FileHandler, DecodeBase64Data_ValidPNG) {
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(FileHandler::DecodeBase64Data(VALID_PNG_BASE64, bytes));
    ASSERT_GE(bytes.size(), 8u);
    EXPECT_EQ(bytes[0], 0x89);
    EXPECT_EQ(bytes[1], 'P');

    cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);
    EXPECT_EQ(image.cols, 1);
    EXPECT_EQ(image.rows, 1);
}

TEST(FileHandler, DecodeBase64Data_WithPrefix) {
    std::vector<uint8_t> plain;
    std::vector<uint8_t> prefixed;
    ASSERT_TRUE(FileHandler::DecodeBase64Data(VALID_PNG_BASE64, plain));
    ASSERT_TRUE(FileHandler::DecodeBase64Data("data:image/png;base64," + VALID_PNG_BASE64, prefixed));
    EXPECT_EQ(plain, prefixed);
}

/**
 * @brief Line breaks from mail clients or wrapped JSON are ignored
 */
TEST(FileHandler, DecodeBase64Data_WithNewlines) {
    std::string wrapped = VALID_PNG_BASE64.substr(0, 40) + "\n" +
                          VALID_PNG_BASE64.substr(40, 40) + "\r\n" + VALID_PNG_BASE64.substr(80);
    std::vector<uint8_t> bytes;
    EXPECT_TRUE(FileHandler::DecodeBase64Data(wrapped, bytes));
    EXPECT_FALSE(cv::imdecode(bytes, cv::IMREAD_COLOR).empty());
}

TEST(FileHandler, DecodeBase64Data_Empty) {
    std::vector<uint8_t> bytes = {1, 2, 3};
    EXPECT_FALSE(FileHandler::DecodeBase64Data("", bytes));
    EXPECT_TRUE(bytes.empty());
    EXPECT_FALSE(FileHandler::DecodeBase64Data("data:image/png;base64,", bytes));
    EXPECT_FALSE(FileHandler::DecodeBase64Data("  \n ", bytes));
}

TEST(FileHandler, DecodeBase64Data_Invalid) {
    std::vector<uint8_t> bytes;
    EXPECT_FALSE(FileHandler::DecodeBase64Data("not_valid_base64!!!", bytes));
    EXPECT_FALSE(FileHandler::DecodeBase64Data("@@@@", bytes));
    EXPECT_TRUE(bytes.empty());
}

// ==================== EncodeBase64 ====================

TEST(FileHandler, EncodeBase64_Known) {
    std::vector<uint8_t> hello = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(FileHandler::EncodeBase64(hello), "aGVsbG8=");
    EXPECT_EQ(FileHandler::EncodeBase64({}), "");
}

TEST(FileHandler, EncodeThenDecode) {
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(FileHandler::DecodeBase64Data(VALID_PNG_BASE64, bytes));
    EXPECT_EQ(FileHandler::EncodeBase64(bytes), VALID_PNG_BASE64);
}

TEST(FileHandler, StripDataUrlPrefix) {
    EXPECT_EQ(FileHandler::StripDataUrlPrefix("data:application/vnd.ms-excel;base64,UEsDBA=="), "UEsDBA==");
    EXPECT_EQ(FileHandler::StripDataUrlPrefix("UEsDBA=="), "UEsDBA==");
    EXPECT_EQ(FileHandler::StripDataUrlPrefix("data:broken"), "data:broken");
}
