/**
 * @file test_db_postprocess.cpp
 * @brief Probability map to text boxes
 */

#include <gtest/gtest.h>

#include "detection/db_postprocess.h"

using namespace passport;

namespace {

cv::Mat Map(int rows = 100, int cols = 100) {
    return cv::Mat::zeros(rows, cols, CV_32FC1);
}

} // namespace

/**
 * @brief One confident blob becomes one box scaled back to the source image
 */
TEST(DBPostProcessor, SingleTextLine) {
    cv::Mat pred = Map();
    pred(cv::Rect(20, 40, 60, 10)).setTo(0.9f);

    std::vector<DetectedBox> boxes = DBPostProcessor().process(pred, 200, 200);
    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_NEAR(boxes[0].score, 0.9f, 0.05f);
    ASSERT_EQ(boxes[0].points.size(), 4u);

    cv::Rect r = boxes[0].boundingRect();
    EXPECT_TRUE(r.contains(cv::Point(100, 90)));
    EXPECT_LE(r.x, 40);
    EXPECT_GE(r.x + r.width, 156);
    EXPECT_GE(r.x, 0);
    EXPECT_LE(r.x + r.width, 200);
}

TEST(DBPostProcessor, WeakAndThinBlobsDropped) {
    cv::Mat pred = Map();
    pred(cv::Rect(10, 10, 60, 10)).setTo(0.4f);   // above thresh, below boxThresh
    pred(cv::Rect(10, 70, 60, 2)).setTo(0.9f);    // too thin

    EXPECT_TRUE(DBPostProcessor().process(pred, 100, 100).empty());
}

/**
 * @brief Boxes in the padding are clamped to the source image
 */
TEST(DBPostProcessor, ClampsToSourceWhenPadded) {
    cv::Mat pred = Map();
    pred(cv::Rect(60, 60, 35, 20)).setTo(0.9f);

    std::vector<DetectedBox> boxes = DBPostProcessor().process(pred, 100, 100, 200, 200);
    ASSERT_EQ(boxes.size(), 1u);
    for (const auto& pt : boxes[0].points) {
        EXPECT_LE(pt.x, 99.0f);
        EXPECT_LE(pt.y, 99.0f);
    }
}

TEST(DBPostProcessor, EmptyMap) {
    EXPECT_TRUE(DBPostProcessor().process(cv::Mat(), 100, 100).empty());
    EXPECT_TRUE(DBPostProcessor().process(Map(), 100, 100).empty());
}
