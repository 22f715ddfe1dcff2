/**
 * @file test_passport_pipeline.cpp
 * @brief End-to-end batch processing against a scripted OCR backend
 */

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "pipeline/passport_pipeline.h"
#include "fakes/fake_ocr_engine.h"
#include "../mrz/mrz_test_utils.h"

#include <algorithm>

using namespace passport;
using namespace passport::testing;

namespace {

// Blank pages fall back to one full-page region, so the region width equals the page width
PageInput BlankPage(int width, int height = 480, const std::string& name = "") {
    cv::Mat page(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
    PageInput input;
    input.name = name.empty() ? "page_" + std::to_string(width) + ".png" : name;
    cv::imencode(".png", page, input.bytes);
    return input;
}

FakeOcrEngine::Script MrzScript(const std::string& number, int delayMs = 0) {
    FakeOcrEngine::Script script;
    script.lines = FakeOcrEngine::Lines({
        "REPUBLIC OF UTOPIA", kSpecimenLine1,
        MakeLine2(number, "UTO", "740812", "F", "300415")});
    script.delayMs = delayMs;
    return script;
}

PipelineConfig TestConfig(size_t workers = 2) {
    PipelineConfig config;
    config.numWorkers = workers;
    config.documentTimeoutMs = 5000;
    return config;
}

bool HasIssue(const PageResult& page, ErrorKind kind) {
    return std::any_of(page.issues.begin(), page.issues.end(),
                       [kind](const PipelineIssue& issue) { return issue.kind == kind; });
}

} // namespace

// ==================== Happy path ====================

/**
 * @brief One page, one passport, every field trusted
 */
TEST(PassportPipeline, SinglePassport) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(640, MrzScript("L898902C3"));
    PassportPipeline pipeline(TestConfig(), engine);
    ASSERT_TRUE(pipeline.initialize());

    BatchResult result = pipeline.processBatch({BlankPage(640)});

    ASSERT_EQ(result.pages.size(), 1u);
    const PageResult& page = result.pages[0];
    EXPECT_TRUE(page.success);
    EXPECT_EQ(page.sourceName, "page_640.png");
    ASSERT_EQ(page.records.size(), 1u);
    const PassportRecord& record = page.records[0];
    EXPECT_TRUE(record.mrzFound);
    EXPECT_EQ(record.passportNumber, "L898902C3");
    EXPECT_EQ(record.lastName, "ERIKSSON");
    EXPECT_EQ(record.dateOfBirth, "12/08/1974");
    EXPECT_FLOAT_EQ(record.confidence, 1.0f);
    EXPECT_FALSE(record.thumbnailJpeg.empty());

    EXPECT_TRUE(HasIssue(page, ErrorKind::SegmentationEmpty));
    EXPECT_FALSE(HasIssue(page, ErrorKind::ChecksumMismatch));
    EXPECT_EQ(result.stats.pages, 1);
    EXPECT_EQ(result.stats.mrzFound, 1);
    EXPECT_EQ(result.recordCount(), 1u);
}

/**
 * @brief Regions finishing out of order are still returned in input order
 */
TEST(PassportPipeline, ResultsFollowInputOrder) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(600, MrzScript("AA1111111", 300));
    engine->setScript(700, MrzScript("BB2222222", 0));
    engine->setScript(800, MrzScript("CC3333333", 150));
    PassportPipeline pipeline(TestConfig(3), engine);

    BatchResult result = pipeline.processBatch({BlankPage(600), BlankPage(700), BlankPage(800)});

    ASSERT_EQ(result.pages.size(), 3u);
    const char* expected[] = {"AA1111111", "BB2222222", "CC3333333"};
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(result.pages[i].pageIndex, static_cast<int>(i));
        ASSERT_EQ(result.pages[i].records.size(), 1u);
        EXPECT_EQ(result.pages[i].records[0].passportNumber, expected[i]);
        EXPECT_EQ(result.pages[i].records[0].sourcePage, static_cast<int>(i));
    }
    EXPECT_EQ(engine->calls(), 3);
}

/**
 * @brief Two passports on one page: two records in reading order
 */
TEST(PassportPipeline, TwoPassportsOnOnePage) {
    cv::Mat page(1000, 1600, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Rect(100, 200, 568, 400), cv::Scalar(60, 60, 60), cv::FILLED);
    cv::rectangle(page, cv::Rect(900, 200, 568, 400), cv::Scalar(60, 60, 60), cv::FILLED);
    PageInput input;
    input.name = "scan.png";
    cv::imencode(".png", page, input.bytes);

    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setDefault(MrzScript("L898902C3"));
    PassportPipeline pipeline(TestConfig(), engine);

    BatchResult result = pipeline.processBatch({input});
    ASSERT_EQ(result.pages.size(), 1u);
    ASSERT_EQ(result.pages[0].records.size(), 2u);
    EXPECT_EQ(result.pages[0].records[0].regionIndex, 0);
    EXPECT_EQ(result.pages[0].records[1].regionIndex, 1);
    EXPECT_FALSE(HasIssue(result.pages[0], ErrorKind::SegmentationEmpty));
    EXPECT_EQ(result.stats.regions, 2);
}

/**
 * @brief The batch rotation is applied before segmentation
 */
TEST(PassportPipeline, RotationAppliedToEveryPage) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(480, MrzScript("L898902C3"));
    PassportPipeline pipeline(TestConfig(), engine);

    BatchResult result = pipeline.processBatch({BlankPage(640, 480)}, 90.0);
    ASSERT_EQ(result.pages[0].records.size(), 1u);
    EXPECT_TRUE(result.pages[0].records[0].mrzFound);
}

// ==================== Failures ====================

/**
 * @brief A region past the deadline becomes a placeholder, the rest of the batch completes
 */
TEST(PassportPipeline, TimeoutGivesPlaceholder) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(640, MrzScript("L898902C3", 1000));
    engine->setScript(700, MrzScript("XK4037297"));
    PipelineConfig config = TestConfig();
    config.documentTimeoutMs = 100;
    PassportPipeline pipeline(config, engine);

    BatchResult result = pipeline.processBatch({BlankPage(640), BlankPage(700)});

    ASSERT_EQ(result.pages.size(), 2u);
    ASSERT_EQ(result.pages[0].records.size(), 1u);
    EXPECT_FALSE(result.pages[0].records[0].mrzFound);
    EXPECT_TRUE(result.pages[0].records[0].passportNumber.empty());
    EXPECT_TRUE(HasIssue(result.pages[0], ErrorKind::DocumentTimeout));

    ASSERT_EQ(result.pages[1].records.size(), 1u);
    EXPECT_EQ(result.pages[1].records[0].passportNumber, "XK4037297");
    EXPECT_EQ(result.stats.timeouts, 1);
    EXPECT_EQ(result.stats.placeholders, 1);
}

/**
 * @brief A region waiting behind a slow one is timed from when it starts
 */
TEST(PassportPipeline, QueuedRegionGetsFullTimeout) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(640, MrzScript("L898902C3", 600));
    engine->setScript(700, MrzScript("XK4037297", 300));
    PipelineConfig config = TestConfig(1);
    config.documentTimeoutMs = 400;
    PassportPipeline pipeline(config, engine);

    BatchResult result = pipeline.processBatch({BlankPage(640), BlankPage(700)});

    ASSERT_EQ(result.pages.size(), 2u);
    EXPECT_TRUE(HasIssue(result.pages[0], ErrorKind::DocumentTimeout));
    ASSERT_EQ(result.pages[1].records.size(), 1u);
    EXPECT_FALSE(HasIssue(result.pages[1], ErrorKind::DocumentTimeout));
    EXPECT_EQ(result.pages[1].records[0].passportNumber, "XK4037297");
    EXPECT_EQ(result.stats.timeouts, 1);
}

TEST(PassportPipeline, OcrFailureGivesPlaceholder) {
    auto engine = std::make_shared<FakeOcrEngine>();
    FakeOcrEngine::Script failing;
    failing.fail = true;
    engine->setScript(640, failing);
    PassportPipeline pipeline(TestConfig(), engine);

    BatchResult result = pipeline.processBatch({BlankPage(640)});
    const PageResult& page = result.pages[0];
    EXPECT_TRUE(page.success);
    ASSERT_EQ(page.records.size(), 1u);
    EXPECT_FALSE(page.records[0].mrzFound);
    EXPECT_EQ(page.records[0].lowConfidenceFields.size(), kRecordFields.size());
    EXPECT_TRUE(HasIssue(page, ErrorKind::OcrFailure));
}

/**
 * @brief PDF bytes fail their page only
 */
TEST(PassportPipeline, UnsupportedFormatSkipsPage) {
    auto engine = std::make_shared<FakeOcrEngine>();
    engine->setScript(640, MrzScript("L898902C3"));
    PassportPipeline pipeline(TestConfig(), engine);

    PageInput pdf;
    pdf.name = "scan.pdf";
    const std::string header = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    pdf.bytes.assign(header.begin(), header.end());

    BatchResult result = pipeline.processBatch({pdf, BlankPage(640)});

    ASSERT_EQ(result.pages.size(), 2u);
    EXPECT_FALSE(result.pages[0].success);
    EXPECT_TRUE(result.pages[0].records.empty());
    ASSERT_TRUE(HasIssue(result.pages[0], ErrorKind::UnsupportedImageFormat));
    EXPECT_NE(result.pages[0].issues[0].message.find("pdf"), std::string::npos);

    EXPECT_TRUE(result.pages[1].success);
    EXPECT_EQ(result.pages[1].records.size(), 1u);
    EXPECT_EQ(result.stats.failedPages, 1);
}

TEST(PassportPipeline, MrzNotFoundGivesPlaceholder) {
    auto engine = std::make_shared<FakeOcrEngine>();
    FakeOcrEngine::Script script;
    script.lines = FakeOcrEngine::Lines({"VISA", "ENTRY 12 AUG 2019"});
    engine->setScript(640, script);
    PassportPipeline pipeline(TestConfig(), engine);

    BatchResult result = pipeline.processBatch({BlankPage(640)});
    ASSERT_EQ(result.pages[0].records.size(), 1u);
    EXPECT_FALSE(result.pages[0].records[0].mrzFound);
    EXPECT_TRUE(HasIssue(result.pages[0], ErrorKind::MrzNotFound));
    EXPECT_EQ(result.stats.placeholders, 1);
}

/**
 * @brief A failed check digit is reported and the value kept
 */
TEST(PassportPipeline, ChecksumMismatchReported) {
    std::string line2 = kSpecimenLine2;
    line2[18] = '3';
    auto engine = std::make_shared<FakeOcrEngine>();
    FakeOcrEngine::Script script;
    script.lines = FakeOcrEngine::Lines({kSpecimenLine1, line2});
    engine->setScript(640, script);
    PassportPipeline pipeline(TestConfig(), engine);

    BatchResult result = pipeline.processBatch({BlankPage(640)});
    const PageResult& page = result.pages[0];
    ASSERT_EQ(page.records.size(), 1u);
    EXPECT_TRUE(page.records[0].mrzFound);
    EXPECT_EQ(page.records[0].dateOfBirth, "13/08/1974");
    EXPECT_TRUE(page.records[0].isLowConfidence(field::kDateOfBirth));
    EXPECT_TRUE(HasIssue(page, ErrorKind::ChecksumMismatch));
}

TEST(PassportPipeline, EmptyBatch) {
    PassportPipeline pipeline(TestConfig(), std::make_shared<FakeOcrEngine>());
    BatchResult result = pipeline.processBatch({});
    EXPECT_TRUE(result.pages.empty());
    EXPECT_EQ(result.recordCount(), 0u);
}

TEST(PassportPipeline, NoEngineFailsInitialize) {
    PassportPipeline pipeline(TestConfig(), nullptr);
    EXPECT_FALSE(pipeline.initialize());
}

// ==================== Printed-zone fallback ====================

TEST(PassportPipeline, TextFallbackFillsPlaceholder) {
    auto engine = std::make_shared<FakeOcrEngine>();
    FakeOcrEngine::Script script;
    script.lines = FakeOcrEngine::Lines({"Surname", "ERIKSSON", "Passport No.", "L898902C3"});
    engine->setScript(640, script);

    PipelineConfig config = TestConfig();
    config.enableTextFallback = true;
    PassportPipeline withFallback(config, engine);
    PassportRecord record = withFallback.processBatch({BlankPage(640)}).pages[0].records[0];
    EXPECT_FALSE(record.mrzFound);
    EXPECT_EQ(record.lastName, "ERIKSSON");
    EXPECT_EQ(record.passportNumber, "L898902C3");
    EXPECT_TRUE(record.isLowConfidence(field::kLastName));

    PassportPipeline withoutFallback(TestConfig(), engine);
    record = withoutFallback.processBatch({BlankPage(640)}).pages[0].records[0];
    EXPECT_TRUE(record.lastName.empty());
}
