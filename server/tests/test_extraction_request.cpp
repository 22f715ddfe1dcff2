/**
 * @file test_extraction_request.cpp
 * @brief Extraction request parsing, validation and handling
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include "extraction_handler.h"
#include "file_handler.h"
#include "fakes/fake_ocr_engine.h"

using json = nlohmann::json;
using namespace passport_server;

namespace {

const std::string kLine1 = "P<UTOERIKSSON<<ANNA<MARIA<<<<<<<<<<<<<<<<<<<";
const std::string kLine2 = "L898902C36UTO7408122F1204159ZE184226B<<<<<10";

std::string BlankPageBase64(int width) {
    cv::Mat page(480, width, CV_8UC3, cv::Scalar(255, 255, 255));
    std::vector<uint8_t> png;
    cv::imencode(".png", page, png);
    return FileHandler::EncodeBase64(png);
}

std::shared_ptr<passport::PassportPipeline> FakePipeline() {
    auto engine = std::make_shared<passport::testing::FakeOcrEngine>();
    passport::testing::FakeOcrEngine::Script script;
    script.lines = passport::testing::FakeOcrEngine::Lines({kLine1, kLine2});
    engine->setScript(640, script);

    passport::PipelineConfig config;
    config.numWorkers = 2;
    return std::make_shared<passport::PassportPipeline>(config, engine);
}

} // namespace

// ==================== FromJson ====================

/**
 * @brief Files given as objects or bare strings
 */
TEST(ExtractionRequest, FromJson_Files) {
    json j = {
        {"files", json::array({
            json{{"name", "front.jpg"}, {"data", "AAAA"}},
            "BBBB",
        })},
        {"rotation", 90},
    };
    ExtractionRequest req = ExtractionRequest::FromJson(j);
    ASSERT_EQ(req.files.size(), 2u);
    EXPECT_EQ(req.files[0].name, "front.jpg");
    EXPECT_EQ(req.files[0].data, "AAAA");
    EXPECT_EQ(req.files[1].name, "file_1");
    EXPECT_EQ(req.files[1].data, "BBBB");
    EXPECT_DOUBLE_EQ(req.rotation, 90.0);
}

TEST(ExtractionRequest, FromJson_Defaults) {
    ExtractionRequest req = ExtractionRequest::FromJson(json::object());
    EXPECT_TRUE(req.files.empty());
    EXPECT_DOUBLE_EQ(req.rotation, 0.0);
}

// ==================== Validate ====================

TEST(ExtractionRequest, Validate) {
    std::string error;
    ExtractionRequest req;
    EXPECT_FALSE(req.Validate(error));
    EXPECT_NE(error.find("files"), std::string::npos);

    req.files.push_back({"a.png", ""});
    EXPECT_FALSE(req.Validate(error));
    EXPECT_NE(error.find("a.png"), std::string::npos);

    req.files[0].data = "AAAA";
    EXPECT_TRUE(req.Validate(error));

    req.rotation = 400.0;
    EXPECT_FALSE(req.Validate(error));
    req.rotation = -360.0;
    EXPECT_TRUE(req.Validate(error));
}

// ==================== HandleRequest ====================

TEST(ExtractionHandler, InvalidRequestIs400) {
    ExtractionHandler handler(FakePipeline());
    json response;
    EXPECT_EQ(handler.HandleRequest(ExtractionRequest(), response), 400);
    EXPECT_EQ(response["errorCode"], ErrorCode::INVALID_PARAMETER);
}

TEST(ExtractionHandler, TooManyFilesIs400) {
    ExtractionHandler handler(FakePipeline(), 1);
    ExtractionRequest req;
    req.files = {{"a", "AAAA"}, {"b", "AAAA"}};
    json response;
    EXPECT_EQ(handler.HandleRequest(req, response), 400);
}

TEST(ExtractionHandler, NoPipelineIs503) {
    ExtractionHandler handler(nullptr);
    ExtractionRequest req;
    req.files = {{"a", "AAAA"}};
    json response;
    EXPECT_EQ(handler.HandleRequest(req, response), 503);
    EXPECT_EQ(response["errorCode"], ErrorCode::SERVICE_UNAVAILABLE);
}

/**
 * @brief A good page and a broken payload: the batch succeeds, the broken page is reported
 */
TEST(ExtractionHandler, ProcessesBatch) {
    ExtractionHandler handler(FakePipeline());
    ExtractionRequest req;
    req.files = {{"scan.png", "data:image/png;base64," + BlankPageBase64(640)},
                 {"broken.png", "%%% not base64 %%%"}};

    json response;
    ASSERT_EQ(handler.HandleRequest(req, response), 200);
    EXPECT_EQ(response["errorCode"], ErrorCode::SUCCESS);

    const json& result = response["result"];
    EXPECT_EQ(result["success"], true);
    ASSERT_EQ(result["passports"].size(), 1u);
    EXPECT_EQ(result["passports"][0]["passport_number"], "L898902C3");
    EXPECT_EQ(result["passports"][0]["last_name"], "ERIKSSON");
    EXPECT_FALSE(result["passports"][0]["thumbnail"].get<std::string>().empty());

    ASSERT_EQ(result["pages"].size(), 2u);
    EXPECT_EQ(result["pages"][1]["fileName"], "broken.png");
    EXPECT_EQ(result["pages"][1]["success"], false);
    EXPECT_EQ(result["pages"][1]["errors"][0]["kind"], "UnsupportedImageFormat");
}
