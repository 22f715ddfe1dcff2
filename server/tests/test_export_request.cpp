/**
 * @file test_export_request.cpp
 * @brief Export request parsing, validation and handling
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "export_handler.h"
#include "file_handler.h"
#include "export/workbook_reader.h"

using json = nlohmann::json;
using namespace passport_server;

namespace {

json PassportJson(const std::string& last, const std::string& number, const std::string& gender) {
    return json{{"first_name", "Anna"}, {"last_name", last}, {"passport_number", number},
                {"gender", gender}, {"nationality", "UTO"}, {"date_of_birth", "12/08/1974"}};
}

} // namespace

// ==================== FromJson / Validate ====================

TEST(ExportRequest, FromJson) {
    json j = {
        {"passports", json::array({PassportJson("ERIKSSON", "L898902C3", "F")})},
        {"template", "UEsDBA=="},
        {"templateFilename", "guests.xlsx"},
        {"genderStyle", "thai"},
    };
    ExportRequest req = ExportRequest::FromJson(j);
    ASSERT_EQ(req.passports.size(), 1u);
    EXPECT_EQ(req.passports[0].lastName, "ERIKSSON");
    EXPECT_EQ(req.templateData, "UEsDBA==");
    EXPECT_EQ(req.templateFilename, "guests.xlsx");
    EXPECT_EQ(req.genderStyle, "thai");
}

TEST(ExportRequest, Validate) {
    std::string error;
    ExportRequest req;
    EXPECT_FALSE(req.Validate(error));

    req.passports.push_back(passport::PassportRecord());
    EXPECT_TRUE(req.Validate(error));

    req.genderStyle = "emoji";
    EXPECT_FALSE(req.Validate(error));
    EXPECT_NE(error.find("genderStyle"), std::string::npos);
}

// ==================== HandleRequest ====================

/**
 * @brief No template: a fresh workbook with the records
 */
TEST(ExportHandler, FreshWorkbook) {
    ExportRequest req = ExportRequest::FromJson(json{
        {"passports", json::array({PassportJson("eriksson", "L898902C3", "F"),
                                   PassportJson("novak", "XK4037297", "M")})},
        {"genderStyle", "thai"}});

    ExportHandler handler;
    passport::ExportResult result;
    json error;
    ASSERT_EQ(handler.HandleRequest(req, result, error), 200);
    EXPECT_EQ(result.appendedRows, 2);
    EXPECT_EQ(result.filename.rfind("passport_data_", 0), 0u);

    auto rows = passport::WorkbookReader::readFirstSheet(result.workbook);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1][2], "ERIKSSON");
    EXPECT_EQ(rows[1][3], "หญิง");
    EXPECT_EQ(rows[2][4], "XK4037297");
}

/**
 * @brief A previous export sent back as the template is updated, not duplicated
 */
TEST(ExportHandler, TemplateRoundTrip) {
    ExportHandler handler;
    json error;

    ExportRequest first = ExportRequest::FromJson(json{
        {"passports", json::array({PassportJson("ERIKSSON", "L898902C3", "F")})}});
    passport::ExportResult firstResult;
    ASSERT_EQ(handler.HandleRequest(first, firstResult, error), 200);

    ExportRequest second = first;
    second.templateData = FileHandler::EncodeBase64(firstResult.workbook);
    second.templateFilename = "guests.xlsx";
    passport::ExportResult secondResult;
    ASSERT_EQ(handler.HandleRequest(second, secondResult, error), 200);
    EXPECT_EQ(secondResult.updatedRows, 1);
    EXPECT_EQ(secondResult.appendedRows, 0);
    EXPECT_EQ(secondResult.filename.rfind("guests_", 0), 0u);
}

TEST(ExportHandler, UnreadableTemplateIs400) {
    ExportHandler handler;
    ExportRequest req = ExportRequest::FromJson(json{
        {"passports", json::array({PassportJson("ERIKSSON", "L898902C3", "F")})}});
    passport::ExportResult result;
    json error;

    req.templateData = FileHandler::EncodeBase64({'n', 'o', 't', ' ', 'z', 'i', 'p'});
    EXPECT_EQ(handler.HandleRequest(req, result, error), 400);
    EXPECT_EQ(error["errorCode"], ErrorCode::INVALID_PARAMETER);
    EXPECT_FALSE(error["errorMsg"].get<std::string>().empty());

    req.templateData = "!!! not base64 !!!";
    EXPECT_EQ(handler.HandleRequest(req, result, error), 400);
    EXPECT_TRUE(result.workbook.empty());
}

TEST(ExportHandler, InvalidRequestIs400) {
    ExportHandler handler;
    passport::ExportResult result;
    json error;
    EXPECT_EQ(handler.HandleRequest(ExportRequest(), result, error), 400);
}
