#include "json_response.h"
#include "file_handler.h"
#include "common/logger.hpp"

#include <uuid/uuid.h>

#include <cmath>

namespace passport_server {

namespace {

void readStringList(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    out = j[key].get<std::vector<std::string>>();
}

} // namespace

std::string JsonResponseBuilder::GenerateUUID() {
    uuid_t uuid;
    uuid_generate(uuid);

    char uuid_str[37];
    uuid_unparse(uuid, uuid_str);

    return std::string(uuid_str);
}

json JsonResponseBuilder::BuildSuccessResponse(const json& result) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = ErrorCode::SUCCESS;
    response["errorMsg"] = "Success";
    response["result"] = result;
    return response;
}

json JsonResponseBuilder::BuildErrorResponse(int error_code, const std::string& error_msg) {
    json response;
    response["logId"] = GenerateUUID();
    response["errorCode"] = error_code;
    response["errorMsg"] = error_msg;

    return response;
}

json JsonResponseBuilder::ConvertRecordToJson(const passport::PassportRecord& record) {
    json item;
    for (const char* name : passport::kRecordFields) {
        item[name] = record.value(name);
    }
    item["confidence"] = std::round(record.confidence * 1000.0) / 1000.0;  // 3 decimals
    item["low_confidence_fields"] = record.lowConfidenceFields;
    item["missing_fields"] = record.missingFields;
    item["ambiguous_fields"] = record.ambiguousFields;
    item["corrected_fields"] = record.correctedFields;
    item["thumbnail"] = FileHandler::EncodeBase64(record.thumbnailJpeg);
    item["full_image"] = FileHandler::EncodeBase64(record.fullImageJpeg);
    item["source_page"] = record.sourcePage;
    item["region_index"] = record.regionIndex;
    item["mrz_found"] = record.mrzFound;
    return item;
}

json JsonResponseBuilder::ConvertIssueToJson(const passport::PipelineIssue& issue) {
    json item;
    item["kind"] = passport::ToString(issue.kind);
    item["pageIndex"] = issue.pageIndex;
    item["regionIndex"] = issue.regionIndex;
    item["message"] = issue.message;
    return item;
}

json JsonResponseBuilder::ConvertPageToJson(const passport::PageResult& page) {
    json item;
    item["pageIndex"] = page.pageIndex;
    item["fileName"] = page.sourceName;
    item["success"] = page.success;

    json passports = json::array();
    for (const auto& record : page.records) {
        passports.push_back(ConvertRecordToJson(record));
    }
    item["passports"] = passports;

    json errors = json::array();
    for (const auto& issue : page.issues) {
        errors.push_back(ConvertIssueToJson(issue));
    }
    item["errors"] = errors;
    return item;
}

json JsonResponseBuilder::BuildExtractionResult(const passport::BatchResult& batch) {
    json result;
    json pages = json::array();
    json passports = json::array();
    for (const auto& page : batch.pages) {
        json pageJson = ConvertPageToJson(page);
        for (const auto& record : pageJson["passports"]) {
            passports.push_back(record);
        }
        pages.push_back(std::move(pageJson));
    }

    const size_t count = batch.recordCount();
    result["success"] = count > 0;
    result["message"] = count > 0
        ? "Successfully processed " + std::to_string(count) + " passport(s)"
        : "No passport data could be extracted. Please ensure images are clear and contain valid passports.";
    result["pages"] = pages;
    result["passports"] = passports;
    return result;
}

passport::PassportRecord JsonResponseBuilder::ParseRecord(const json& j) {
    passport::PassportRecord record;
    for (const char* name : passport::kRecordFields) {
        if (j.contains(name) && !j[name].is_null()) {
            record.setValue(name, j[name].get<std::string>());
        }
    }
    readStringList(j, "low_confidence_fields", record.lowConfidenceFields);
    if (j.contains("confidence") && !j["confidence"].is_null()) {
        record.confidence = j["confidence"].get<float>();
    } else {
        record.updateConfidence();
    }
    readStringList(j, "missing_fields", record.missingFields);
    readStringList(j, "ambiguous_fields", record.ambiguousFields);
    readStringList(j, "corrected_fields", record.correctedFields);
    if (j.contains("source_page")) record.sourcePage = j["source_page"].get<int>();
    if (j.contains("region_index")) record.regionIndex = j["region_index"].get<int>();
    if (j.contains("mrz_found")) record.mrzFound = j["mrz_found"].get<bool>();
    return record;
}

} // namespace passport_server
