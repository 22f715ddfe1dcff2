#include "extraction_handler.h"
#include "file_handler.h"
#include "common/logger.hpp"

#include <cmath>

namespace passport_server {

// ==================== ExtractionRequest ====================

ExtractionRequest ExtractionRequest::FromJson(const json& j) {
    ExtractionRequest req;

    if (j.contains("files") && j["files"].is_array()) {
        int index = 0;
        for (const auto& item : j["files"]) {
            UploadedFile file;
            if (item.is_string()) {
                file.data = item.get<std::string>();
            } else {
                if (item.contains("name")) file.name = item["name"].get<std::string>();
                if (item.contains("data")) file.data = item["data"].get<std::string>();
            }
            if (file.name.empty()) {
                file.name = "file_" + std::to_string(index);
            }
            req.files.push_back(std::move(file));
            ++index;
        }
    }
    if (j.contains("rotation") && !j["rotation"].is_null()) {
        req.rotation = j["rotation"].get<double>();
    }
    return req;
}

bool ExtractionRequest::Validate(std::string& error_msg) const {
    if (files.empty()) {
        error_msg = "Missing required parameter: 'files'";
        return false;
    }
    for (const auto& file : files) {
        if (file.data.empty()) {
            error_msg = "File '" + file.name + "' has no data";
            return false;
        }
    }
    if (!std::isfinite(rotation) || rotation < -360.0 || rotation > 360.0) {
        error_msg = "rotation must be in range [-360, 360]";
        return false;
    }
    return true;
}

// ==================== ExtractionHandler ====================

ExtractionHandler::ExtractionHandler(std::shared_ptr<passport::PassportPipeline> pipeline, size_t max_files)
    : pipeline_(std::move(pipeline)), max_files_(max_files) {
    LOG_INFO("ExtractionHandler initialized (max {} files per request)", max_files_);
}

int ExtractionHandler::HandleRequest(const ExtractionRequest& request, json& response_json) {
    try {
        std::string error_msg;
        if (!request.Validate(error_msg)) {
            LOG_WARN("Invalid request: {}", error_msg);
            response_json = JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, error_msg);
            return 400;
        }
        if (request.files.size() > max_files_) {
            response_json = JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER,
                "Too many files: " + std::to_string(request.files.size()) +
                " (max " + std::to_string(max_files_) + ")");
            return 400;
        }
        if (!pipeline_) {
            response_json = JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::SERVICE_UNAVAILABLE, "OCR pipeline not available");
            return 503;
        }

        // A payload that is not Base64 stays in the batch as an empty page,
        // so it is reported per page like any other unreadable file
        std::vector<passport::PageInput> pages;
        pages.reserve(request.files.size());
        for (const auto& file : request.files) {
            passport::PageInput page;
            page.name = file.name;
            if (!FileHandler::DecodeBase64Data(file.data, page.bytes)) {
                LOG_WARN("File '{}' is not valid Base64", file.name);
            }
            pages.push_back(std::move(page));
        }

        LOG_INFO("Extracting {} page(s), rotation={}", pages.size(), request.rotation);
        passport::BatchResult batch = pipeline_->processBatch(pages, request.rotation);

        response_json = JsonResponseBuilder::BuildSuccessResponse(
            JsonResponseBuilder::BuildExtractionResult(batch));
        return 200;

    } catch (const json::exception& e) {
        LOG_ERROR("JSON error: {}", e.what());
        response_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON: ") + e.what());
        return 400;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception in HandleRequest: {}", e.what());
        response_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        return 500;
    }
}

} // namespace passport_server
