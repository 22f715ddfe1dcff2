#include "export_handler.h"
#include "file_handler.h"
#include "server_config.h"
#include "common/errors.h"
#include "common/logger.hpp"

#include <stdexcept>

namespace passport_server {

// ==================== ExportRequest ====================

ExportRequest ExportRequest::FromJson(const json& j) {
    ExportRequest req;

    if (j.contains("passports") && j["passports"].is_array()) {
        for (const auto& item : j["passports"]) {
            req.passports.push_back(JsonResponseBuilder::ParseRecord(item));
        }
    }
    if (j.contains("template") && j["template"].is_string()) {
        req.templateData = j["template"].get<std::string>();
    }
    if (j.contains("templateFilename") && j["templateFilename"].is_string()) {
        req.templateFilename = j["templateFilename"].get<std::string>();
    }
    if (j.contains("genderStyle") && j["genderStyle"].is_string()) {
        req.genderStyle = j["genderStyle"].get<std::string>();
    }
    return req;
}

bool ExportRequest::Validate(std::string& error_msg) const {
    if (passports.empty()) {
        error_msg = "Missing required parameter: 'passports'";
        return false;
    }
    if (!genderStyle.empty() && genderStyle != "letter" && genderStyle != "thai") {
        error_msg = "genderStyle must be 'letter' or 'thai'";
        return false;
    }
    return true;
}

// ==================== ExportHandler ====================

ExportHandler::ExportHandler(const passport::ExportOptions& defaults)
    : defaults_(defaults) {
    LOG_INFO("ExportHandler initialized");
}

int ExportHandler::HandleRequest(const ExportRequest& request, passport::ExportResult& result,
                                 json& error_json) {
    try {
        std::string error_msg;
        if (!request.Validate(error_msg)) {
            LOG_WARN("Invalid export request: {}", error_msg);
            error_json = JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, error_msg);
            return 400;
        }

        passport::ExportOptions options = defaults_;
        if (!request.genderStyle.empty()) {
            options.genderStyle = ParseGenderStyle(request.genderStyle);
        }

        std::vector<uint8_t> templateBytes;
        if (!request.templateData.empty() &&
            !FileHandler::DecodeBase64Data(request.templateData, templateBytes)) {
            throw passport::TemplateUnreadableError("template is not valid Base64");
        }

        passport::ExportMerger merger(options);
        result = merger.merge(request.passports, templateBytes, request.templateFilename);
        return 200;

    } catch (const passport::TemplateUnreadableError& e) {
        LOG_WARN("{}: {}", passport::ToString(passport::ErrorKind::TemplateUnreadable), e.what());
        error_json = JsonResponseBuilder::BuildErrorResponse(ErrorCode::INVALID_PARAMETER, e.what());
        return 400;

    } catch (const json::exception& e) {
        LOG_ERROR("JSON error: {}", e.what());
        error_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON: ") + e.what());
        return 400;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception in export: {}", e.what());
        error_json = JsonResponseBuilder::BuildErrorResponse(
            ErrorCode::INTERNAL_ERROR, std::string("Internal error: ") + e.what());
        return 500;
    }
}

} // namespace passport_server
