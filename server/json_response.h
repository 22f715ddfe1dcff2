#pragma once

#include "common/errors.h"
#include "common/types.hpp"
#include "pipeline/passport_pipeline.h"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace passport_server {

/**
 * @brief JSON response builder
 */
class JsonResponseBuilder {
public:
    /**
     * @brief UUID used as logId
     */
    static std::string GenerateUUID();

    /**
     * @brief Success envelope around a result object
     */
    static json BuildSuccessResponse(const json& result);

    /**
     * @brief Error envelope
     * @param error_code ErrorCode value
     * @param error_msg human-readable message
     */
    static json BuildErrorResponse(int error_code, const std::string& error_msg);

    /**
     * @brief Batch extraction result: per-page records and issues plus a flat record list
     */
    static json BuildExtractionResult(const passport::BatchResult& batch);

    static json ConvertRecordToJson(const passport::PassportRecord& record);
    static json ConvertIssueToJson(const passport::PipelineIssue& issue);
    static json ConvertPageToJson(const passport::PageResult& page);

    /**
     * @brief Record from a (possibly edited) JSON object; unknown keys are ignored
     * @throws json::exception when a known key has the wrong type
     */
    static passport::PassportRecord ParseRecord(const json& j);
};

/**
 * @brief Error codes carried in the envelope
 */
namespace ErrorCode {
    constexpr int SUCCESS = 0;
    constexpr int INVALID_PARAMETER = 400;
    constexpr int UNAUTHORIZED = 401;
    constexpr int INTERNAL_ERROR = 500;
    constexpr int SERVICE_UNAVAILABLE = 503;
    constexpr int TIMEOUT = 504;
}

} // namespace passport_server
