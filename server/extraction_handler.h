#pragma once

#include "json_response.h"
#include "pipeline/passport_pipeline.h"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace passport_server {

/**
 * @brief One uploaded page
 */
struct UploadedFile {
    std::string name;
    std::string data;     // Base64, optionally with a data URL prefix
};

/**
 * @brief Batch extraction request parameters
 */
struct ExtractionRequest {
    std::vector<UploadedFile> files;
    double rotation = 0.0;          // degrees, applied to every page

    /**
     * @brief Parse request parameters from JSON
     */
    static ExtractionRequest FromJson(const json& j);

    /**
     * @brief Validate request parameters
     */
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Batch extraction request handler
 */
class ExtractionHandler {
public:
    /**
     * @param pipeline shared, already initialised pipeline
     * @param max_files upper bound on files per request
     */
    ExtractionHandler(std::shared_ptr<passport::PassportPipeline> pipeline, size_t max_files = 50);

    /**
     * @brief Handle an extraction request
     * @param request request parameters
     * @param response_json output JSON envelope
     * @return HTTP status code
     */
    int HandleRequest(const ExtractionRequest& request, json& response_json);

private:
    std::shared_ptr<passport::PassportPipeline> pipeline_;
    size_t max_files_;
};

} // namespace passport_server
