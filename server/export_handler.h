#pragma once

#include "json_response.h"
#include "export/export_merger.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace passport_server {

/**
 * @brief Export request parameters
 */
struct ExportRequest {
    std::vector<passport::PassportRecord> passports;
    std::string templateData;        // Base64 .xlsx, empty for a fresh workbook
    std::string templateFilename;
    std::string genderStyle;         // "letter", "thai" or empty for the server default

    /**
     * @brief Parse request parameters from JSON
     */
    static ExportRequest FromJson(const json& j);

    /**
     * @brief Validate request parameters
     */
    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Export request handler
 */
class ExportHandler {
public:
    explicit ExportHandler(const passport::ExportOptions& defaults = passport::ExportOptions());

    /**
     * @brief Handle an export request
     * @param request request parameters
     * @param result workbook and file name on success
     * @param error_json error envelope on failure
     * @return HTTP status code (200 on success)
     */
    int HandleRequest(const ExportRequest& request, passport::ExportResult& result, json& error_json);

private:
    passport::ExportOptions defaults_;
};

} // namespace passport_server
