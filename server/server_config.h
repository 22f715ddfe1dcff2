#pragma once

#include "export/export_merger.h"
#include "pipeline/passport_pipeline.h"
#include "recognition/dx_ocr_engine.h"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace passport_server {

/**
 * @brief Everything the server needs at startup
 */
struct ServerConfig {
    int port = 8080;
    int threads = 4;
    std::string logDir = "logs";
    std::string logLevel = "info";
    size_t maxFilesPerRequest = 50;

    passport::PipelineConfig pipeline;
    passport::DxOcrEngineConfig engine;
    passport::ExportOptions exportOptions;

    void Show() const;
};

/**
 * @brief Override the fields named in a JSON object; absent keys keep their value
 *
 * Layout: top-level server keys plus "pipeline" (with "segmenter", "locator",
 * "parser", "assembler"), "engine" and "export" objects.
 * @throws json::exception when a value has the wrong type
 * @throws std::invalid_argument for an unknown enum value or bad substitution pair
 */
void ApplyConfigJson(const json& j, ServerConfig& config);

/**
 * @brief Load a JSON configuration file onto config
 * @return false (with error_msg) if the file is missing or invalid
 */
bool LoadConfigFile(const std::string& path, ServerConfig& config, std::string& error_msg);

/**
 * @brief "letter" / "thai" to GenderStyle
 * @throws std::invalid_argument for any other value
 */
passport::GenderStyle ParseGenderStyle(const std::string& value);

} // namespace passport_server
