#include "extraction_handler.h"
#include "export_handler.h"
#include "json_response.h"
#include "server_config.h"
#include "common/logger.hpp"
#include "recognition/dx_ocr_engine.h"

#include <crow.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using json = nlohmann::json;
using namespace passport_server;

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -p, --port <port>        Server port (default: 8080)\n"
              << "  -t, --threads <num>      Number of HTTP threads (default: 4)\n"
              << "  -l, --log-dir <path>     Log directory (default: logs)\n"
              << "  -c, --config <file>      JSON configuration file\n"
              << "  -T, --timeout <ms>       Per-document timeout (default: 30000)\n"
              << "  -h, --help               Show this help message\n";
}

crow::response JsonReply(int status, const json& body) {
    crow::response res(status, body.dump());
    res.set_header("Content-Type", "application/json");
    return res;
}

} // namespace

int main(int argc, char* argv[]) {
    ServerConfig config;

    // Command line wins over the config file, so remember what was given
    int port = -1;
    int threads = -1;
    int timeout_ms = -1;
    std::string log_dir;
    std::string config_path;

    static struct option long_options[] = {
        {"port",     required_argument, 0, 'p'},
        {"threads",  required_argument, 0, 't'},
        {"log-dir",  required_argument, 0, 'l'},
        {"config",   required_argument, 0, 'c'},
        {"timeout",  required_argument, 0, 'T'},
        {"help",     no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    try {
        while ((opt = getopt_long(argc, argv, "p:t:l:c:T:h", long_options, &option_index)) != -1) {
            switch (opt) {
                case 'p':
                    port = std::stoi(optarg);
                    break;
                case 't':
                    threads = std::stoi(optarg);
                    break;
                case 'l':
                    log_dir = optarg;
                    break;
                case 'c':
                    config_path = optarg;
                    break;
                case 'T':
                    timeout_ms = std::stoi(optarg);
                    break;
                case 'h':
                    PrintUsage(argv[0]);
                    return 0;
                default:
                    std::cerr << "Use -h or --help for usage information\n";
                    return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric option (" << e.what() << ")\n";
        return 1;
    }

    if (!config_path.empty()) {
        std::string error_msg;
        if (!LoadConfigFile(config_path, config, error_msg)) {
            std::cerr << "Error: " << error_msg << "\n";
            return 1;
        }
    }
    if (port > 0) config.port = port;
    if (threads > 0) config.threads = threads;
    if (timeout_ms > 0) config.pipeline.documentTimeoutMs = timeout_ms;
    if (!log_dir.empty()) config.logDir = log_dir;

    std::filesystem::create_directories(config.logDir);
    passport::LoggerConfig logConfig;
    logConfig.logDir = config.logDir;
    logConfig.level = config.logLevel;
    try {
        passport::InitLogger(logConfig);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger init failed: " << ex.what() << "\n";
        return 1;
    }

    LOG_INFO("========== Passport OCR Server Starting ==========");
    config.Show();

    auto engine = std::make_shared<passport::DxOcrEngine>(config.engine);
    auto pipeline = std::make_shared<passport::PassportPipeline>(config.pipeline, engine);
    if (!pipeline->initialize()) {
        LOG_ERROR("Failed to initialize OCR pipeline");
        return 1;
    }

    auto extraction_handler = std::make_shared<ExtractionHandler>(pipeline, config.maxFilesPerRequest);
    auto export_handler = std::make_shared<ExportHandler>(config.exportOptions);

    crow::SimpleApp app;
    app.loglevel(crow::LogLevel::Warning);

    CROW_ROUTE(app, "/health")
    ([]() {
        json response;
        response["status"] = "healthy";
        response["service"] = "Passport OCR Server";
        response["version"] = "1.0.0";
        return JsonReply(200, response);
    });

    CROW_ROUTE(app, "/api/ocr").methods(crow::HTTPMethod::POST)
    ([extraction_handler](const crow::request& req) {
        LOG_INFO("Received extraction request from {}", req.remote_ip_address);
        try {
            json request_json = json::parse(req.body);
            auto request = ExtractionRequest::FromJson(request_json);

            json response_json;
            int status_code = extraction_handler->HandleRequest(request, response_json);
            return JsonReply(status_code, response_json);

        } catch (const json::exception& e) {
            LOG_ERROR("JSON parse error: {}", e.what());
            return JsonReply(400, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON format: ") + e.what()));

        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error: {}", e.what());
            return JsonReply(500, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INTERNAL_ERROR, std::string("Internal server error: ") + e.what()));
        }
    });

    CROW_ROUTE(app, "/api/export").methods(crow::HTTPMethod::POST)
    ([export_handler](const crow::request& req) {
        LOG_INFO("Received export request from {}", req.remote_ip_address);
        try {
            json request_json = json::parse(req.body);
            auto request = ExportRequest::FromJson(request_json);

            passport::ExportResult result;
            json error_json;
            int status_code = export_handler->HandleRequest(request, result, error_json);
            if (status_code != 200) {
                return JsonReply(status_code, error_json);
            }

            crow::response res(200, std::string(result.workbook.begin(), result.workbook.end()));
            res.set_header("Content-Type",
                           "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet");
            res.set_header("Content-Disposition", "attachment; filename=" + result.filename);
            return res;

        } catch (const json::exception& e) {
            LOG_ERROR("JSON parse error: {}", e.what());
            return JsonReply(400, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INVALID_PARAMETER, std::string("Invalid JSON format: ") + e.what()));

        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error: {}", e.what());
            return JsonReply(500, JsonResponseBuilder::BuildErrorResponse(
                ErrorCode::INTERNAL_ERROR, std::string("Internal server error: ") + e.what()));
        }
    });

    LOG_INFO("Starting server on port {} with {} threads...", config.port, config.threads);
    LOG_INFO("Endpoints:");
    LOG_INFO("  - POST   /api/ocr       (Passport extraction)");
    LOG_INFO("  - POST   /api/export    (Workbook export)");
    LOG_INFO("  - GET    /health        (Health Check)");
    LOG_INFO("===============================================");

    app.port(static_cast<uint16_t>(config.port))
       .concurrency(static_cast<uint16_t>(config.threads))
       .run();

    return 0;
}
