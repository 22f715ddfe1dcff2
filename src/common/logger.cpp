#include "common/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace passport {

namespace {

constexpr const char* kLoggerName = "passport";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

std::mutex g_loggerMutex;
std::shared_ptr<spdlog::logger> g_logger;

} // namespace

void InitLogger(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (config.enableFile) {
        std::filesystem::create_directories(config.logDir);
        std::string path = (std::filesystem::path(config.logDir) / config.fileName).string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_loggerMutex);
    g_logger = logger;
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (!g_logger) {
        g_logger = spdlog::stdout_color_mt(kLoggerName);
        g_logger->set_pattern(kPattern);
        g_logger->set_level(spdlog::level::info);
    }
    return g_logger;
}

} // namespace passport
