#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>

/**
 * Logging system for PassportOCR (spdlog backend)
 */

namespace passport {

/**
 * @brief Logger settings, applied once at process start
 */
struct LoggerConfig {
    std::string logDir = "logs";
    std::string fileName = "passport_ocr.log";
    std::string level = "info";            // trace/debug/info/warn/error/off
    bool enableConsole = true;
    bool enableFile = true;
    size_t maxFileSize = 10 * 1024 * 1024;
    size_t maxFiles = 5;
};

/**
 * @brief Install console + rotating file sinks as the "passport" logger
 * @throws spdlog::spdlog_ex if the log directory or file cannot be opened
 */
void InitLogger(const LoggerConfig& config);

/**
 * @brief Active logger; a console-only logger is created on first use
 *        when InitLogger() was never called (tests, tools)
 */
std::shared_ptr<spdlog::logger> GetLogger();

} // namespace passport

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::passport::GetLogger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::passport::GetLogger(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::passport::GetLogger(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::passport::GetLogger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::passport::GetLogger(), __VA_ARGS__)

// Run fn only when debug output is enabled (dumps, per-line traces)
#define LOG_DEBUG_EXEC(fn)                                                   \
    do {                                                                     \
        if (::passport::GetLogger()->should_log(spdlog::level::debug)) {     \
            (fn)();                                                          \
        }                                                                    \
    } while (0)
