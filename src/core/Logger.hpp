/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * This file defines the Logger class which initializes and manages the
 * spdlog instance used by the locator. A host that calls init() gets a
 * console plus rotating file logger registered as the spdlog default.
 * Without init(), the first log statement creates a console-only logger that
 * writes no files and leaves the spdlog registry alone.
 *
 * @section Dependencies
 * - spdlog
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string_view>

namespace cl {

class Logger {
public:
    static void init(std::string_view appName = "config-locator",
                     bool debug = false);
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex mutex_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(cl::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(cl::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(cl::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(cl::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(cl::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(cl::Logger::get(), __VA_ARGS__)

} // namespace cl
