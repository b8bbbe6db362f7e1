/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * One process-wide logger with two sinks: colored stderr (stdout is kept
 * free for timeline output) and a rotating file under the cache directory.
 * If the file sink cannot be created, logging continues on stderr only.
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>

namespace ks {

class Logger {
public:
    static void init(std::string_view appName = "karasync", bool debug = false);
    static void shutdown();

    // Switch between info and debug verbosity after init
    static void setDebug(bool debug);

    // Empty when logging to stderr only
    static const std::filesystem::path& logFile();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

// Use these instead of calling Logger::get() directly
#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(ks::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(ks::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(ks::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(ks::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(ks::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(ks::Logger::get(), __VA_ARGS__)

} // namespace ks
