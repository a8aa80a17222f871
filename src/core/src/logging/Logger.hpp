/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace block_script {

class Logger {
public:
    /**
     * Initialize (or reconfigure) the logging system
     * @param log_file Path to log file
     * @param level Log level (trace, debug, info, warn, error)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console_enabled Log to stderr
     * @param file_enabled Log to the rotating file
     */
    static void init(const std::string& log_file = "logs/blockc.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console_enabled = true,
                     bool file_enabled = true);

    /**
     * Get the logger instance, initializing it with defaults on first use.
     * Safe to call from several threads, including concurrently with init().
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static void initLocked(const std::string& log_file,
                           const std::string& level,
                           size_t max_size,
                           size_t max_files,
                           bool console_enabled,
                           bool file_enabled);

    static std::shared_ptr<spdlog::logger> s_logger;
    static std::atomic<bool> s_initialized;
    static std::mutex s_mutex;
};

} // namespace block_script

// Convenience macros
#define LOG_TRACE(...) ::block_script::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::block_script::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::block_script::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::block_script::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::block_script::Logger::get()->error(__VA_ARGS__)
