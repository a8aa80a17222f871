/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <vector>
#include <filesystem>
#include <iostream>

namespace block_script {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::atomic<bool> Logger::s_initialized{false};
std::mutex Logger::s_mutex;

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console_enabled,
                  bool file_enabled) {
    std::lock_guard<std::mutex> lock(s_mutex);
    initLocked(log_file, level, max_size, max_files, console_enabled, file_enabled);
}

void Logger::initLocked(const std::string& log_file,
                        const std::string& level,
                        size_t max_size,
                        size_t max_files,
                        bool console_enabled,
                        bool file_enabled) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored, stderr so compiled output on stdout stays clean)
        if (console_enabled) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        // File sink (rotating)
        if (file_enabled) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("block_script", sinks.begin(), sinks.end());

        if (level == "trace") logger->set_level(spdlog::level::trace);
        else if (level == "debug") logger->set_level(spdlog::level::debug);
        else if (level == "info") logger->set_level(spdlog::level::info);
        else if (level == "warn") logger->set_level(spdlog::level::warn);
        else if (level == "error") logger->set_level(spdlog::level::err);
        else if (level == "off") logger->set_level(spdlog::level::off);
        else logger->set_level(spdlog::level::info);

        // Flush on warn or above
        logger->flush_on(spdlog::level::warn);

        // Replaces any previous default logger of the same name
        spdlog::set_default_logger(logger);

        std::atomic_store(&s_logger, logger);
        s_initialized.store(true, std::memory_order_release);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!s_initialized.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (!s_initialized.load(std::memory_order_relaxed)) {
            initLocked("logs/blockc.log", "info", 10 * 1024 * 1024, 5, true, true);
        }
        if (!s_initialized.load(std::memory_order_relaxed)) {
            // File sink unavailable: fall back to console only
            initLocked("", "info", 0, 0, true, false);
        }
    }
    return std::atomic_load(&s_logger);
}

} // namespace block_script
