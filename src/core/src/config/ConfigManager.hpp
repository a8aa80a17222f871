/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "SystemConfig.hpp"

namespace block_script {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load system configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     * @return true if all configs loaded successfully
     */
    bool loadAll(const std::string& config_dir = "config");

    /**
     * Restore built-in defaults
     */
    void reset();

    /**
     * Get system configuration (const reference)
     */
    const SystemConfig& systemConfig() const { return m_system_config; }

    /**
     * Descriptor catalog path resolved against the config directory,
     * empty if none is configured
     */
    std::string catalogPath() const;

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON
     */
    std::string systemConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    SystemConfig m_system_config;
    std::string m_config_dir;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace block_script
