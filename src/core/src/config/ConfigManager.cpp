/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace block_script {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("System config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading system config from: {}", filepath);

        YAML::Node config = YAML::LoadFile(filepath);
        YAML::Node system = config["system"];

        if (!system) {
            LOG_ERROR("Missing 'system' section in config");
            return false;
        }

        SystemConfig loaded;

        // Version
        loaded.version = system["version"].as<std::string>("1.0.0");

        // Logging settings
        if (system["logging"]) {
            auto logging = system["logging"];
            loaded.logging.level = logging["level"].as<std::string>("info");
            loaded.logging.file = logging["file"].as<std::string>("logs/blockc.log");
            loaded.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            loaded.logging.max_files = logging["max_files"].as<int>(5);
            loaded.logging.console_enabled = logging["console_enabled"].as<bool>(true);
            loaded.logging.file_enabled = logging["file_enabled"].as<bool>(true);
        }

        // Script formatting
        if (system["codec"]) {
            auto codec = system["codec"];
            loaded.codec.indent = codec["indent"].as<int>(2);
            loaded.codec.print_defaults = codec["print_defaults"].as<bool>(true);
        }

        // Descriptor catalog
        if (system["catalog"]) {
            loaded.catalog.file = system["catalog"]["file"].as<std::string>("");
        }

        if (loaded.codec.indent < 0 || loaded.codec.indent > 16) {
            LOG_ERROR("System config validation failed: codec.indent must be within 0..16, got {}",
                      loaded.codec.indent);
            return false;
        }

        m_system_config = loaded;
        LOG_INFO("System config loaded: version {}", m_system_config.version);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    std::string system_path = (fs::path(config_dir) / "system_config.yaml").string();

    bool system_ok = loadSystemConfig(system_path);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config_dir = config_dir;
    m_loaded = system_ok;
    return m_loaded;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_system_config = SystemConfig{};
    m_config_dir.clear();
    m_loaded = false;
}

std::string ConfigManager::catalogPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_system_config.catalog.file.empty()) {
        return "";
    }
    fs::path path(m_system_config.catalog.file);
    if (path.is_relative() && !m_config_dir.empty()) {
        path = fs::path(m_config_dir) / path;
    }
    return path.string();
}

std::string ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_system_config.version;
    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file},
        {"max_size_mb", m_system_config.logging.max_size_mb},
        {"max_files", m_system_config.logging.max_files},
        {"console_enabled", m_system_config.logging.console_enabled},
        {"file_enabled", m_system_config.logging.file_enabled}
    };
    j["codec"] = {
        {"indent", m_system_config.codec.indent},
        {"print_defaults", m_system_config.codec.print_defaults}
    };
    j["catalog"] = {
        {"file", m_system_config.catalog.file}
    };

    return j.dump(2);
}

} // namespace config
} // namespace block_script
