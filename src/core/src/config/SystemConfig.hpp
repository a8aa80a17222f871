/**
 * @file SystemConfig.hpp
 * @brief System configuration data structures
 */

#pragma once

#include <string>

namespace block_script {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/blockc.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
};

/**
 * Script text formatting
 */
struct CodecConfig {
    int indent = 2;
    bool print_defaults = true;
};

/**
 * Extra block descriptors loaded on top of the built-in table
 */
struct CatalogConfig {
    std::string file;    // Relative to the config directory; empty for none
};

/**
 * Complete system configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    LoggingConfig logging;
    CodecConfig codec;
    CatalogConfig catalog;
};

} // namespace config
} // namespace block_script
