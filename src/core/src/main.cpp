/**
 * @file main.cpp
 * @brief blockc - block script compiler entry point
 */

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "block_script/core.hpp"

using namespace block_script;
using namespace block_script::config;

namespace {

void printUsage() {
    std::cerr << "Usage: blockc <command> [file|-] [--config <dir>] [--log-level <level>]\n"
              << "\n"
              << "Commands:\n"
              << "  compile <file>   Print the generated C# statements\n"
              << "  format <file>    Print the script in canonical form\n"
              << "  dump <file>      Print the decoded script as JSON\n"
              << "  check <file>     Decode and compile, report errors only\n"
              << "  list             Print the registered block kinds as JSON\n";
}

bool readSource(const std::string& path, std::string& source) {
    if (path == "-") {
        source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        LOG_ERROR("Cannot open script file: {}", path);
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    source = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string file;
    std::string config_dir = "config";
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (file.empty()) {
            file = arg;
        } else {
            printUsage();
            return 2;
        }
    }

    if (command.empty() || (command != "list" && file.empty())) {
        printUsage();
        return 2;
    }

    // Console-only logging until the configuration is known
    Logger::init("", log_level.empty() ? "warn" : log_level, 0, 0, true, false);

    auto& config = ConfigManager::instance();
    if (!config.loadAll(config_dir)) {
        LOG_WARN("Using default configuration (no valid system_config.yaml in {})", config_dir);
        config.reset();
    }

    // Reconfigure logger based on loaded config
    const auto& logConfig = config.systemConfig().logging;
    Logger::init(
        logConfig.file,
        log_level.empty() ? logConfig.level : log_level,
        static_cast<size_t>(logConfig.max_size_mb) * 1024 * 1024,
        static_cast<size_t>(logConfig.max_files),
        logConfig.console_enabled,
        logConfig.file_enabled && config.isLoaded()
    );

    LOG_INFO("blockc v{}", config.systemConfig().version);

    descriptors::DescriptorRegistry registry;
    registry.registerBuiltins();

    std::string catalog = config.catalogPath();
    if (!catalog.empty() && !registry.loadCatalog(catalog)) {
        LOG_ERROR("Failed to load descriptor catalog: {}", catalog);
        return 1;
    }
    registry.freeze();

    if (command == "list") {
        try {
            std::cout << codec::registryToJson(registry).dump(2) << std::endl;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to list block descriptors: {}", e.what());
            return 1;
        }
        return 0;
    }

    if (!cli::isScriptCommand(command)) {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage();
        return 2;
    }

    std::string source;
    if (!readSource(file, source)) {
        return 1;
    }

    codec::EncodeOptions options;
    options.indent = config.systemConfig().codec.indent;
    options.printDefaults = config.systemConfig().codec.print_defaults;

    return cli::runScriptCommand(command, file, source, registry, options, std::cout, std::cerr);
}
