/**
 * @file ScriptCommand.cpp
 */

#include "ScriptCommand.hpp"
#include "../codec/ScriptJson.hpp"
#include "../codegen/CodeGenerator.hpp"
#include "../common/ScriptError.hpp"
#include "../logging/Logger.hpp"

namespace block_script {
namespace cli {

bool isScriptCommand(const std::string& command) {
    return command == "compile" || command == "format" || command == "dump" || command == "check";
}

int runScriptCommand(const std::string& command,
                     const std::string& source_name,
                     const std::string& source,
                     const descriptors::DescriptorRegistry& registry,
                     const codec::EncodeOptions& options,
                     std::ostream& out,
                     std::ostream& err) {
    try {
        auto script = codec::decodeScript(source, registry);
        LOG_INFO("Decoded {} blocks from {}", script.size(), source_name);

        if (command == "format") {
            out << codec::encodeScript(script, options);
        } else if (command == "dump") {
            out << codec::scriptToJson(script).dump(2) << std::endl;
        } else if (command == "compile" || command == "check") {
            codegen::CodeGenerator generator;
            std::string generated = generator.generate(script);
            if (command == "compile") {
                out << generated;
            } else {
                out << source_name << ": OK (" << script.size() << " blocks)" << std::endl;
            }
        } else {
            err << "Unknown command: " << command << std::endl;
            return 1;
        }

    } catch (const ScriptError& e) {
        LOG_ERROR("{}: {}", source_name, e.what());
        err << source_name << ":" << e.line() << ": " << e.detail();
        if (!e.excerpt().empty()) {
            err << ": " << e.excerpt();
        }
        err << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("{}: {} failed: {}", source_name, command, e.what());
        err << source_name << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace cli
} // namespace block_script
