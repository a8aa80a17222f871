#pragma once

/**
 * @file ScriptCommand.hpp
 * @brief blockc commands operating on one script
 */

#include "../codec/ScriptCodec.hpp"
#include "../descriptors/DescriptorRegistry.hpp"
#include <ostream>
#include <string>

namespace block_script {
namespace cli {

// compile, format, dump or check
bool isScriptCommand(const std::string& command);

/**
 * Decode a script and run one command on it
 * @param source_name File name used in diagnostics ("-" for stdin)
 * @return exit code: 0 on success, 1 if the script could not be processed
 */
int runScriptCommand(const std::string& command,
                     const std::string& source_name,
                     const std::string& source,
                     const descriptors::DescriptorRegistry& registry,
                     const codec::EncodeOptions& options,
                     std::ostream& out,
                     std::ostream& err);

} // namespace cli
} // namespace block_script
