#pragma once

/**
 * @file ScriptCodec.hpp
 * @brief Conversion between script text and block instances
 *
 *   BLOCK:Parse
 *     MODE:LR
 *     input = "hello how are you"
 *     => VAR @parsed
 *
 *   BLOCK:HashString
 *     ...
 */

#include "../blocks/BlockInstance.hpp"
#include "../descriptors/DescriptorRegistry.hpp"
#include <string>

namespace block_script {
namespace codec {

struct EncodeOptions {
    int indent = 2;               // Spaces before each body line
    bool printDefaults = true;
};

/**
 * Decode script text into block instances
 *
 * All-or-nothing: a single malformed block fails the whole script.
 * @throws UnknownKindError for a BLOCK: header with an unregistered id
 * @throws ParseError for malformed text
 */
blocks::Script decodeScript(const std::string& text, const descriptors::DescriptorRegistry& registry);

/**
 * Encode block instances as script text, blocks separated by a blank line
 * @throws InvalidSettingError for settings unknown to a block's descriptor
 */
std::string encodeScript(const blocks::Script& script, const EncodeOptions& options = {});

} // namespace codec
} // namespace block_script
