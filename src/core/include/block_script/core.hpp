#pragma once
/**
 * @file core.hpp
 * @brief Main include file for Block Script Core
 */

#include "../src/logging/Logger.hpp"
#include "../src/config/ConfigManager.hpp"
#include "../src/descriptors/DescriptorRegistry.hpp"
#include "../src/codec/ScriptCodec.hpp"
#include "../src/codec/ScriptJson.hpp"
#include "../src/codegen/CodeGenerator.hpp"
#include "../src/common/ScriptError.hpp"
#include "../src/cli/ScriptCommand.hpp"
