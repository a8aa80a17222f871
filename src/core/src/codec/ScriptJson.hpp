#pragma once

/**
 * @file ScriptJson.hpp
 * @brief JSON view of decoded scripts for external tooling
 */

#include "../blocks/BlockInstance.hpp"
#include "../descriptors/DescriptorRegistry.hpp"
#include <nlohmann/json.hpp>

namespace block_script {
namespace codec {

nlohmann::json settingValueToJson(const settings::SettingValue& value);
nlohmann::json blockToJson(const blocks::BlockInstance& block);
nlohmann::json scriptToJson(const blocks::Script& script);

// Registered descriptors with their parameter schemas
nlohmann::json registryToJson(const descriptors::DescriptorRegistry& registry);

} // namespace codec
} // namespace block_script
