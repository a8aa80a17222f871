#pragma once

/**
 * @file BlockDescriptor.hpp
 * @brief Immutable schema of a block kind and its parameters
 */

#include "../settings/SettingValue.hpp"
#include <optional>
#include <string>
#include <vector>

namespace block_script {
namespace descriptors {

enum class ParamType {
    String,
    Int,
    Float,
    Bool,
    Enum,
    ByteArray,
    ListOfStrings,
    DictOfStrings
};

std::string paramTypeToString(ParamType type);
std::optional<ParamType> paramTypeFromString(const std::string& name);

/**
 * Block family, selects which instance variant is created for a descriptor
 */
enum class BlockFamily {
    Parse,
    Function,
    Keycheck,
    RawCode
};

std::string blockFamilyToString(BlockFamily family);
std::optional<BlockFamily> blockFamilyFromString(const std::string& name);

struct ParamSchema {
    std::string name;
    ParamType type = ParamType::String;
    settings::SettingValue defaultValue;

    // Enum parameters only
    std::string enumType;                 // Host-language enum type, e.g. "HashFunction"
    std::vector<std::string> enumValues;

    bool allowsEnumValue(const std::string& value) const;
};

struct BlockDescriptor {
    std::string id;
    std::string name;
    std::string category;
    std::string description;
    BlockFamily family = BlockFamily::Function;
    std::vector<ParamSchema> parameters;  // declaration order is significant

    // Function family
    std::string method;                   // Runtime callee
    std::string returnType;               // Empty when the call yields no value
    bool async = false;
    std::string defaultOutputVariable;

    const ParamSchema* findParameter(const std::string& param_name) const;
    bool hasParameter(const std::string& param_name) const { return findParameter(param_name) != nullptr; }
    bool returnsValue() const { return !returnType.empty(); }
};

} // namespace descriptors
} // namespace block_script
