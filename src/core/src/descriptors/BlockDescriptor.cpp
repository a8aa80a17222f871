/**
 * @file BlockDescriptor.cpp
 */

#include "BlockDescriptor.hpp"
#include <algorithm>

namespace block_script {
namespace descriptors {

std::string paramTypeToString(ParamType type) {
    switch (type) {
        case ParamType::String: return "String";
        case ParamType::Int: return "Int";
        case ParamType::Float: return "Float";
        case ParamType::Bool: return "Bool";
        case ParamType::Enum: return "Enum";
        case ParamType::ByteArray: return "ByteArray";
        case ParamType::ListOfStrings: return "ListOfStrings";
        case ParamType::DictOfStrings: return "DictOfStrings";
        default: return "Unknown";
    }
}

std::optional<ParamType> paramTypeFromString(const std::string& name) {
    if (name == "String") return ParamType::String;
    if (name == "Int") return ParamType::Int;
    if (name == "Float") return ParamType::Float;
    if (name == "Bool") return ParamType::Bool;
    if (name == "Enum") return ParamType::Enum;
    if (name == "ByteArray") return ParamType::ByteArray;
    if (name == "ListOfStrings") return ParamType::ListOfStrings;
    if (name == "DictOfStrings") return ParamType::DictOfStrings;
    return std::nullopt;
}

std::string blockFamilyToString(BlockFamily family) {
    switch (family) {
        case BlockFamily::Parse: return "parse";
        case BlockFamily::Function: return "function";
        case BlockFamily::Keycheck: return "keycheck";
        case BlockFamily::RawCode: return "rawcode";
        default: return "unknown";
    }
}

std::optional<BlockFamily> blockFamilyFromString(const std::string& name) {
    if (name == "parse") return BlockFamily::Parse;
    if (name == "function") return BlockFamily::Function;
    if (name == "keycheck") return BlockFamily::Keycheck;
    if (name == "rawcode") return BlockFamily::RawCode;
    return std::nullopt;
}

bool ParamSchema::allowsEnumValue(const std::string& value) const {
    return std::find(enumValues.begin(), enumValues.end(), value) != enumValues.end();
}

const ParamSchema* BlockDescriptor::findParameter(const std::string& param_name) const {
    for (const auto& param : parameters) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

} // namespace descriptors
} // namespace block_script
