/**
 * @file DescriptorRegistry.cpp
 * @brief Descriptor registry and YAML catalog loader
 */

#include "DescriptorRegistry.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace block_script {
namespace descriptors {

namespace fs = std::filesystem;
using settings::SettingValue;

namespace {

/**
 * Convert a YAML default to a setting value of the parameter's type.
 * A missing node yields the type's zero value.
 */
SettingValue defaultFromYaml(const YAML::Node& node, const ParamSchema& param) {
    switch (param.type) {
        case ParamType::String:
            return SettingValue(node ? node.as<std::string>() : std::string());
        case ParamType::Int:
            return SettingValue(node ? node.as<int>() : 0);
        case ParamType::Float:
            return SettingValue(node ? node.as<double>() : 0.0);
        case ParamType::Bool:
            return SettingValue(node ? node.as<bool>() : false);
        case ParamType::Enum: {
            std::string value = node ? node.as<std::string>()
                                     : (param.enumValues.empty() ? std::string() : param.enumValues.front());
            if (!param.allowsEnumValue(value)) {
                throw std::invalid_argument("default '" + value + "' is not a value of " + param.enumType);
            }
            return SettingValue(settings::EnumValue{value});
        }
        case ParamType::ByteArray: {
            if (!node) return SettingValue(settings::Bytes{});
            auto bytes = text::base64Decode(node.as<std::string>());
            if (!bytes) {
                throw std::invalid_argument("default of '" + param.name + "' is not valid base64");
            }
            return SettingValue(*bytes);
        }
        case ParamType::ListOfStrings: {
            settings::SettingList list;
            if (node) {
                for (const auto& item : node) {
                    list.emplace_back(item.as<std::string>());
                }
            }
            return SettingValue(list);
        }
        case ParamType::DictOfStrings: {
            settings::SettingDict dict;
            if (node) {
                for (const auto& entry : node) {
                    dict.emplace_back(entry.first.as<std::string>(), SettingValue(entry.second.as<std::string>()));
                }
            }
            return SettingValue(dict);
        }
    }
    return SettingValue();
}

BlockDescriptor descriptorFromYaml(const YAML::Node& node) {
    BlockDescriptor d;
    d.id = node["id"].as<std::string>();
    d.name = node["name"].as<std::string>(d.id);
    d.category = node["category"].as<std::string>("Custom");
    d.description = node["description"].as<std::string>("");

    std::string family = node["family"].as<std::string>("function");
    auto parsed_family = blockFamilyFromString(family);
    if (!parsed_family) {
        throw std::invalid_argument("unknown block family '" + family + "'");
    }
    d.family = *parsed_family;

    d.method = node["method"].as<std::string>(d.id);
    d.returnType = node["returns"].as<std::string>("");
    d.async = node["async"].as<bool>(false);
    d.defaultOutputVariable = node["output_variable"].as<std::string>(d.returnType.empty() ? "" : d.id + "Output");

    if (node["parameters"]) {
        for (const auto& p : node["parameters"]) {
            ParamSchema param;
            param.name = p["name"].as<std::string>();
            if (!text::isIdentifier(param.name)) {
                throw std::invalid_argument("descriptor '" + d.id + "' has invalid parameter name '" +
                                            param.name + "'");
            }
            if (d.hasParameter(param.name)) {
                throw std::invalid_argument("descriptor '" + d.id + "' declares parameter '" +
                                            param.name + "' twice");
            }

            std::string type = p["type"].as<std::string>("String");
            auto parsed_type = paramTypeFromString(type);
            if (!parsed_type) {
                throw std::invalid_argument("parameter '" + param.name + "' has unknown type '" + type + "'");
            }
            param.type = *parsed_type;

            if (param.type == ParamType::Enum) {
                param.enumType = p["enum_type"].as<std::string>("");
                if (p["values"]) {
                    param.enumValues = p["values"].as<std::vector<std::string>>();
                }
                if (param.enumValues.empty()) {
                    throw std::invalid_argument("enum parameter '" + param.name + "' has no values");
                }
            }

            param.defaultValue = defaultFromYaml(p["default"], param);
            d.parameters.push_back(std::move(param));
        }
    }

    return d;
}

} // namespace

std::shared_ptr<const DescriptorRegistry> DescriptorRegistry::builtin() {
    static const std::shared_ptr<const DescriptorRegistry> registry = [] {
        auto r = std::make_shared<DescriptorRegistry>();
        r->registerBuiltins();
        r->freeze();
        return r;
    }();
    return registry;
}

void DescriptorRegistry::ensureMutable() const {
    if (m_frozen) {
        throw std::logic_error("Descriptor registry is frozen");
    }
}

void DescriptorRegistry::add(BlockDescriptor descriptor) {
    ensureMutable();

    if (descriptor.id.empty()) {
        throw std::invalid_argument("Descriptor id must not be empty");
    }
    if (m_descriptors.count(descriptor.id) > 0) {
        throw std::invalid_argument("Duplicate descriptor id: " + descriptor.id);
    }

    std::string id = descriptor.id;
    m_descriptors.emplace(id, std::make_shared<const BlockDescriptor>(std::move(descriptor)));
    LOG_TRACE("Registered block descriptor: {}", id);
}

bool DescriptorRegistry::loadCatalog(const std::string& filepath) {
    ensureMutable();

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Descriptor catalog not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading descriptor catalog from: {}", filepath);

        YAML::Node root = YAML::LoadFile(filepath);
        YAML::Node entries = root["descriptors"];
        if (!entries || !entries.IsSequence()) {
            LOG_ERROR("Descriptor catalog missing 'descriptors' array");
            return false;
        }

        // Validate everything first so a bad catalog adds nothing
        std::vector<BlockDescriptor> loaded;
        for (const auto& entry : entries) {
            loaded.push_back(descriptorFromYaml(entry));
        }
        std::set<std::string> seen;
        for (const auto& d : loaded) {
            if (m_descriptors.count(d.id) > 0 || !seen.insert(d.id).second) {
                LOG_ERROR("Descriptor catalog redefines block id: {}", d.id);
                return false;
            }
        }

        for (auto& d : loaded) {
            add(std::move(d));
        }

        LOG_INFO("Descriptor catalog loaded: {} descriptors", loaded.size());
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in descriptor catalog: {}", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid descriptor in catalog: {}", e.what());
        return false;
    }
}

std::shared_ptr<const BlockDescriptor> DescriptorRegistry::get(const std::string& id) const {
    auto descriptor = find(id);
    if (!descriptor) {
        throw UnknownKindError("Unknown block id", 0, id);
    }
    return descriptor;
}

std::shared_ptr<const BlockDescriptor> DescriptorRegistry::find(const std::string& id) const {
    auto it = m_descriptors.find(id);
    return it != m_descriptors.end() ? it->second : nullptr;
}

std::vector<std::string> DescriptorRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(m_descriptors.size());
    for (const auto& entry : m_descriptors) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace descriptors
} // namespace block_script
