/**
 * @file ScriptJson.cpp
 */

#include "ScriptJson.hpp"
#include "../common/TextUtils.hpp"

namespace block_script {
namespace codec {

using json = nlohmann::json;
using namespace settings;

json settingValueToJson(const SettingValue& value) {
    const auto& v = value.value;

    if (auto s = std::get_if<std::string>(&v)) return {{"shape", "fixed"}, {"value", *s}};
    if (auto i = std::get_if<int>(&v)) return {{"shape", "fixed"}, {"value", *i}};
    if (auto d = std::get_if<double>(&v)) return {{"shape", "fixed"}, {"value", *d}};
    if (auto b = std::get_if<bool>(&v)) return {{"shape", "fixed"}, {"value", *b}};
    if (auto e = std::get_if<EnumValue>(&v)) return {{"shape", "fixed"}, {"value", e->value}};
    if (auto bytes = std::get_if<Bytes>(&v)) return {{"shape", "fixed"}, {"base64", text::base64Encode(*bytes)}};
    if (auto var = std::get_if<VariableRef>(&v)) return {{"shape", "variable"}, {"name", var->name}};
    if (auto interp = std::get_if<Interpolated>(&v)) return {{"shape", "interpolated"}, {"template", interp->text}};

    if (auto list = std::get_if<SettingList>(&v)) {
        json items = json::array();
        for (const auto& item : *list) {
            items.push_back(settingValueToJson(item));
        }
        return {{"shape", "list"}, {"items", items}};
    }

    json entries = json::array();
    for (const auto& entry : std::get<SettingDict>(v)) {
        entries.push_back({{"key", entry.first}, {"value", settingValueToJson(entry.second)}});
    }
    return {{"shape", "dict"}, {"entries", entries}};
}

json blockToJson(const blocks::BlockInstance& block) {
    const auto& base = block.base();

    json j;
    j["id"] = base.id();
    j["family"] = descriptors::blockFamilyToString(base.descriptor().family);
    j["label"] = base.label();
    j["disabled"] = base.isDisabled();
    if (base.sourceLine() > 0) {
        j["line"] = base.sourceLine();
    }

    j["settings"] = json::object();
    for (const auto& entry : base.settings()) {
        j["settings"][entry.first] = settingValueToJson(entry.second.value);
    }

    if (const auto* parse = block.as<blocks::ParseBlock>()) {
        j["mode"] = blocks::parseModeToString(parse->mode());
        j["recursive"] = parse->isRecursive();
        j["output_variable"] = parse->outputVariable();
        j["capture"] = parse->isCapture();
    } else if (const auto* function = block.as<blocks::FunctionBlock>()) {
        if (base.descriptor().returnsValue()) {
            j["output_variable"] = function->outputVariable();
            j["capture"] = function->isCapture();
        }
    } else if (const auto* keycheck = block.as<blocks::KeycheckBlock>()) {
        j["keychains"] = json::array();
        for (const auto& keychain : keycheck->keychains()) {
            json keys = json::array();
            for (const auto& key : keychain.keys) {
                keys.push_back({
                    {"type", blocks::keyTypeInfo(key.type).token},
                    {"left", settingValueToJson(key.left)},
                    {"comparison", key.comparison},
                    {"right", settingValueToJson(key.right)}
                });
            }
            j["keychains"].push_back({
                {"status", keychain.resultStatus},
                {"mode", keychain.mode == blocks::KeychainMode::OR ? "OR" : "AND"},
                {"keys", keys}
            });
        }
    } else if (const auto* raw = block.as<blocks::RawCodeBlock>()) {
        j["code"] = raw->lines();
    }

    return j;
}

json scriptToJson(const blocks::Script& script) {
    json items = json::array();
    for (const auto& block : script) {
        items.push_back(blockToJson(block));
    }
    return {{"blocks", items}};
}

json registryToJson(const descriptors::DescriptorRegistry& registry) {
    json out = json::array();
    for (const auto& id : registry.ids()) {
        auto d = registry.get(id);

        json params = json::array();
        for (const auto& p : d->parameters) {
            json param = {
                {"name", p.name},
                {"type", descriptors::paramTypeToString(p.type)},
                {"default", settingValueToJson(p.defaultValue)}
            };
            if (p.type == descriptors::ParamType::Enum) {
                param["enum_type"] = p.enumType;
                param["values"] = p.enumValues;
            }
            params.push_back(param);
        }

        json entry = {
            {"id", d->id},
            {"name", d->name},
            {"category", d->category},
            {"family", descriptors::blockFamilyToString(d->family)},
            {"parameters", params}
        };
        if (d->family == descriptors::BlockFamily::Function) {
            entry["method"] = d->method;
            entry["returns"] = d->returnType;
            entry["async"] = d->async;
        }
        out.push_back(entry);
    }
    return out;
}

} // namespace codec
} // namespace block_script
