/**
 * @file CSharpWriter.cpp
 */

#include "CSharpWriter.hpp"
#include "../common/TextUtils.hpp"
#include "../settings/SettingNotation.hpp"
#include <cctype>
#include <cstdio>

namespace block_script {
namespace codegen {

using descriptors::ParamSchema;
using descriptors::ParamType;
using namespace settings;

namespace {

const ParamSchema kStringElement{"element", ParamType::String, SettingValue(), "", {}};

void appendEscaped(std::string& out, char c) {
    switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\0': out += "\\0"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(c));
                out += buffer;
            } else {
                out.push_back(c);
            }
            break;
    }
}

bool isPlaceholderChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

} // namespace

std::string stringLiteral(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        appendEscaped(out, c);
    }
    return out + "\"";
}

std::string interpolatedLiteral(const std::string& templ) {
    std::string out = "$\"";
    size_t i = 0;
    while (i < templ.size()) {
        char c = templ[i];

        if (c == '<') {
            size_t end = i + 1;
            while (end < templ.size() && isPlaceholderChar(templ[end])) end++;
            std::string name = templ.substr(i + 1, end - i - 1);
            if (end < templ.size() && templ[end] == '>' && text::isVariablePath(name)) {
                out += "{" + variableExpression(name) + "}";
                i = end + 1;
                continue;
            }
        }

        if (c == '{') out += "{{";
        else if (c == '}') out += "}}";
        else appendEscaped(out, c);
        i++;
    }
    return out + "\"";
}

std::string variableExpression(const std::string& name) {
    // Locals, bot data fields (data.SOURCE) and members of the dynamic
    // globals store (globals.name) are all read by their dotted path
    return name;
}

std::string joinArguments(const std::vector<std::string>& arguments) {
    std::string out;
    for (size_t i = 0; i < arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += arguments[i];
    }
    return out;
}

std::string resolve(const SettingValue& value, const ParamSchema& param) {
    const auto& v = value.value;

    if (auto s = std::get_if<std::string>(&v)) return stringLiteral(*s);
    if (auto i = std::get_if<int>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) return formatFloat(*d);
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";

    if (auto e = std::get_if<EnumValue>(&v)) {
        return param.enumType.empty() ? stringLiteral(e->value) : param.enumType + "." + e->value;
    }

    if (auto bytes = std::get_if<Bytes>(&v)) {
        if (bytes->empty()) return "new byte[0]";
        return "Convert.FromBase64String(" + stringLiteral(text::base64Encode(*bytes)) + ")";
    }

    if (auto var = std::get_if<VariableRef>(&v)) return variableExpression(var->name);
    if (auto interp = std::get_if<Interpolated>(&v)) return interpolatedLiteral(interp->text);

    if (auto list = std::get_if<SettingList>(&v)) {
        if (list->empty()) return "new List<string>()";
        std::vector<std::string> items;
        for (const auto& item : *list) {
            items.push_back(resolve(item, kStringElement));
        }
        return "new List<string> { " + joinArguments(items) + " }";
    }

    const auto& dict = std::get<SettingDict>(v);
    if (dict.empty()) return "new Dictionary<string, string>()";
    std::vector<std::string> entries;
    for (const auto& entry : dict) {
        entries.push_back("{ " + stringLiteral(entry.first) + ", " + resolve(entry.second, kStringElement) + " }");
    }
    return "new Dictionary<string, string> { " + joinArguments(entries) + " }";
}

} // namespace codegen
} // namespace block_script
