/**
 * @file SettingNotation.cpp
 * @brief Setting value notation reader and writer
 */

#include "SettingNotation.hpp"
#include "../common/TextUtils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace block_script {
namespace settings {

using descriptors::ParamSchema;
using descriptors::ParamType;

namespace {

bool isVariableChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

std::string joinList(const SettingList& list) {
    std::string out = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ", ";
        out += formatValue(list[i]);
    }
    return out + "]";
}

std::string joinDict(const SettingDict& dict) {
    std::string out = "{";
    for (size_t i = 0; i < dict.size(); ++i) {
        if (i > 0) out += ", ";
        out += "(" + quoteString(dict[i].first) + ", " + formatValue(dict[i].second) + ")";
    }
    return out + "}";
}

} // namespace

std::string quoteString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out + "\"";
}

std::string formatFloat(double value) {
    // Shortest representation that reads back to the same double
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) break;
    }
    std::string out(buffer);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string formatValue(const SettingValue& value) {
    const auto& v = value.value;
    if (auto s = std::get_if<std::string>(&v)) return quoteString(*s);
    if (auto i = std::get_if<int>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) return formatFloat(*d);
    if (auto b = std::get_if<bool>(&v)) return *b ? "True" : "False";
    if (auto e = std::get_if<EnumValue>(&v)) return e->value;
    if (auto bytes = std::get_if<Bytes>(&v)) return text::base64Encode(*bytes);
    if (auto var = std::get_if<VariableRef>(&v)) return "@" + var->name;
    if (auto interp = std::get_if<Interpolated>(&v)) return "$" + quoteString(interp->text);
    if (auto list = std::get_if<SettingList>(&v)) return joinList(*list);
    return joinDict(std::get<SettingDict>(v));
}

std::string formatSetting(const Setting& setting) {
    return setting.name + " = " + formatValue(setting.value);
}

// ============================================================================
// ValueReader
// ============================================================================

ValueReader::ValueReader(const std::string& text, size_t pos)
    : m_text(text), m_pos(pos) {}

void ValueReader::skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(m_text[m_pos]))) {
        m_pos++;
    }
}

void ValueReader::expect(char c) {
    skipWhitespace();
    if (peek() != c) {
        throw std::invalid_argument(std::string("expected '") + c + "'");
    }
    m_pos++;
}

std::string ValueReader::readToken() {
    skipWhitespace();
    size_t start = m_pos;
    while (!atEnd() && !std::isspace(static_cast<unsigned char>(m_text[m_pos]))) {
        m_pos++;
    }
    return m_text.substr(start, m_pos - start);
}

std::string ValueReader::readQuoted() {
    expect('"');
    std::string out;
    while (true) {
        if (atEnd()) {
            throw std::invalid_argument("unterminated string literal");
        }
        char c = m_text[m_pos++];
        if (c == '"') break;
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (atEnd()) {
            throw std::invalid_argument("unterminated escape sequence");
        }
        char escaped = m_text[m_pos++];
        switch (escaped) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            default:
                throw std::invalid_argument(std::string("unknown escape sequence \\") + escaped);
        }
    }
    return out;
}

VariableRef ValueReader::readVariable() {
    expect('@');
    size_t start = m_pos;
    while (!atEnd() && isVariableChar(m_text[m_pos])) {
        m_pos++;
    }
    if (m_pos == start) {
        throw std::invalid_argument("expected variable name after '@'");
    }
    std::string name = m_text.substr(start, m_pos - start);
    if (!text::isVariablePath(name)) {
        throw std::invalid_argument("'" + name + "' is not a valid variable name");
    }
    return VariableRef{name};
}

SettingValue ValueReader::readElement() {
    skipWhitespace();
    switch (peek()) {
        case '"':
            return SettingValue(readQuoted());
        case '@':
            return SettingValue(readVariable());
        case '$':
            m_pos++;
            return SettingValue(Interpolated{readQuoted()});
        default:
            throw std::invalid_argument("expected a string, variable or interpolated string");
    }
}

SettingList ValueReader::readList() {
    expect('[');
    SettingList list;
    skipWhitespace();
    if (peek() == ']') {
        m_pos++;
        return list;
    }
    while (true) {
        list.push_back(readElement());
        skipWhitespace();
        if (peek() == ',') {
            m_pos++;
            continue;
        }
        expect(']');
        return list;
    }
}

SettingDict ValueReader::readDict() {
    expect('{');
    SettingDict dict;
    skipWhitespace();
    if (peek() == '}') {
        m_pos++;
        return dict;
    }
    while (true) {
        expect('(');
        skipWhitespace();
        std::string key = readQuoted();
        expect(',');
        SettingValue value = readElement();
        expect(')');
        dict.emplace_back(std::move(key), std::move(value));

        skipWhitespace();
        if (peek() == ',') {
            m_pos++;
            continue;
        }
        expect('}');
        return dict;
    }
}

SettingValue ValueReader::readFixed(const ParamSchema& param) {
    switch (param.type) {
        case ParamType::String:
            return SettingValue(readQuoted());

        case ParamType::Int: {
            std::string token = readToken();
            try {
                size_t used = 0;
                int value = std::stoi(token, &used);
                if (used == token.size()) return SettingValue(value);
            } catch (const std::logic_error&) {
                // reported below
            }
            throw std::invalid_argument("'" + token + "' is not a valid integer");
        }

        case ParamType::Float: {
            std::string token = readToken();
            try {
                size_t used = 0;
                double value = std::stod(token, &used);
                if (used == token.size() && std::isfinite(value)) return SettingValue(value);
            } catch (const std::logic_error&) {
                // reported below
            }
            throw std::invalid_argument("'" + token + "' is not a valid number");
        }

        case ParamType::Bool: {
            std::string token = readToken();
            if (text::iequals(token, "True")) return SettingValue(true);
            if (text::iequals(token, "False")) return SettingValue(false);
            throw std::invalid_argument("'" + token + "' is not a valid boolean");
        }

        case ParamType::Enum: {
            std::string token = readToken();
            if (!param.allowsEnumValue(token)) {
                throw std::invalid_argument("'" + token + "' is not a value of " + param.enumType);
            }
            return SettingValue(EnumValue{token});
        }

        case ParamType::ByteArray: {
            std::string token = readToken();
            auto bytes = text::base64Decode(token);
            if (!bytes) {
                throw std::invalid_argument("'" + token + "' is not valid base64");
            }
            return SettingValue(*bytes);
        }

        case ParamType::ListOfStrings:
            return SettingValue(readList());

        case ParamType::DictOfStrings:
            return SettingValue(readDict());
    }
    throw std::invalid_argument("unsupported parameter type");
}

SettingValue ValueReader::read(const ParamSchema& param) {
    skipWhitespace();

    if (peek() == '@') {
        return SettingValue(readVariable());
    }

    if (peek() == '$') {
        if (param.type != ParamType::String) {
            throw std::invalid_argument("interpolation is only allowed for String parameters, '" +
                                        param.name + "' is " + descriptors::paramTypeToString(param.type));
        }
        m_pos++;
        return SettingValue(Interpolated{readQuoted()});
    }

    return readFixed(param);
}

Setting parseSettingLine(const std::string& line, const descriptors::BlockDescriptor& descriptor) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("expected '<name> = <value>'");
    }

    std::string name = text::trim(line.substr(0, eq));
    if (!text::isIdentifier(name)) {
        throw std::invalid_argument("invalid setting name '" + name + "'");
    }

    const ParamSchema* param = descriptor.findParameter(name);
    if (param == nullptr) {
        throw std::invalid_argument("'" + name + "' is not a parameter of " + descriptor.id);
    }

    ValueReader reader(line, eq + 1);
    SettingValue value = reader.read(*param);

    reader.skipWhitespace();
    if (!reader.atEnd()) {
        throw std::invalid_argument("unexpected text after value: " + reader.remaining());
    }

    return Setting{name, std::move(value)};
}

} // namespace settings
} // namespace block_script
