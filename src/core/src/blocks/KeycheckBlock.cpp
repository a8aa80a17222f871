/**
 * @file KeycheckBlock.cpp
 */

#include "KeycheckBlock.hpp"
#include "../codegen/CSharpWriter.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"
#include "../settings/SettingNotation.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace block_script {
namespace blocks {

using descriptors::ParamSchema;
using descriptors::ParamType;

namespace {

const std::vector<std::string> kNumberComparisons = {
    "EqualTo", "NotEqualTo", "LessThan", "LessThanOrEqualTo", "GreaterThan", "GreaterThanOrEqualTo"};

const std::array<KeyTypeInfo, 4>& keyTypeTable() {
    static const std::array<KeyTypeInfo, 4> table = {{
        {KeyType::String, "STRINGKEY", "StrComparison", ParamType::String,
         {"EqualTo", "NotEqualTo", "Contains", "DoesNotContain", "MatchesRegex", "DoesNotMatchRegex"}},
        {KeyType::Int, "INTKEY", "NumComparison", ParamType::Int, kNumberComparisons},
        {KeyType::Float, "FLOATKEY", "NumComparison", ParamType::Float, kNumberComparisons},
        {KeyType::Bool, "BOOLKEY", "BoolComparison", ParamType::Bool, {"Is", "IsNot"}},
    }};
    return table;
}

ParamSchema operandSchema(const KeyTypeInfo& info) {
    return ParamSchema{"key", info.valueType, settings::SettingValue(), "", {}};
}

bool isStatusToken(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // namespace

const KeyTypeInfo& keyTypeInfo(KeyType type) {
    for (const auto& info : keyTypeTable()) {
        if (info.type == type) return info;
    }
    throw std::out_of_range("Unknown key type");
}

const KeyTypeInfo* findKeyType(const std::string& token) {
    for (const auto& info : keyTypeTable()) {
        if (token == info.token) return &info;
    }
    return nullptr;
}

KeycheckBlock::KeycheckBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor)
    : BlockBase(std::move(descriptor)) {}

std::vector<std::string> KeycheckBlock::serialize(const SerializeOptions& options) const {
    std::vector<std::string> out;
    writeHeader(out);
    writeSettings(out, options);

    for (const auto& keychain : m_keychains) {
        out.push_back("KEYCHAIN " + keychain.resultStatus + " " +
                      (keychain.mode == KeychainMode::OR ? "OR" : "AND"));
        for (const auto& key : keychain.keys) {
            out.push_back(std::string("  ") + keyTypeInfo(key.type).token + " " +
                          settings::formatValue(key.left) + " " + key.comparison + " " +
                          settings::formatValue(key.right));
        }
    }
    return out;
}

Keychain KeycheckBlock::readKeychain(const SourceLine& line) const {
    std::string trimmed = text::trim(line.text);
    settings::ValueReader reader(trimmed);

    reader.readToken();  // KEYCHAIN
    Keychain keychain;
    keychain.resultStatus = reader.readToken();
    std::string mode = reader.readToken();
    reader.skipWhitespace();

    if (!isStatusToken(keychain.resultStatus) || !reader.atEnd()) {
        throw ParseError("The keychain declaration is in the wrong format", line.number, trimmed);
    }

    if (mode == "OR") {
        keychain.mode = KeychainMode::OR;
    } else if (mode == "AND") {
        keychain.mode = KeychainMode::AND;
    } else {
        throw ParseError("Could not understand the keychain mode", line.number, trimmed);
    }
    return keychain;
}

Key KeycheckBlock::readKey(const SourceLine& line, const KeyTypeInfo& info) const {
    std::string trimmed = text::trim(line.text);
    ParamSchema schema = operandSchema(info);

    try {
        settings::ValueReader reader(trimmed);
        reader.readToken();  // STRINGKEY / INTKEY / ...

        Key key;
        key.type = info.type;
        key.left = reader.read(schema);
        key.comparison = reader.readToken();
        if (std::find(info.comparisons.begin(), info.comparisons.end(), key.comparison) == info.comparisons.end()) {
            throw std::invalid_argument("'" + key.comparison + "' is not a valid " + info.comparisonEnum);
        }
        key.right = reader.read(schema);

        reader.skipWhitespace();
        if (!reader.atEnd()) {
            throw std::invalid_argument("unexpected text after key: " + reader.remaining());
        }
        return key;

    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("Could not parse the key (") + e.what() + ")", line.number, trimmed);
    }
}

void KeycheckBlock::deserialize(const std::vector<SourceLine>& lines) {
    for (size_t i = readHeader(lines); i < lines.size(); ++i) {
        const SourceLine& line = lines[i];
        std::string trimmed = text::trim(line.text);

        if (trimmed.empty()) continue;

        std::string first = trimmed.substr(0, trimmed.find_first_of(" \t"));

        if (first == "KEYCHAIN") {
            m_keychains.push_back(readKeychain(line));
        } else if (const KeyTypeInfo* info = findKeyType(first)) {
            if (m_keychains.empty()) {
                throw ParseError("Key declared outside of a keychain", line.number, trimmed);
            }
            m_keychains.back().keys.push_back(readKey(line, *info));
        } else {
            readSettingLine(line);
        }
    }
}

std::string KeycheckBlock::condition(const Keychain& keychain) const {
    if (keychain.keys.empty()) {
        // Empty OR never matches, empty AND always does
        return keychain.mode == KeychainMode::OR ? "false" : "true";
    }

    std::vector<std::string> checks;
    for (const auto& key : keychain.keys) {
        const KeyTypeInfo& info = keyTypeInfo(key.type);
        ParamSchema schema = operandSchema(info);
        checks.push_back("CheckCondition(data, " + codegen::resolve(key.left, schema) + ", " +
                         info.comparisonEnum + "." + key.comparison + ", " +
                         codegen::resolve(key.right, schema) + ")");
    }

    std::string op = keychain.mode == KeychainMode::OR ? " || " : " && ";
    std::string out;
    for (size_t i = 0; i < checks.size(); ++i) {
        if (i > 0) out += op;
        out += checks[i];
    }
    return out;
}

std::string KeycheckBlock::generate(codegen::GenerationContext& /*context*/) const {
    validateSettings();

    std::string code;
    for (size_t i = 0; i < m_keychains.size(); ++i) {
        const Keychain& keychain = m_keychains[i];
        code += (i == 0 ? "if (" : "else if (") + condition(keychain) + ")\n";
        code += "{\n    data.STATUS = " + codegen::stringLiteral(keychain.resultStatus) + ";\n}\n";
    }

    if (!descriptor().hasParameter("banIfNoMatch")) {
        return code;
    }

    const settings::SettingValue& ban = setting("banIfNoMatch").value;
    if (ban.is<bool>() && !ban.as<bool>()) {
        return code;
    }

    std::string banStatement = "{\n    data.STATUS = \"BAN\";\n}\n";
    if (ban.is<bool>()) {
        code += m_keychains.empty() ? banStatement : "else\n" + banStatement;
    } else {
        code += std::string(m_keychains.empty() ? "if (" : "else if (") +
                resolveSetting("banIfNoMatch") + ")\n" + banStatement;
    }
    return code;
}

bool KeycheckBlock::operator==(const KeycheckBlock& other) const {
    return baseEquals(other) && m_keychains == other.m_keychains;
}

} // namespace blocks
} // namespace block_script
