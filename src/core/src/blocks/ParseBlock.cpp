/**
 * @file ParseBlock.cpp
 */

#include "ParseBlock.hpp"
#include "../codegen/CSharpWriter.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"

namespace block_script {
namespace blocks {

const std::array<ParseModeInfo, 4>& parseModeTable() {
    static const std::array<ParseModeInfo, 4> table = {{
        {ParseMode::LR, "LR", "ParseBetweenStrings", {"leftDelim", "rightDelim", "caseSensitive"}},
        {ParseMode::CSS, "CSS", "QueryCssSelector", {"cssSelector", "attributeName"}},
        {ParseMode::Json, "Json", "QueryJsonToken", {"jToken"}},
        {ParseMode::Regex, "Regex", "MatchRegexGroups", {"pattern", "outputFormat"}},
    }};
    return table;
}

const ParseModeInfo& parseModeInfo(ParseMode mode) {
    for (const auto& info : parseModeTable()) {
        if (info.mode == mode) return info;
    }
    throw UnsupportedOperationError("Parse mode has no code generation mapping", 0,
                                    std::to_string(static_cast<int>(mode)));
}

std::optional<ParseMode> parseModeFromString(const std::string& name) {
    for (const auto& info : parseModeTable()) {
        if (name == info.name) return info.mode;
    }
    return std::nullopt;
}

std::string parseModeToString(ParseMode mode) {
    return parseModeInfo(mode).name;
}

ParseBlock::ParseBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor)
    : BlockBase(std::move(descriptor)) {}

void ParseBlock::setOutputVariable(const std::string& name) {
    m_outputVariable = text::makeValidVariableName(name);
}

std::vector<std::string> ParseBlock::serialize(const SerializeOptions& options) const {
    std::vector<std::string> out;
    writeHeader(out);

    if (m_recursive) {
        out.push_back("RECURSIVE");
    }
    out.push_back("MODE:" + parseModeToString(m_mode));

    writeSettings(out, options);

    out.push_back(formatOutputDeclaration(m_outputVariable, m_isCapture));
    return out;
}

void ParseBlock::deserialize(const std::vector<SourceLine>& lines) {
    bool has_mode = false;

    for (size_t i = readHeader(lines); i < lines.size(); ++i) {
        const SourceLine& line = lines[i];
        std::string trimmed = text::trim(line.text);

        if (trimmed.empty()) continue;

        if (text::startsWith(trimmed, "RECURSIVE")) {
            m_recursive = true;
        } else if (text::startsWith(trimmed, "MODE")) {
            // MODE:<letters>
            std::string token;
            if (trimmed.size() > 5 && trimmed[4] == ':') {
                token = trimmed.substr(5);
            }
            auto mode = parseModeFromString(token);
            if (!mode) {
                throw ParseError("Could not understand the parsing mode", line.number, trimmed);
            }
            m_mode = *mode;
            has_mode = true;
        } else if (text::startsWith(trimmed, "=>")) {
            std::string variable;
            m_isCapture = readOutputDeclaration(line, variable);
            setOutputVariable(variable);
        } else {
            readSettingLine(line);
        }
    }

    if (!has_mode) {
        throw ParseError("Missing MODE line in parse block", sourceLine(), "BLOCK:" + id());
    }
}

std::string ParseBlock::argument(const std::string& name) const {
    if (!descriptor().hasParameter(name)) {
        throw UnsupportedOperationError("Parse mode " + parseModeToString(m_mode) +
                                        " needs a parameter the descriptor of " + id() + " does not declare",
                                        sourceLine(), name);
    }
    return resolveSetting(name);
}

std::string ParseBlock::generate(codegen::GenerationContext& context) const {
    validateSettings();

    const ParseModeInfo& info = parseModeInfo(m_mode);

    std::vector<std::string> arguments = {"data", argument("input")};
    for (const char* name : info.arguments) {
        arguments.push_back(argument(name));
    }
    arguments.push_back(argument("prefix"));
    arguments.push_back(argument("suffix"));

    std::string callee = info.callee;
    if (m_recursive) {
        callee += "Recursive";
    }

    std::string code = assignmentTarget(m_outputVariable, context) +
                       callee + "(" + codegen::joinArguments(arguments) + ");\n";

    if (m_isCapture) {
        code += "data.MarkForCapture(nameof(" + m_outputVariable + "));\n";
    }

    return code;
}

bool ParseBlock::operator==(const ParseBlock& other) const {
    return baseEquals(other) &&
           m_outputVariable == other.m_outputVariable &&
           m_recursive == other.m_recursive &&
           m_isCapture == other.m_isCapture &&
           m_mode == other.m_mode;
}

} // namespace blocks
} // namespace block_script
