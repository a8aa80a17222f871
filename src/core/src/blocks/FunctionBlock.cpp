/**
 * @file FunctionBlock.cpp
 */

#include "FunctionBlock.hpp"
#include "../codegen/CSharpWriter.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"

namespace block_script {
namespace blocks {

FunctionBlock::FunctionBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor)
    : BlockBase(std::move(descriptor)) {
    if (this->descriptor().returnsValue()) {
        const std::string& def = this->descriptor().defaultOutputVariable;
        setOutputVariable(def.empty() ? id() + "Output" : def);
    }
}

void FunctionBlock::setOutputVariable(const std::string& name) {
    m_outputVariable = text::makeValidVariableName(name);
}

std::vector<std::string> FunctionBlock::serialize(const SerializeOptions& options) const {
    std::vector<std::string> out;
    writeHeader(out);
    writeSettings(out, options);

    if (descriptor().returnsValue()) {
        out.push_back(formatOutputDeclaration(m_outputVariable, m_isCapture));
    }
    return out;
}

void FunctionBlock::deserialize(const std::vector<SourceLine>& lines) {
    for (size_t i = readHeader(lines); i < lines.size(); ++i) {
        const SourceLine& line = lines[i];
        std::string trimmed = text::trim(line.text);

        if (trimmed.empty()) continue;

        if (text::startsWith(trimmed, "=>")) {
            if (!descriptor().returnsValue()) {
                throw ParseError("Block " + id() + " does not return a value", line.number, trimmed);
            }
            std::string variable;
            m_isCapture = readOutputDeclaration(line, variable);
            setOutputVariable(variable);
        } else {
            readSettingLine(line);
        }
    }
}

std::string FunctionBlock::generate(codegen::GenerationContext& context) const {
    validateSettings();

    const auto& d = descriptor();
    if (d.method.empty()) {
        throw UnsupportedOperationError("Block has no runtime method to call", sourceLine(), id());
    }

    std::vector<std::string> arguments = {"data"};
    for (const auto& param : d.parameters) {
        arguments.push_back(resolveSetting(param.name));
    }

    std::string call = (d.async ? "await " : "") + d.method + "(" + codegen::joinArguments(arguments) + ")";

    if (!d.returnsValue()) {
        return call + ";\n";
    }

    std::string code = assignmentTarget(m_outputVariable, context) + call + ";\n";
    if (m_isCapture) {
        code += "data.MarkForCapture(nameof(" + m_outputVariable + "));\n";
    }
    return code;
}

bool FunctionBlock::operator==(const FunctionBlock& other) const {
    return baseEquals(other) &&
           m_outputVariable == other.m_outputVariable &&
           m_isCapture == other.m_isCapture;
}

} // namespace blocks
} // namespace block_script
