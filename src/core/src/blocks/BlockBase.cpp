/**
 * @file BlockBase.cpp
 */

#include "BlockBase.hpp"
#include "../codegen/CSharpWriter.hpp"
#include "../common/ScriptError.hpp"
#include "../common/TextUtils.hpp"
#include "../settings/SettingNotation.hpp"
#include <stdexcept>

namespace block_script {
namespace blocks {

using settings::Setting;
using settings::SettingValue;

BlockBase::BlockBase(std::shared_ptr<const descriptors::BlockDescriptor> descriptor)
    : m_descriptor(std::move(descriptor)) {
    if (!m_descriptor) {
        throw std::invalid_argument("Block descriptor must not be null");
    }

    m_label = m_descriptor->name;
    for (const auto& param : m_descriptor->parameters) {
        m_settings[param.name] = Setting{param.name, param.defaultValue};
    }
}

const Setting& BlockBase::setting(const std::string& name) const {
    auto it = m_settings.find(name);
    if (it == m_settings.end()) {
        throw InvalidSettingError("Missing setting in block " + id(), m_sourceLine, name);
    }
    return it->second;
}

void BlockBase::setSetting(const std::string& name, SettingValue value) {
    m_settings[name] = Setting{name, std::move(value)};
}

void BlockBase::writeHeader(std::vector<std::string>& out) const {
    if (m_disabled) {
        out.push_back("DISABLED");
    }
    if (m_label != m_descriptor->name) {
        out.push_back("LABEL:" + m_label);
    }
}

void BlockBase::writeSettings(std::vector<std::string>& out, const SerializeOptions& options) const {
    validateSettings();

    for (const auto& param : m_descriptor->parameters) {
        auto it = m_settings.find(param.name);
        if (it == m_settings.end()) continue;
        if (!options.printDefaults && it->second.value == param.defaultValue) continue;
        out.push_back(settings::formatSetting(it->second));
    }
}

size_t BlockBase::readHeader(const std::vector<SourceLine>& lines) {
    size_t i = 0;
    for (; i < lines.size(); ++i) {
        std::string line = text::trim(lines[i].text);
        if (line.empty()) continue;

        if (line == "DISABLED") {
            m_disabled = true;
        } else if (text::startsWith(line, "LABEL:")) {
            m_label = line.substr(6);
        } else {
            break;
        }
    }
    return i;
}

void BlockBase::readSettingLine(const SourceLine& line) {
    std::string trimmed = text::trim(line.text);
    try {
        Setting setting = settings::parseSettingLine(trimmed, *m_descriptor);
        m_settings[setting.name] = std::move(setting);
    } catch (const std::invalid_argument& e) {
        throw ParseError(std::string("Could not parse the setting (") + e.what() + ")", line.number, trimmed);
    }
}

bool BlockBase::readOutputDeclaration(const SourceLine& line, std::string& variable) const {
    std::string trimmed = text::trim(line.text);
    const std::string message = "The output variable declaration is in the wrong format";

    // "=> " + 3-letter kind + " " + rest
    if (trimmed.size() < 7 || trimmed.compare(0, 3, "=> ") != 0 || trimmed[6] != ' ') {
        throw ParseError(message, line.number, trimmed);
    }

    std::string kind = trimmed.substr(3, 3);
    bool capture = text::iequals(kind, "CAP");
    if (!capture && !text::iequals(kind, "VAR")) {
        throw ParseError(message, line.number, trimmed);
    }

    std::string target = text::trim(trimmed.substr(7));
    if (target.size() < 2 || target[0] != '@') {
        throw ParseError(message, line.number, trimmed);
    }

    variable = text::trim(target.substr(1));
    return capture;
}

std::string BlockBase::formatOutputDeclaration(const std::string& variable, bool capture) const {
    return std::string("=> ") + (capture ? "CAP" : "VAR") + " @" + variable;
}

void BlockBase::validateSettings() const {
    for (const auto& entry : m_settings) {
        if (!m_descriptor->hasParameter(entry.first)) {
            throw InvalidSettingError("This setting is not a valid input parameter of " + id(),
                                      m_sourceLine, entry.first);
        }
    }
}

std::string BlockBase::resolveSetting(const std::string& name) const {
    const auto* param = m_descriptor->findParameter(name);
    if (param == nullptr) {
        throw InvalidSettingError("This setting is not a valid input parameter of " + id(), m_sourceLine, name);
    }
    return codegen::resolve(setting(name).value, *param);
}

std::string BlockBase::assignmentTarget(const std::string& variable, codegen::GenerationContext& context) const {
    if (context.variables.contains(variable) || text::isGlobalVariable(variable)) {
        return variable + " = ";
    }

    if (!m_disabled) {
        context.variables.add(variable);
    }
    return "var " + variable + " = ";
}

bool BlockBase::baseEquals(const BlockBase& other) const {
    return id() == other.id() &&
           m_label == other.m_label &&
           m_disabled == other.m_disabled &&
           m_settings == other.m_settings;
}

} // namespace blocks
} // namespace block_script
