#pragma once

/**
 * @file BlockBase.hpp
 * @brief State and text/code helpers shared by every block kind
 */

#include "../codegen/GenerationContext.hpp"
#include "../common/SourceLine.hpp"
#include "../descriptors/BlockDescriptor.hpp"
#include "../settings/SettingValue.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace block_script {
namespace blocks {

struct SerializeOptions {
    bool printDefaults = true;    // Write settings still equal to their default
};

/**
 * Common part of a block instance: identity, label, disabled flag and the
 * settings seeded from the descriptor defaults.
 */
class BlockBase {
public:
    explicit BlockBase(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    const std::string& id() const { return m_descriptor->id; }
    const descriptors::BlockDescriptor& descriptor() const { return *m_descriptor; }

    const std::string& label() const { return m_label; }
    void setLabel(const std::string& label) { m_label = label; }

    bool isDisabled() const { return m_disabled; }
    void setDisabled(bool disabled) { m_disabled = disabled; }

    const std::map<std::string, settings::Setting>& settings() const { return m_settings; }

    /**
     * @throws InvalidSettingError if no setting has this name
     */
    const settings::Setting& setting(const std::string& name) const;

    /**
     * Bind a value. Names are checked against the descriptor on
     * serialize and generate, not here.
     */
    void setSetting(const std::string& name, settings::SettingValue value);
    bool removeSetting(const std::string& name) { return m_settings.erase(name) > 0; }

    // Line of the BLOCK: header this instance was decoded from, 0 if none
    int sourceLine() const { return m_sourceLine; }
    void setSourceLine(int line) { m_sourceLine = line; }

protected:
    void writeHeader(std::vector<std::string>& out) const;
    void writeSettings(std::vector<std::string>& out, const SerializeOptions& options) const;

    /**
     * Consume leading DISABLED / LABEL: lines (and blank lines)
     * @return index of the first line that is not part of the header
     */
    size_t readHeader(const std::vector<SourceLine>& lines);

    void readSettingLine(const SourceLine& line);

    /**
     * Parse "=> VAR|CAP @name"
     * @return true when the declaration is a capture
     */
    bool readOutputDeclaration(const SourceLine& line, std::string& variable) const;
    std::string formatOutputDeclaration(const std::string& variable, bool capture) const;

    /**
     * @throws InvalidSettingError for a setting with no matching parameter
     */
    void validateSettings() const;

    // C# expression of a setting
    std::string resolveSetting(const std::string& name) const;

    /**
     * "var name = " for the first non-disabled assignment of a local,
     * "name = " for redefinitions and globals
     */
    std::string assignmentTarget(const std::string& variable, codegen::GenerationContext& context) const;

    bool baseEquals(const BlockBase& other) const;

private:
    std::shared_ptr<const descriptors::BlockDescriptor> m_descriptor;
    std::string m_label;
    bool m_disabled = false;
    std::map<std::string, settings::Setting> m_settings;
    int m_sourceLine = 0;
};

} // namespace blocks
} // namespace block_script
