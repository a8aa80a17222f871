#pragma once

/**
 * @file SettingNotation.hpp
 * @brief Textual notation of setting values in block scripts
 *
 *   "text"                    fixed string (\" \\ \n \r \t escapes)
 *   42 / 1.5 / True           fixed int, float, bool
 *   MD5                       enum value (bare token)
 *   AAEC                      byte array (base64)
 *   @name                     variable reference
 *   $"user=<name>"            interpolated string
 *   ["a", @b, $"<c>"]         list of strings
 *   {("key", "value"), ...}   dictionary of strings
 *
 * Parse failures throw std::invalid_argument; block parsers turn them into
 * line-tagged ParseErrors.
 */

#include "SettingValue.hpp"
#include "../descriptors/BlockDescriptor.hpp"
#include <string>

namespace block_script {
namespace settings {

std::string formatValue(const SettingValue& value);

// "<name> = <value>"
std::string formatSetting(const Setting& setting);

std::string quoteString(const std::string& s);
std::string formatFloat(double value);

/**
 * Cursor over a line of script text that reads setting values
 */
class ValueReader {
public:
    explicit ValueReader(const std::string& text, size_t pos = 0);

    /**
     * Read a value for the given parameter, rejecting shapes its type
     * does not accept
     */
    SettingValue read(const descriptors::ParamSchema& param);

    /**
     * Read a whitespace-delimited bare token (may be empty at end of input)
     */
    std::string readToken();

    void skipWhitespace();
    bool atEnd() const { return m_pos >= m_text.size(); }
    size_t position() const { return m_pos; }
    std::string remaining() const { return m_text.substr(m_pos); }

private:
    char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }
    void expect(char c);

    std::string readQuoted();
    VariableRef readVariable();
    SettingValue readElement();
    SettingList readList();
    SettingDict readDict();
    SettingValue readFixed(const descriptors::ParamSchema& param);

    std::string m_text;
    size_t m_pos = 0;
};

/**
 * Parse a "<name> = <value>" line against a descriptor
 * @throws std::invalid_argument if the name is not a parameter of the
 *         descriptor or the value is malformed or of the wrong type
 */
Setting parseSettingLine(const std::string& line, const descriptors::BlockDescriptor& descriptor);

} // namespace settings
} // namespace block_script
