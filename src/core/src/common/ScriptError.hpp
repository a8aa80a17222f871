#pragma once

/**
 * @file ScriptError.hpp
 * @brief Exceptions raised while decoding, encoding or compiling block scripts
 *
 * Every error carries the 1-based source line it refers to (0 when the
 * block was built in memory and has no source) and a short excerpt of the
 * offending text for editor-level display.
 */

#include <stdexcept>
#include <string>

namespace block_script {

class ScriptError : public std::runtime_error {
public:
    ScriptError(const std::string& message, int line, const std::string& excerpt);

    int line() const { return m_line; }
    const std::string& excerpt() const { return m_excerpt; }

    // Message without the "Line N: " prefix
    const std::string& detail() const { return m_detail; }

private:
    static std::string format(const std::string& message, int line, const std::string& excerpt);

    int m_line;
    std::string m_excerpt;
    std::string m_detail;
};

// Block id with no registered descriptor
class UnknownKindError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

// Malformed script text
class ParseError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

// Setting whose name is not a parameter of the block's descriptor
class InvalidSettingError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

// Generation requested for a kind/mode combination with no mapping
class UnsupportedOperationError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

} // namespace block_script
