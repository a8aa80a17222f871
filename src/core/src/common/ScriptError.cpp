/**
 * @file ScriptError.cpp
 */

#include "ScriptError.hpp"
#include "TextUtils.hpp"

namespace block_script {

ScriptError::ScriptError(const std::string& message, int line, const std::string& excerpt)
    : std::runtime_error(format(message, line, excerpt))
    , m_line(line)
    , m_excerpt(text::truncatePretty(excerpt, text::kMaxExcerptLength))
    , m_detail(message) {}

std::string ScriptError::format(const std::string& message, int line, const std::string& excerpt) {
    std::string result;
    if (line > 0) {
        result = "Line " + std::to_string(line) + ": ";
    }
    result += message;
    if (!excerpt.empty()) {
        result += ": " + text::truncatePretty(excerpt, text::kMaxExcerptLength);
    }
    return result;
}

} // namespace block_script
