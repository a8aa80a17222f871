#pragma once

/**
 * @file TextUtils.hpp
 * @brief String helpers shared by the codec and the code generator
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace block_script {
namespace text {

constexpr size_t kMaxExcerptLength = 50;

// Prefix of variables living in the runtime's persistent global store
constexpr const char* kGlobalsPrefix = "globals.";

std::string trim(const std::string& s);
bool startsWith(const std::string& s, const std::string& prefix);
bool iequals(const std::string& a, const std::string& b);

/**
 * Shorten a string to at most max_length bytes, marking the cut with
 * "...". The cut never lands inside a UTF-8 sequence.
 */
std::string truncatePretty(const std::string& s, size_t max_length);

/**
 * Split text into lines. "\r\n" and "\n" both terminate a line; a final
 * line without terminator is kept.
 */
std::vector<std::string> splitLines(const std::string& text);

bool isGlobalVariable(const std::string& name);

// [A-Za-z_][A-Za-z0-9_]*
bool isIdentifier(const std::string& s);

// Dot-separated identifiers, e.g. data.SOURCE or globals.token
bool isVariablePath(const std::string& s);

/**
 * Turn an arbitrary string into a valid host-language identifier.
 * Characters other than [A-Za-z0-9_] are dropped and a leading digit gets
 * an underscore prefix. The "globals." prefix is preserved and only the
 * remainder is sanitized.
 */
std::string makeValidVariableName(const std::string& name);

std::string base64Encode(const std::vector<std::uint8_t>& data);
std::optional<std::vector<std::uint8_t>> base64Decode(const std::string& encoded);

} // namespace text
} // namespace block_script
