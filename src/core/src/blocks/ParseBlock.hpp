#pragma once

/**
 * @file ParseBlock.hpp
 * @brief Block extracting data from a string into an output variable
 *
 *   BLOCK:Parse
 *     RECURSIVE
 *     MODE:LR
 *     input = "hello how are you"
 *     leftDelim = "hello"
 *     rightDelim = "you"
 *     => CAP @parsed
 */

#include "BlockBase.hpp"
#include <array>
#include <optional>

namespace block_script {
namespace blocks {

enum class ParseMode {
    LR,
    CSS,
    Json,
    Regex
};

/**
 * Runtime callee and mode-specific arguments of a parse mode. The call is
 * (data, input, <arguments...>, prefix, suffix).
 */
struct ParseModeInfo {
    ParseMode mode;
    const char* name;
    const char* callee;
    std::vector<const char*> arguments;
};

const std::array<ParseModeInfo, 4>& parseModeTable();
const ParseModeInfo& parseModeInfo(ParseMode mode);
std::optional<ParseMode> parseModeFromString(const std::string& name);
std::string parseModeToString(ParseMode mode);

class ParseBlock : public BlockBase {
public:
    explicit ParseBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    const std::string& outputVariable() const { return m_outputVariable; }
    void setOutputVariable(const std::string& name);

    bool isRecursive() const { return m_recursive; }
    void setRecursive(bool recursive) { m_recursive = recursive; }

    bool isCapture() const { return m_isCapture; }
    void setCapture(bool capture) { m_isCapture = capture; }

    ParseMode mode() const { return m_mode; }
    void setMode(ParseMode mode) { m_mode = mode; }

    std::vector<std::string> serialize(const SerializeOptions& options = {}) const;
    void deserialize(const std::vector<SourceLine>& lines);
    std::string generate(codegen::GenerationContext& context) const;

    bool operator==(const ParseBlock& other) const;
    bool operator!=(const ParseBlock& other) const { return !(*this == other); }

private:
    std::string argument(const std::string& name) const;

    std::string m_outputVariable = "parseOutput";
    bool m_recursive = false;
    bool m_isCapture = false;
    ParseMode m_mode = ParseMode::LR;
};

} // namespace blocks
} // namespace block_script
