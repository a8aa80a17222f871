#pragma once

/**
 * @file RawCodeBlock.hpp
 * @brief Block holding host-language statements emitted verbatim
 */

#include "BlockBase.hpp"

namespace block_script {
namespace blocks {

class RawCodeBlock : public BlockBase {
public:
    explicit RawCodeBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    const std::vector<std::string>& lines() const { return m_lines; }
    void setCode(const std::string& code);
    std::string code() const;

    std::vector<std::string> serialize(const SerializeOptions& options = {}) const;
    void deserialize(const std::vector<SourceLine>& lines);
    std::string generate(codegen::GenerationContext& context) const;

    bool operator==(const RawCodeBlock& other) const;
    bool operator!=(const RawCodeBlock& other) const { return !(*this == other); }

private:
    void assignLines(std::vector<std::string> lines);

    std::vector<std::string> m_lines;
};

} // namespace blocks
} // namespace block_script
