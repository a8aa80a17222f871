#pragma once

/**
 * @file FunctionBlock.hpp
 * @brief Block calling a runtime function with its settings as arguments
 *
 * Covers every descriptor of the Function family (hashing, encryption,
 * HTTP requests, catalog-defined functions). Descriptors that return a
 * value take an output declaration:
 *
 *   BLOCK:HashString
 *     input = @password
 *     hashFunction = SHA256
 *     => VAR @hashed
 */

#include "BlockBase.hpp"

namespace block_script {
namespace blocks {

class FunctionBlock : public BlockBase {
public:
    explicit FunctionBlock(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    const std::string& outputVariable() const { return m_outputVariable; }
    void setOutputVariable(const std::string& name);

    bool isCapture() const { return m_isCapture; }
    void setCapture(bool capture) { m_isCapture = capture; }

    std::vector<std::string> serialize(const SerializeOptions& options = {}) const;
    void deserialize(const std::vector<SourceLine>& lines);
    std::string generate(codegen::GenerationContext& context) const;

    bool operator==(const FunctionBlock& other) const;
    bool operator!=(const FunctionBlock& other) const { return !(*this == other); }

private:
    std::string m_outputVariable;
    bool m_isCapture = false;
};

} // namespace blocks
} // namespace block_script
