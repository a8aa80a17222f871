/**
 * @file BlockInstance.cpp
 */

#include "BlockInstance.hpp"
#include "../common/ScriptError.hpp"

namespace block_script {
namespace blocks {

using descriptors::BlockFamily;

BlockInstance BlockInstance::create(std::shared_ptr<const descriptors::BlockDescriptor> descriptor) {
    if (!descriptor) {
        throw std::invalid_argument("Block descriptor must not be null");
    }

    switch (descriptor->family) {
        case BlockFamily::Parse: return BlockInstance(ParseBlock(std::move(descriptor)));
        case BlockFamily::Function: return BlockInstance(FunctionBlock(std::move(descriptor)));
        case BlockFamily::Keycheck: return BlockInstance(KeycheckBlock(std::move(descriptor)));
        case BlockFamily::RawCode: return BlockInstance(RawCodeBlock(std::move(descriptor)));
    }
    throw UnsupportedOperationError("Block family has no instance type", 0, descriptor->id);
}

BlockBase& BlockInstance::base() {
    return std::visit([](auto& block) -> BlockBase& { return block; }, m_block);
}

const BlockBase& BlockInstance::base() const {
    return std::visit([](const auto& block) -> const BlockBase& { return block; }, m_block);
}

std::vector<std::string> BlockInstance::serialize(const SerializeOptions& options) const {
    return std::visit([&options](const auto& block) { return block.serialize(options); }, m_block);
}

void BlockInstance::deserialize(const std::vector<SourceLine>& lines) {
    std::visit([&lines](auto& block) { block.deserialize(lines); }, m_block);
}

std::string BlockInstance::generate(codegen::GenerationContext& context) const {
    return std::visit([&context](const auto& block) { return block.generate(context); }, m_block);
}

} // namespace blocks
} // namespace block_script
