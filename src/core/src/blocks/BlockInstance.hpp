#pragma once

/**
 * @file BlockInstance.hpp
 * @brief Closed set of block kinds behind one value type
 */

#include "FunctionBlock.hpp"
#include "KeycheckBlock.hpp"
#include "ParseBlock.hpp"
#include "RawCodeBlock.hpp"
#include <variant>
#include <vector>

namespace block_script {
namespace blocks {

class BlockInstance {
public:
    using Variant = std::variant<ParseBlock, FunctionBlock, KeycheckBlock, RawCodeBlock>;

    /**
     * Default instance for a descriptor, with settings seeded from the
     * parameter defaults
     */
    static BlockInstance create(std::shared_ptr<const descriptors::BlockDescriptor> descriptor);

    BlockInstance(ParseBlock block) : m_block(std::move(block)) {}
    BlockInstance(FunctionBlock block) : m_block(std::move(block)) {}
    BlockInstance(KeycheckBlock block) : m_block(std::move(block)) {}
    BlockInstance(RawCodeBlock block) : m_block(std::move(block)) {}

    BlockBase& base();
    const BlockBase& base() const;

    const std::string& id() const { return base().id(); }
    bool isDisabled() const { return base().isDisabled(); }

    /**
     * Body lines (without the BLOCK: header)
     * @throws InvalidSettingError for settings unknown to the descriptor
     */
    std::vector<std::string> serialize(const SerializeOptions& options = {}) const;

    /**
     * Read the body lines following the BLOCK: header
     * @throws ParseError tagged with the line the error was found on
     */
    void deserialize(const std::vector<SourceLine>& lines);

    std::string generate(codegen::GenerationContext& context) const;

    template <typename T>
    T* as() { return std::get_if<T>(&m_block); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&m_block); }

    const Variant& variant() const { return m_block; }

    bool operator==(const BlockInstance& other) const { return m_block == other.m_block; }
    bool operator!=(const BlockInstance& other) const { return !(*this == other); }

private:
    Variant m_block;
};

using Script = std::vector<BlockInstance>;

} // namespace blocks
} // namespace block_script
