#pragma once

/**
 * @file CodeGenerator.hpp
 * @brief Compiles a block script to C# statements
 */

#include "../blocks/BlockInstance.hpp"
#include "GenerationContext.hpp"
#include <string>

namespace block_script {
namespace codegen {

/**
 * Code Generator
 *
 * Emits the statements of every enabled block in script order. Disabled
 * blocks contribute nothing and declare nothing. The output is meant to be
 * embedded in a runtime template that declares `data` and `globals`.
 */
class CodeGenerator {
public:
    /**
     * @return generated source; nothing is returned if any block fails
     * @throws InvalidSettingError, UnsupportedOperationError
     */
    std::string generate(const blocks::Script& script) const;

    /**
     * Same as generate(script) with caller-owned variable bookkeeping,
     * e.g. to continue a script or inspect the declared names
     */
    std::string generate(const blocks::Script& script, DefinedVariables& variables) const;
};

} // namespace codegen
} // namespace block_script
