/**
 * @file CodeGenerator.cpp
 */

#include "CodeGenerator.hpp"
#include "../logging/Logger.hpp"
#include <utility>

namespace block_script {
namespace codegen {

std::string CodeGenerator::generate(const blocks::Script& script) const {
    DefinedVariables variables;
    return generate(script, variables);
}

std::string CodeGenerator::generate(const blocks::Script& script, DefinedVariables& variables) const {
    // Committed only once every block has generated
    DefinedVariables working = variables;
    GenerationContext context{working};
    std::string source;
    size_t skipped = 0;

    for (const auto& block : script) {
        if (block.isDisabled()) {
            LOG_TRACE("Skipping disabled block {} ({})", block.id(), block.base().label());
            skipped++;
            continue;
        }
        source += block.generate(context);
    }

    variables = std::move(working);

    LOG_DEBUG("Generated {} blocks ({} disabled), {} variables declared",
              script.size() - skipped, skipped, variables.size());
    return source;
}

} // namespace codegen
} // namespace block_script
