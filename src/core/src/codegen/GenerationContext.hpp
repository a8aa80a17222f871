#pragma once

/**
 * @file GenerationContext.hpp
 * @brief State threaded through code generation of one script
 */

#include <string>
#include <unordered_set>
#include <vector>

namespace block_script {
namespace codegen {

/**
 * Names already declared in the emitted program, in declaration order
 */
class DefinedVariables {
public:
    bool contains(const std::string& name) const { return m_lookup.count(name) > 0; }

    // Returns false if the name was already present
    bool add(const std::string& name) {
        if (!m_lookup.insert(name).second) return false;
        m_names.push_back(name);
        return true;
    }

    const std::vector<std::string>& names() const { return m_names; }
    size_t size() const { return m_names.size(); }
    bool empty() const { return m_names.empty(); }

private:
    std::vector<std::string> m_names;
    std::unordered_set<std::string> m_lookup;
};

struct GenerationContext {
    DefinedVariables& variables;
};

} // namespace codegen
} // namespace block_script
