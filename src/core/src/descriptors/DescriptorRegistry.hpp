#pragma once

/**
 * @file DescriptorRegistry.hpp
 * @brief Catalog of block kinds, looked up by kind id
 */

#include "BlockDescriptor.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace block_script {
namespace descriptors {

/**
 * Descriptor Registry
 *
 * Populated once (built-in table, optional YAML catalog) and then frozen.
 * Not thread-safe while being populated; after freeze() it is read-only and
 * may be shared by any number of concurrent decode/generate calls.
 */
class DescriptorRegistry {
public:
    DescriptorRegistry() = default;

    DescriptorRegistry(const DescriptorRegistry&) = delete;
    DescriptorRegistry& operator=(const DescriptorRegistry&) = delete;

    /**
     * Registry holding the built-in descriptors, already frozen
     */
    static std::shared_ptr<const DescriptorRegistry> builtin();

    /**
     * Add a descriptor
     * @throws std::logic_error if the registry is frozen
     * @throws std::invalid_argument on duplicate or empty id
     */
    void add(BlockDescriptor descriptor);

    /**
     * Add the built-in descriptors (Parse, Keycheck, RawCode, HttpRequest,
     * crypto functions)
     */
    void registerBuiltins();

    /**
     * Load additional descriptors from a YAML catalog file
     * @param filepath Path to the catalog
     * @return true if every descriptor in the file was added
     * @throws std::logic_error if the registry is frozen
     */
    bool loadCatalog(const std::string& filepath);

    void freeze() { m_frozen = true; }
    bool isFrozen() const { return m_frozen; }

    /**
     * @throws UnknownKindError if no descriptor has this id
     */
    std::shared_ptr<const BlockDescriptor> get(const std::string& id) const;

    /**
     * @return nullptr if no descriptor has this id
     */
    std::shared_ptr<const BlockDescriptor> find(const std::string& id) const;

    bool contains(const std::string& id) const { return m_descriptors.count(id) > 0; }
    size_t size() const { return m_descriptors.size(); }

    // Registered ids in lexicographic order
    std::vector<std::string> ids() const;

private:
    void ensureMutable() const;

    std::map<std::string, std::shared_ptr<const BlockDescriptor>> m_descriptors;
    bool m_frozen = false;
};

} // namespace descriptors
} // namespace block_script
