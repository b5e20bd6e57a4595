/**
 * @file node_registry.hpp
 * @brief Registry resolving (type, version) pairs to node capabilities
 *
 * The registry is filled at startup (built-in types, then extensions) and
 * frozen before the first pipeline is compiled. After freeze() it is only
 * read, so compiled pipelines can share its capabilities without locking.
 */

#ifndef FLOWAPI_NODE_REGISTRY_HPP
#define FLOWAPI_NODE_REGISTRY_HPP

#include "node_type.hpp"
#include <map>
#include <string>
#include <memory>
#include <vector>
#include <utility>

namespace flowapi {

/**
 * @brief Registry of node capabilities
 *
 * Usage Example:
 *   @code
 *   NodeTypeRegistry registry;
 *   register_builtin_node_types(registry);
 *   registry.register_type("Uppercase", Version(1, 0), std::make_shared<UppercaseNode>());
 *   registry.freeze();
 *
 *   auto capability = registry.resolve("Uppercase", Version(1, 0));
 *   @endcode
 */
class NodeTypeRegistry {
public:
    using CapabilityPtr = std::shared_ptr<const INodeCapability>;

    NodeTypeRegistry() = default;

    NodeTypeRegistry(const NodeTypeRegistry&) = delete;
    NodeTypeRegistry& operator=(const NodeTypeRegistry&) = delete;

    /**
     * @brief Register a capability for a node type
     *
     * @param type Type name (e.g., "DataTransformer")
     * @param version Type version
     * @param capability Capability instance (must not be null)
     *
     * @throws DuplicateNodeType If (type, version) is already registered
     * @throws RegistryFrozen If freeze() has been called
     * @throws RegistryError If capability is null or type is empty
     */
    void register_type(const std::string& type, const Version& version, CapabilityPtr capability);

    /**
     * @brief Resolve a node type
     *
     * @throws UnknownNodeType If (type, version) is not registered
     */
    CapabilityPtr resolve(const std::string& type, const Version& version) const;

    bool is_registered(const std::string& type, const Version& version) const;

    /**
     * @brief Get registered node types as "type@major.minor", sorted
     */
    std::vector<std::string> list_types() const;

    /**
     * @brief Forbid further registration
     */
    void freeze() { frozen_ = true; }

    bool is_frozen() const { return frozen_; }

    size_t size() const { return registry_.size(); }

    static std::string type_key(const std::string& type, const Version& version) {
        return type + "@" + version.to_string();
    }

private:
    std::map<std::pair<std::string, Version>, CapabilityPtr> registry_;
    bool frozen_ = false;
};

} // namespace flowapi

#endif // FLOWAPI_NODE_REGISTRY_HPP
