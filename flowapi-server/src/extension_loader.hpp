/**
 * @file extension_loader.hpp
 * @brief Loads shared libraries that register additional node types
 *
 * An extension exports one C entry point:
 *
 *   @code
 *   extern "C" int flowapi_register_extension(flowapi::NodeTypeRegistry* registry) {
 *       registry->register_type("Uppercase", flowapi::Version(1, 0),
 *                               std::make_shared<UppercaseNode>());
 *       return 0;
 *   }
 *   @endcode
 *
 * A non-zero return (or an exception escaping registration) fails startup.
 */

#ifndef FLOWAPI_EXTENSION_LOADER_HPP
#define FLOWAPI_EXTENSION_LOADER_HPP

#include "node_registry.hpp"
#include <string>
#include <vector>

#define FLOWAPI_EXTENSION_ENTRY_POINT "flowapi_register_extension"

namespace flowapi {

using ExtensionEntryPoint = int (*)(NodeTypeRegistry*);

/**
 * @brief Owns the handles of loaded extension libraries
 *
 * Handles are closed when the loader is destroyed, so the loader must outlive
 * every registry and compiled pipeline holding capabilities from them.
 */
class ExtensionLoader {
public:
    ExtensionLoader() = default;
    ~ExtensionLoader();

    ExtensionLoader(const ExtensionLoader&) = delete;
    ExtensionLoader& operator=(const ExtensionLoader&) = delete;

    /**
     * @brief Load one extension and let it register into the registry
     *
     * @param identifier Library path, or bare name resolved as lib<name>.so
     *
     * @throws ExtensionLoadError If the library or entry point is missing, or
     *         registration fails
     */
    void load(const std::string& identifier, NodeTypeRegistry& registry);

    /**
     * @brief Resolved file names of loaded libraries, in load order
     */
    const std::vector<std::string>& loaded() const { return loaded_; }

    /**
     * @brief Map an identifier to the file name handed to the dynamic loader
     */
    static std::string library_file_name(const std::string& identifier);

private:
    std::vector<void*> handles_;
    std::vector<std::string> loaded_;
};

} // namespace flowapi

#endif // FLOWAPI_EXTENSION_LOADER_HPP
