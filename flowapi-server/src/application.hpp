/**
 * @file application.hpp
 * @brief Startup assembly from a ServerConfig to a ready dispatcher
 *
 * Order: registry -> built-in types -> extensions -> freeze -> compile
 * dependency pipelines -> compile endpoint pipelines -> resolve `depends`
 * -> bind routes -> dispatcher. Any failure throws and nothing is served.
 */

#ifndef FLOWAPI_APPLICATION_HPP
#define FLOWAPI_APPLICATION_HPP

#include "pipeline_def.hpp"
#include "node_registry.hpp"
#include "extension_loader.hpp"
#include "route_table.hpp"
#include "dispatcher.hpp"
#include <map>
#include <memory>
#include <string>
#include <functional>

namespace flowapi {

/**
 * @brief Owns everything that lives for the lifetime of the server
 */
class Application {
public:
    /**
     * @brief Hook run after built-in types are registered, before freeze()
     */
    using RegistrationHook = std::function<void(NodeTypeRegistry&)>;

    /**
     * @throws ExtensionLoadError, PipelineError, UnknownNodeType,
     *         DuplicatePipelineName, UnknownDependency, DuplicateRoute
     */
    explicit Application(const ServerConfig& config, RegistrationHook hook = nullptr);

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    const ServerConfig& config() const { return config_; }
    const NodeTypeRegistry& registry() const { return *registry_; }
    const RouteTable& routes() const { return *routes_; }
    const RequestDispatcher& dispatcher() const { return *dispatcher_; }

    /**
     * @brief Compiled dependency pipelines by name
     */
    const std::map<std::string, std::shared_ptr<const CompiledPipeline>>& dependencies() const {
        return dependencies_;
    }

private:
    // Declared first so extension libraries are unloaded last
    ExtensionLoader extensions_;

    ServerConfig config_;
    std::unique_ptr<NodeTypeRegistry> registry_;
    std::map<std::string, std::shared_ptr<const CompiledPipeline>> dependencies_;
    std::shared_ptr<const RouteTable> routes_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
};

/**
 * @brief Apply the `log` section of a configuration to the logger
 */
void configure_logging(const LogSettings& settings);

} // namespace flowapi

#endif // FLOWAPI_APPLICATION_HPP
