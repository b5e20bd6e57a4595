#include "application.hpp"
#include "builtin_nodes.hpp"
#include "pipeline_compiler.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <set>

namespace flowapi {

void configure_logging(const LogSettings& settings) {
    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(settings.level);
    logger_config.enable_json = settings.json;
    if (!settings.file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = settings.file;
    }
    Logger::get_instance().configure(logger_config);
}

Application::Application(const ServerConfig& config, RegistrationHook hook)
    : config_(config),
      registry_(std::make_unique<NodeTypeRegistry>()) {

    register_builtin_node_types(*registry_);
    if (hook) {
        hook(*registry_);
    }
    for (const auto& extension : config_.extensions) {
        extensions_.load(extension, *registry_);
    }
    registry_->freeze();

    Logger::get_instance().log_event(LogLevel::DEBUG, "Node type registry frozen", {
        {"event", "registry_frozen"},
        {"node_types", std::to_string(registry_->size())}
    });

    PipelineCompiler compiler(*registry_);
    std::set<std::string> pipeline_names;

    for (const auto& dependency : config_.dependencies) {
        if (dependencies_.count(dependency.name)) {
            throw DuplicatePipelineName(dependency.name);
        }
        if (!pipeline_names.insert(dependency.pipeline.name).second) {
            throw DuplicatePipelineName(dependency.pipeline.name);
        }
        dependencies_[dependency.name] = compiler.compile(dependency.pipeline);
    }

    std::vector<BoundEndpoint> endpoints;
    endpoints.reserve(config_.api.size());

    for (const auto& declared : config_.api) {
        if (!pipeline_names.insert(declared.pipeline.name).second) {
            throw DuplicatePipelineName(declared.pipeline.name);
        }

        BoundEndpoint bound;
        bound.endpoint = std::make_shared<const EndpointSpec>(declared);
        bound.pipeline = compiler.compile(declared.pipeline);

        for (const auto& name : declared.depends) {
            auto it = dependencies_.find(name);
            if (it == dependencies_.end()) {
                throw UnknownDependency(declared.route, name);
            }
            bound.dependencies.push_back(it->second);
        }

        endpoints.push_back(std::move(bound));
    }

    routes_ = bind_routes(endpoints);

    DispatchOptions options;
    options.request_timeout = std::chrono::milliseconds(config_.request_timeout_ms);
    dispatcher_ = std::make_unique<RequestDispatcher>(routes_, options);
}

} // namespace flowapi
