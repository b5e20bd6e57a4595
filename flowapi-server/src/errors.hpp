/**
 * @file errors.hpp
 * @brief Exception hierarchy for configuration, compilation, routing and dispatch
 *
 * Compile-time errors (pipeline, registry, route, config) abort startup.
 * Request-time errors (DispatchError) map to a specific HTTP status.
 * Execution-time errors (OperatorError, PipelineCancelled) map to an opaque
 * failure status; their text is only ever logged.
 */

#ifndef FLOWAPI_ERRORS_HPP
#define FLOWAPI_ERRORS_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>

namespace flowapi {

/**
 * @brief Base exception for all FlowAPI errors
 */
class FlowApiError : public std::runtime_error {
public:
    explicit FlowApiError(const std::string& message)
        : std::runtime_error(message) {}
};

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/**
 * @brief Raised when a configuration document cannot be read or is malformed
 */
class ConfigParseError : public FlowApiError {
public:
    explicit ConfigParseError(const std::string& message)
        : FlowApiError("Configuration error: " + message) {}
};

/**
 * @brief Raised when two pipelines in one configuration share a name
 */
class DuplicatePipelineName : public FlowApiError {
public:
    explicit DuplicatePipelineName(const std::string& name)
        : FlowApiError("Duplicate pipeline name: " + name) {}
};

/**
 * @brief Raised when an endpoint depends on an undeclared dependency pipeline
 */
class UnknownDependency : public FlowApiError {
public:
    UnknownDependency(const std::string& route, const std::string& dependency)
        : FlowApiError("Endpoint '" + route + "' depends on unknown pipeline: " + dependency) {}
};

/**
 * @brief Raised when an extension library cannot be loaded or fails to register
 */
class ExtensionLoadError : public FlowApiError {
public:
    explicit ExtensionLoadError(const std::string& message)
        : FlowApiError("Extension load failed: " + message) {}
};

// ---------------------------------------------------------------------------
// Node type registry
// ---------------------------------------------------------------------------

class RegistryError : public FlowApiError {
public:
    explicit RegistryError(const std::string& message)
        : FlowApiError(message) {}
};

class DuplicateNodeType : public RegistryError {
public:
    explicit DuplicateNodeType(const std::string& type_key)
        : RegistryError("Node type already registered: " + type_key) {}
};

class RegistryFrozen : public RegistryError {
public:
    explicit RegistryFrozen(const std::string& type_key)
        : RegistryError("Node type registry is frozen, cannot register: " + type_key) {}
};

class RegistryNotFrozen : public RegistryError {
public:
    RegistryNotFrozen()
        : RegistryError("Node type registry must be frozen before compiling pipelines") {}
};

// ---------------------------------------------------------------------------
// Pipeline compilation
// ---------------------------------------------------------------------------

/**
 * @brief Base class for errors detected while compiling a pipeline
 */
class PipelineError : public FlowApiError {
public:
    PipelineError(const std::string& pipeline, const std::string& message)
        : FlowApiError("Pipeline '" + pipeline + "': " + message), pipeline_(pipeline) {}

    const std::string& pipeline() const { return pipeline_; }

private:
    std::string pipeline_;
};

class EmptyPipeline : public PipelineError {
public:
    explicit EmptyPipeline(const std::string& pipeline)
        : PipelineError(pipeline, "pipeline declares no nodes") {}
};

class DuplicateNodeName : public PipelineError {
public:
    DuplicateNodeName(const std::string& pipeline, const std::string& node)
        : PipelineError(pipeline, "duplicate node name: " + node) {}
};

class DanglingEdge : public PipelineError {
public:
    DanglingEdge(const std::string& pipeline, const std::string& source,
                 const std::string& target, const std::string& missing)
        : PipelineError(pipeline, "edge " + source + " -> " + target +
                        " references undeclared node: " + missing) {}
};

class CyclicPipeline : public PipelineError {
public:
    CyclicPipeline(const std::string& pipeline, const std::vector<std::string>& unvisited)
        : PipelineError(pipeline, "circular dependency among nodes: " + join(unvisited)),
          unvisited_(unvisited) {}

    const std::vector<std::string>& unvisited() const { return unvisited_; }

private:
    std::vector<std::string> unvisited_;

    static std::string join(const std::vector<std::string>& names) {
        std::string out;
        for (const auto& name : names) {
            if (!out.empty()) out += ", ";
            out += name;
        }
        return out;
    }
};

/**
 * @brief Raised when no capability is registered for a (type, version) pair
 *
 * Thrown by the registry itself; the compiler re-throws it with pipeline context.
 */
class UnknownNodeType : public FlowApiError {
public:
    explicit UnknownNodeType(const std::string& type_key)
        : FlowApiError("Unknown node type: " + type_key) {}
};

class InvalidNodeConfig : public PipelineError {
public:
    InvalidNodeConfig(const std::string& pipeline, const std::string& node, const std::string& reason)
        : PipelineError(pipeline, "invalid config for node '" + node + "': " + reason) {}
};

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

class RouteError : public FlowApiError {
public:
    explicit RouteError(const std::string& message)
        : FlowApiError(message) {}
};

class DuplicateRoute : public RouteError {
public:
    DuplicateRoute(const std::string& method, const std::string& route)
        : RouteError("Duplicate route: " + method + " /" + route) {}
};

// ---------------------------------------------------------------------------
// Request admission
// ---------------------------------------------------------------------------

/**
 * @brief Base class for per-request admission failures
 *
 * Each subclass carries the HTTP status it is surfaced as.
 */
class DispatchError : public FlowApiError {
public:
    DispatchError(int http_status, const std::string& message)
        : FlowApiError(message), http_status_(http_status) {}

    int http_status() const { return http_status_; }

private:
    int http_status_;
};

class NoSuchEndpoint : public DispatchError {
public:
    explicit NoSuchEndpoint(const std::string& path)
        : DispatchError(404, "No such endpoint: " + path) {}
};

class MethodNotAllowed : public DispatchError {
public:
    MethodNotAllowed(const std::string& method, const std::string& path,
                     const std::vector<std::string>& allowed)
        : DispatchError(405, "Method " + method + " not allowed on " + path),
          allowed_(allowed) {}

    const std::vector<std::string>& allowed() const { return allowed_; }

private:
    std::vector<std::string> allowed_;
};

class PayloadSizeViolation : public DispatchError {
public:
    PayloadSizeViolation(size_t size, size_t min_size, size_t max_size)
        : DispatchError(size > max_size ? 413 : 400,
                        "Payload size " + std::to_string(size) + " outside [" +
                        std::to_string(min_size) + ", " + std::to_string(max_size) + "]"),
          size_(size) {}

    size_t size() const { return size_; }

private:
    size_t size_;
};

class InvalidPayload : public DispatchError {
public:
    explicit InvalidPayload(const std::string& reason)
        : DispatchError(400, "Invalid request payload: " + reason) {}
};

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

/**
 * @brief Raised when a node capability fails during a pipeline walk
 */
class OperatorError : public FlowApiError {
public:
    OperatorError(const std::string& node_name, const std::string& node_type, const std::string& detail)
        : FlowApiError("Node '" + node_name + "' (" + node_type + ") failed: " + detail),
          node_name_(node_name), node_type_(node_type), detail_(detail) {}

    const std::string& node_name() const { return node_name_; }
    const std::string& node_type() const { return node_type_; }
    const std::string& detail() const { return detail_; }

private:
    std::string node_name_;
    std::string node_type_;
    std::string detail_;
};

/**
 * @brief Raised when a pipeline walk is abandoned at a node boundary
 */
class PipelineCancelled : public FlowApiError {
public:
    PipelineCancelled(const std::string& pipeline, const std::string& next_node)
        : FlowApiError("Pipeline '" + pipeline + "' cancelled before node: " + next_node),
          next_node_(next_node) {}

    const std::string& next_node() const { return next_node_; }

private:
    std::string next_node_;
};

/**
 * @brief Raised by the script engine when a script fails at runtime
 */
class ScriptError : public FlowApiError {
public:
    explicit ScriptError(const std::string& message)
        : FlowApiError("Script error: " + message) {}
};

/**
 * @brief Raised by the script engine when a script does not parse
 */
class ScriptSyntaxError : public FlowApiError {
public:
    ScriptSyntaxError(int line, const std::string& message)
        : FlowApiError("Script syntax error at line " + std::to_string(line) + ": " + message),
          line_(line) {}

    int line() const { return line_; }

private:
    int line_;
};

} // namespace flowapi

#endif // FLOWAPI_ERRORS_HPP
