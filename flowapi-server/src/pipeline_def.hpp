#ifndef FLOWAPI_PIPELINE_DEF_HPP
#define FLOWAPI_PIPELINE_DEF_HPP

#include "node_type.hpp"
#include <string>
#include <vector>
#include <set>
#include <cstddef>

namespace flowapi {

/**
 * @brief Represents a node declaration in a pipeline
 */
struct NodeDef {
    std::string name;         // Unique within the pipeline, e.g., "I", "A0"
    std::string type;         // Node type: "DataTransformer", "SleepOperator", ...
    Version version;          // Node type version
    Value config;             // Operator-specific parameters

    NodeDef() : config(Value::object()) {}
    NodeDef(const std::string& name_, const std::string& type_,
            const Version& version_ = Version(1, 0), const Value& config_ = Value::object())
        : name(name_), type(type_), version(version_), config(config_) {}
};

/**
 * @brief Directed dependency between two nodes (source runs first)
 */
struct Edge {
    std::string source;
    std::string target;

    Edge() = default;
    Edge(const std::string& source_, const std::string& target_)
        : source(source_), target(target_) {}

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target;
    }
};

/**
 * @brief Represents a declared pipeline: nodes plus digraph
 */
struct PipelineDef {
    std::string name;                   // Unique within the configuration
    std::vector<NodeDef> nodes;         // Declaration order is the tie-break order
    std::vector<Edge> edges;

    PipelineDef() = default;
    explicit PipelineDef(const std::string& name_) : name(name_) {}
};

/**
 * @brief Represents one declared REST endpoint
 */
struct EndpointSpec {
    std::string route;                          // Declared route, e.g., "hello/{who}"
    std::set<std::string> methods;              // Upper-case HTTP verbs, non-empty
    size_t min_size;                            // Minimum raw body length in bytes
    size_t max_size;                            // Maximum raw body length in bytes
    Version version;                            // Exposed as v<major>/<minor>/<route>
    PipelineDef pipeline;                       // Owned pipeline declaration
    std::vector<std::string> depends;           // Dependency pipelines run first

    EndpointSpec() : min_size(0), max_size(1024 * 1024) {}
};

/**
 * @brief Named pipeline that endpoints can run as a precondition
 */
struct DependencySpec {
    std::string name;
    PipelineDef pipeline;
};

/**
 * @brief Logging section of the server configuration
 */
struct LogSettings {
    std::string level;        // "debug", "info", "warning", "error"
    std::string file;         // Optional log file path
    bool json;                // JSON lines vs. plain text

    LogSettings() : level("info"), json(true) {}
};

/**
 * @brief Represents the complete server configuration
 */
struct ServerConfig {
    std::string address;                        // Listen address
    unsigned short port;                        // Listen port
    unsigned int threads;                       // I/O threads (0 = hardware concurrency)
    unsigned int pipeline_workers;              // Threads running pipeline walks
    unsigned int request_timeout_ms;            // 0 = no deadline
    LogSettings log;
    std::vector<std::string> extensions;        // Extension library identifiers
    std::vector<DependencySpec> dependencies;
    std::vector<EndpointSpec> api;

    ServerConfig()
        : address("0.0.0.0"), port(1979), threads(0), pipeline_workers(16), request_timeout_ms(0) {}
};

} // namespace flowapi

#endif // FLOWAPI_PIPELINE_DEF_HPP
