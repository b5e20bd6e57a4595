/**
 * @file builtin_nodes.hpp
 * @brief Node types available in every registry
 *
 * - DataTransformer 1.0: runs `config.script` through the script engine
 * - SleepOperator 1.0: blocks for `config.sleep` seconds or `config.milliseconds`
 * - HttpRequester 1.0: outbound HTTP call via libcurl
 */

#ifndef FLOWAPI_BUILTIN_NODES_HPP
#define FLOWAPI_BUILTIN_NODES_HPP

#include "node_type.hpp"
#include "node_registry.hpp"
#include "script.hpp"
#include <map>
#include <string>
#include <shared_mutex>
#include <chrono>

namespace flowapi {

namespace NodeTypeName {
    constexpr const char* DATA_TRANSFORMER = "DataTransformer";
    constexpr const char* SLEEP_OPERATOR = "SleepOperator";
    constexpr const char* HTTP_REQUESTER = "HttpRequester";
}

/**
 * @brief Applies a script to (data, state)
 *
 * Scripts are parsed once in validate() and cached by source text, so a
 * request never pays for parsing.
 */
class DataTransformerNode : public INodeCapability {
public:
    NodeOutput execute(Value data, Value state, const Value& config) const override;
    void validate(const Value& config) const override;

private:
    mutable std::shared_mutex cache_mutex_;
    mutable std::map<std::string, script::Script> cache_;

    script::Script get_script(const Value& config) const;
};

/**
 * @brief Blocks the calling worker, then passes (data, state) through
 */
class SleepNode : public INodeCapability {
public:
    NodeOutput execute(Value data, Value state, const Value& config) const override;
    void validate(const Value& config) const override;

    static std::chrono::milliseconds duration(const Value& config);
};

/**
 * @brief Performs an outbound HTTP request
 *
 * Config:
 *   url        (required) target URL
 *   method     GET (default), POST, PUT, PATCH, DELETE, ...
 *   headers    object of header name -> string value
 *   timeout_ms request timeout, default 5000
 *   output     key under data receiving the result, default "response"
 *
 * The request body is `data.body` (strings sent as-is, other values as JSON).
 * The result `{status, body, headers}` is stored under `data[output]`; a JSON
 * response body is decoded. Transport failures throw; HTTP error statuses do
 * not.
 */
class HttpRequesterNode : public INodeCapability {
public:
    HttpRequesterNode();

    NodeOutput execute(Value data, Value state, const Value& config) const override;
    void validate(const Value& config) const override;
};

/**
 * @brief Register DataTransformer, SleepOperator and HttpRequester (all 1.0)
 *
 * @throws RegistryFrozen, DuplicateNodeType
 */
void register_builtin_node_types(NodeTypeRegistry& registry);

} // namespace flowapi

#endif // FLOWAPI_BUILTIN_NODES_HPP
