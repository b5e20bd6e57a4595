/**
 * @file pipeline_compiler.hpp
 * @brief Compiles pipeline declarations into immutable, topologically ordered graphs
 *
 * Compilation validates:
 * - At least one node exists
 * - All node names are unique
 * - Every edge references declared nodes
 * - The digraph is acyclic
 * - Every (type, version) resolves in the registry and accepts its config
 *
 * The resulting CompiledPipeline is never mutated and is shared by reference
 * across all concurrent executions.
 */

#ifndef FLOWAPI_PIPELINE_COMPILER_HPP
#define FLOWAPI_PIPELINE_COMPILER_HPP

#include "node_type.hpp"
#include "node_registry.hpp"
#include "pipeline_def.hpp"
#include <string>
#include <vector>
#include <memory>

namespace flowapi {

/**
 * @brief A node bound to its resolved capability
 */
struct CompiledNode {
    std::string name;
    std::string type;
    Version version;
    Value config;
    std::vector<std::string> predecessors;      ///< Nodes whose output feeds this one
    std::shared_ptr<const INodeCapability> capability;
};

/**
 * @brief Immutable, executable form of a PipelineDef
 */
class CompiledPipeline {
public:
    CompiledPipeline(
        std::string name,
        std::vector<CompiledNode> nodes,
        std::vector<std::string> entry_nodes,
        std::vector<std::string> exit_nodes
    );

    const std::string& name() const { return name_; }

    /**
     * @brief Nodes in execution (topological) order
     */
    const std::vector<CompiledNode>& nodes() const { return nodes_; }

    /**
     * @brief Node names in execution order
     */
    std::vector<std::string> execution_order() const;

    /**
     * @brief Nodes without incoming edges, in declaration order
     */
    const std::vector<std::string>& entry_nodes() const { return entry_nodes_; }

    /**
     * @brief Nodes without outgoing edges, in declaration order
     */
    const std::vector<std::string>& exit_nodes() const { return exit_nodes_; }

    size_t size() const { return nodes_.size(); }

private:
    std::string name_;
    std::vector<CompiledNode> nodes_;
    std::vector<std::string> entry_nodes_;
    std::vector<std::string> exit_nodes_;
};

/**
 * @brief Parse an edge string of the form "A -> B"
 *
 * @throws ConfigParseError If the string is not two non-empty names joined by "->"
 */
Edge parse_edge(const std::string& text);

/**
 * @brief Computes topological execution order for a pipeline
 *
 * Among nodes that become eligible together, declaration order wins, so the
 * result is a pure function of the declaration.
 *
 * @return Node names in execution order
 * @throws EmptyPipeline, DuplicateNodeName, DanglingEdge, CyclicPipeline
 */
std::vector<std::string> compute_execution_order(const PipelineDef& pipeline);

/**
 * @brief Compiles PipelineDefs against a frozen registry
 *
 * Usage Example:
 *   @code
 *   NodeTypeRegistry registry;
 *   register_builtin_node_types(registry);
 *   registry.freeze();
 *
 *   PipelineCompiler compiler(registry);
 *   std::shared_ptr<const CompiledPipeline> compiled = compiler.compile(pipeline_def);
 *   @endcode
 */
class PipelineCompiler {
public:
    /**
     * @throws RegistryNotFrozen If the registry still accepts registrations
     */
    explicit PipelineCompiler(const NodeTypeRegistry& registry);

    /**
     * @brief Compile a pipeline declaration
     *
     * @throws EmptyPipeline, DuplicateNodeName, DanglingEdge, CyclicPipeline
     * @throws UnknownNodeType If a node's (type, version) is not registered
     * @throws InvalidNodeConfig If a capability rejects a node's config
     */
    std::shared_ptr<const CompiledPipeline> compile(const PipelineDef& pipeline) const;

private:
    const NodeTypeRegistry& registry_;
};

} // namespace flowapi

#endif // FLOWAPI_PIPELINE_COMPILER_HPP
