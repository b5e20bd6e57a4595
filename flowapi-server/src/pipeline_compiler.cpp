/**
 * @file pipeline_compiler.cpp
 * @brief Implementation of pipeline validation, topological sort and binding
 */

#include "pipeline_compiler.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <map>
#include <set>
#include <algorithm>

namespace flowapi {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

/**
 * Structural analysis of a PipelineDef, indices refer to declaration order.
 */
struct GraphAnalysis {
    std::vector<size_t> order;                      // Topological order
    std::vector<std::set<size_t>> predecessors;     // Per node, deduplicated
    std::vector<bool> has_outgoing;
};

GraphAnalysis analyze_graph(const PipelineDef& pipeline) {
    if (pipeline.nodes.empty()) {
        throw EmptyPipeline(pipeline.name);
    }

    // Check: All node names are unique
    std::map<std::string, size_t> index_of;
    for (size_t i = 0; i < pipeline.nodes.size(); ++i) {
        const std::string& name = pipeline.nodes[i].name;
        if (name.empty()) {
            throw PipelineError(pipeline.name, "node name cannot be empty");
        }
        if (!index_of.emplace(name, i).second) {
            throw DuplicateNodeName(pipeline.name, name);
        }
    }

    GraphAnalysis analysis;
    analysis.predecessors.resize(pipeline.nodes.size());
    analysis.has_outgoing.assign(pipeline.nodes.size(), false);
    std::vector<std::set<size_t>> successors(pipeline.nodes.size());

    // Check: All edges reference declared nodes
    for (const Edge& edge : pipeline.edges) {
        auto source_it = index_of.find(edge.source);
        if (source_it == index_of.end()) {
            throw DanglingEdge(pipeline.name, edge.source, edge.target, edge.source);
        }
        auto target_it = index_of.find(edge.target);
        if (target_it == index_of.end()) {
            throw DanglingEdge(pipeline.name, edge.source, edge.target, edge.target);
        }
        successors[source_it->second].insert(target_it->second);
        analysis.predecessors[target_it->second].insert(source_it->second);
        analysis.has_outgoing[source_it->second] = true;
    }

    // Kahn's algorithm; the ready set is ordered by declaration index
    std::vector<size_t> in_degree(pipeline.nodes.size());
    std::set<size_t> ready;
    for (size_t i = 0; i < pipeline.nodes.size(); ++i) {
        in_degree[i] = analysis.predecessors[i].size();
        if (in_degree[i] == 0) {
            ready.insert(i);
        }
    }

    while (!ready.empty()) {
        size_t current = *ready.begin();
        ready.erase(ready.begin());
        analysis.order.push_back(current);

        for (size_t next : successors[current]) {
            if (--in_degree[next] == 0) {
                ready.insert(next);
            }
        }
    }

    // Check for circular dependencies
    if (analysis.order.size() != pipeline.nodes.size()) {
        std::vector<std::string> unvisited;
        for (size_t i = 0; i < pipeline.nodes.size(); ++i) {
            if (in_degree[i] > 0) {
                unvisited.push_back(pipeline.nodes[i].name);
            }
        }
        throw CyclicPipeline(pipeline.name, unvisited);
    }

    return analysis;
}

} // namespace

CompiledPipeline::CompiledPipeline(
    std::string name,
    std::vector<CompiledNode> nodes,
    std::vector<std::string> entry_nodes,
    std::vector<std::string> exit_nodes
)
    : name_(std::move(name)),
      nodes_(std::move(nodes)),
      entry_nodes_(std::move(entry_nodes)),
      exit_nodes_(std::move(exit_nodes)) {}

std::vector<std::string> CompiledPipeline::execution_order() const {
    std::vector<std::string> order;
    order.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        order.push_back(node.name);
    }
    return order;
}

Edge parse_edge(const std::string& text) {
    size_t arrow_pos = text.find("->");
    if (arrow_pos == std::string::npos) {
        throw ConfigParseError("Invalid edge '" + text + "' (expected \"A -> B\")");
    }

    std::string source = trim(text.substr(0, arrow_pos));
    std::string target = trim(text.substr(arrow_pos + 2));

    if (source.empty() || target.empty() || target.find("->") != std::string::npos) {
        throw ConfigParseError("Invalid edge '" + text + "' (expected \"A -> B\")");
    }
    return Edge(source, target);
}

std::vector<std::string> compute_execution_order(const PipelineDef& pipeline) {
    GraphAnalysis analysis = analyze_graph(pipeline);

    std::vector<std::string> order;
    order.reserve(analysis.order.size());
    for (size_t index : analysis.order) {
        order.push_back(pipeline.nodes[index].name);
    }
    return order;
}

PipelineCompiler::PipelineCompiler(const NodeTypeRegistry& registry)
    : registry_(registry) {
    if (!registry_.is_frozen()) {
        throw RegistryNotFrozen();
    }
}

std::shared_ptr<const CompiledPipeline> PipelineCompiler::compile(const PipelineDef& pipeline) const {
    if (pipeline.name.empty()) {
        throw PipelineError("<unnamed>", "pipeline name cannot be empty");
    }

    GraphAnalysis analysis = analyze_graph(pipeline);

    std::vector<CompiledNode> compiled_nodes;
    compiled_nodes.reserve(analysis.order.size());

    for (size_t index : analysis.order) {
        const NodeDef& def = pipeline.nodes[index];

        if (!registry_.is_registered(def.type, def.version)) {
            throw UnknownNodeType(
                NodeTypeRegistry::type_key(def.type, def.version) +
                " (node '" + def.name + "' in pipeline '" + pipeline.name + "')"
            );
        }

        CompiledNode node;
        node.name = def.name;
        node.type = def.type;
        node.version = def.version;
        node.config = def.config;
        node.capability = registry_.resolve(def.type, def.version);

        try {
            node.capability->validate(node.config);
        } catch (const std::exception& e) {
            throw InvalidNodeConfig(pipeline.name, def.name, e.what());
        }

        for (size_t predecessor : analysis.predecessors[index]) {
            node.predecessors.push_back(pipeline.nodes[predecessor].name);
        }

        compiled_nodes.push_back(std::move(node));
    }

    std::vector<std::string> entry_nodes;
    std::vector<std::string> exit_nodes;
    for (size_t i = 0; i < pipeline.nodes.size(); ++i) {
        if (analysis.predecessors[i].empty()) {
            entry_nodes.push_back(pipeline.nodes[i].name);
        }
        if (!analysis.has_outgoing[i]) {
            exit_nodes.push_back(pipeline.nodes[i].name);
        }
    }

    auto compiled = std::make_shared<const CompiledPipeline>(
        pipeline.name, std::move(compiled_nodes), std::move(entry_nodes), std::move(exit_nodes)
    );

    Logger::get_instance().log_pipeline_compiled(*compiled);
    return compiled;
}

} // namespace flowapi
