#include <catch2/catch.hpp>
#include "../src/pipeline_compiler.hpp"
#include "../src/errors.hpp"
#include "test_nodes.hpp"

using namespace flowapi;
using namespace flowapi::testing;

namespace {

PipelineDef make_pipeline(const std::string& name,
                          const std::vector<std::string>& node_names,
                          const std::vector<std::string>& edges) {
    PipelineDef pipeline(name);
    for (const auto& node_name : node_names) {
        pipeline.nodes.emplace_back(node_name, "Trace", Version(1, 0), Value{{"label", node_name}});
    }
    for (const auto& edge : edges) {
        pipeline.edges.push_back(parse_edge(edge));
    }
    return pipeline;
}

struct FrozenRegistry {
    NodeTypeRegistry registry;

    FrozenRegistry() {
        registry.register_type("Trace", Version(1, 0), std::make_shared<TraceNode>());
        registry.register_type("Strict", Version(1, 0), std::make_shared<StrictConfigNode>());
        registry.freeze();
    }
};

} // namespace

TEST_CASE("Edge parsing", "[pipeline_compiler]") {
    SECTION("Whitespace around names is ignored") {
        REQUIRE(parse_edge("A -> B") == Edge("A", "B"));
        REQUIRE(parse_edge("  A->B  ") == Edge("A", "B"));
    }

    SECTION("Malformed edges are rejected") {
        REQUIRE_THROWS_AS(parse_edge("A B"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_edge("-> B"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_edge("A ->"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_edge("A -> B -> C"), ConfigParseError);
    }
}

TEST_CASE("Execution order", "[pipeline_compiler]") {
    SECTION("Linear chain") {
        auto pipeline = make_pipeline("chain", {"I", "A0", "A1", "A2", "O"},
                                      {"I -> A0", "A0 -> A1", "A1 -> A2", "A2 -> O"});
        REQUIRE(compute_execution_order(pipeline) ==
                std::vector<std::string>{"I", "A0", "A1", "A2", "O"});
    }

    SECTION("Declaration order differs from dependency order") {
        auto pipeline = make_pipeline("reversed", {"O", "A", "I"}, {"I -> A", "A -> O"});
        REQUIRE(compute_execution_order(pipeline) == std::vector<std::string>{"I", "A", "O"});
    }

    SECTION("Diamond: simultaneously eligible nodes run in declaration order") {
        auto pipeline = make_pipeline("diamond", {"I", "Right", "Left", "O"},
                                      {"I -> Left", "I -> Right", "Left -> O", "Right -> O"});
        REQUIRE(compute_execution_order(pipeline) ==
                std::vector<std::string>{"I", "Right", "Left", "O"});
    }

    SECTION("Nodes without edges run in declaration order") {
        auto pipeline = make_pipeline("flat", {"C", "A", "B"}, {});
        REQUIRE(compute_execution_order(pipeline) == std::vector<std::string>{"C", "A", "B"});
    }

    SECTION("Repeated compilation yields identical order") {
        auto pipeline = make_pipeline("wide", {"I", "X", "Y", "Z", "O"},
                                      {"I -> Z", "I -> Y", "I -> X", "X -> O", "Y -> O", "Z -> O"});
        auto first = compute_execution_order(pipeline);
        for (int i = 0; i < 10; ++i) {
            REQUIRE(compute_execution_order(pipeline) == first);
        }
        REQUIRE(first == std::vector<std::string>{"I", "X", "Y", "Z", "O"});
    }
}

TEST_CASE("Structural validation", "[pipeline_compiler]") {
    SECTION("Empty pipeline") {
        PipelineDef pipeline("empty");
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), EmptyPipeline);
    }

    SECTION("Duplicate node names") {
        auto pipeline = make_pipeline("dup", {"A", "B", "A"}, {});
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), DuplicateNodeName);
    }

    SECTION("Edge to an undeclared node") {
        auto pipeline = make_pipeline("dangling", {"A"}, {"A -> Ghost"});
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), DanglingEdge);
    }

    SECTION("Edge from an undeclared node") {
        auto pipeline = make_pipeline("dangling", {"A"}, {"Ghost -> A"});
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), DanglingEdge);
    }

    SECTION("Cycle lists only the nodes that could not be ordered") {
        auto pipeline = make_pipeline("cyclic", {"I", "A", "B", "C"},
                                      {"I -> A", "A -> B", "B -> C", "C -> A"});
        try {
            compute_execution_order(pipeline);
            FAIL("Expected CyclicPipeline");
        } catch (const CyclicPipeline& e) {
            REQUIRE(e.pipeline() == "cyclic");
            REQUIRE(e.unvisited() == std::vector<std::string>{"A", "B", "C"});
        }
    }

    SECTION("Self loop is a cycle") {
        auto pipeline = make_pipeline("self", {"A"}, {"A -> A"});
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), CyclicPipeline);
    }

    SECTION("Structural errors are pipeline errors") {
        auto pipeline = make_pipeline("dup", {"A", "A"}, {});
        REQUIRE_THROWS_AS(compute_execution_order(pipeline), PipelineError);
    }
}

TEST_CASE("PipelineCompiler", "[pipeline_compiler]") {
    SECTION("Unfrozen registry is rejected") {
        NodeTypeRegistry registry;
        REQUIRE_THROWS_AS(PipelineCompiler(registry), RegistryNotFrozen);
    }

    FrozenRegistry fixture;
    PipelineCompiler compiler(fixture.registry);

    SECTION("Compiled pipeline records order, predecessors, entry and exit nodes") {
        auto pipeline = make_pipeline("diamond", {"I", "L", "R", "O"},
                                      {"I -> L", "I -> R", "L -> O", "R -> O", "L -> O"});
        auto compiled = compiler.compile(pipeline);

        REQUIRE(compiled->name() == "diamond");
        REQUIRE(compiled->size() == 4);
        REQUIRE(compiled->execution_order() == std::vector<std::string>{"I", "L", "R", "O"});
        REQUIRE(compiled->entry_nodes() == std::vector<std::string>{"I"});
        REQUIRE(compiled->exit_nodes() == std::vector<std::string>{"O"});

        const CompiledNode& out = compiled->nodes().back();
        REQUIRE(out.predecessors == std::vector<std::string>{"L", "R"});
        REQUIRE(out.config["label"] == "O");
        REQUIRE(out.capability == fixture.registry.resolve("Trace", Version(1, 0)));
        REQUIRE(compiled->nodes().front().predecessors.empty());
    }

    SECTION("Unknown node type names the node and pipeline") {
        PipelineDef pipeline("p");
        pipeline.nodes.emplace_back("X", "Missing", Version(1, 0));
        try {
            compiler.compile(pipeline);
            FAIL("Expected UnknownNodeType");
        } catch (const UnknownNodeType& e) {
            std::string message = e.what();
            REQUIRE(message.find("Missing@1.0") != std::string::npos);
            REQUIRE(message.find("'X'") != std::string::npos);
            REQUIRE(message.find("'p'") != std::string::npos);
        }
    }

    SECTION("Unregistered version is an unknown type") {
        PipelineDef pipeline("p");
        pipeline.nodes.emplace_back("X", "Trace", Version(2, 0));
        REQUIRE_THROWS_AS(compiler.compile(pipeline), UnknownNodeType);
    }

    SECTION("Capability config validation runs at compile time") {
        PipelineDef pipeline("strict");
        pipeline.nodes.emplace_back("S", "Strict", Version(1, 0), Value::object());
        REQUIRE_THROWS_AS(compiler.compile(pipeline), InvalidNodeConfig);

        pipeline.nodes[0].config = Value{{"required", true}};
        REQUIRE_NOTHROW(compiler.compile(pipeline));
    }

    SECTION("Structural errors surface before type resolution") {
        PipelineDef pipeline("p");
        pipeline.nodes.emplace_back("X", "Missing", Version(1, 0));
        pipeline.edges.emplace_back("X", "Ghost");
        REQUIRE_THROWS_AS(compiler.compile(pipeline), DanglingEdge);
    }

    SECTION("Unnamed pipeline is rejected") {
        auto pipeline = make_pipeline("", {"A"}, {});
        REQUIRE_THROWS_AS(compiler.compile(pipeline), PipelineError);
    }

    SECTION("Compiled pipeline does not alias the declaration") {
        auto pipeline = make_pipeline("p", {"A"}, {});
        auto compiled = compiler.compile(pipeline);
        pipeline.nodes[0].config["label"] = "changed";
        REQUIRE(compiled->nodes()[0].config["label"] == "A");
    }
}
