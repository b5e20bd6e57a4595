#include <catch2/catch.hpp>
#include "../src/application.hpp"
#include "../src/config_parser.hpp"
#include "../src/errors.hpp"
#include "test_nodes.hpp"

using namespace flowapi;
using namespace flowapi::testing;

namespace {

const char* const SERVICE_YAML = R"(
request_timeout_ms: 5000
dependencies:
  - name: require-token
    pipeline:
      name: auth
      node:
        - name: check
          type: DataTransformer
          config:
            script: |
              if !has(data.headers, "x-token") {
                  data.x = 1 / 0
              }
api:
  - route: hello/{who}
    version: "1.0"
    methods: [GET]
    depends: [require-token]
    pipeline:
      node:
        - name: I
          type: DataTransformer
          config:
            script: |
              data.body = {"greeting": "hello " + data.param.who}
        - name: O
          type: DataTransformer
          config:
            script: data.status = 200
      digraph:
        - I -> O
  - route: echo
    version: "1.0"
    pipeline:
      node:
        - name: I
          type: DataTransformer
          config:
            script: data.body = data.param
)";

EndpointSpec trace_endpoint(const std::string& route, const std::string& pipeline_name) {
    EndpointSpec endpoint;
    endpoint.route = route;
    endpoint.methods = {"GET"};
    endpoint.pipeline = PipelineDef(pipeline_name);
    endpoint.pipeline.nodes.emplace_back("I", "Trace", Version(1, 0));
    return endpoint;
}

void register_trace(NodeTypeRegistry& registry) {
    registry.register_type("Trace", Version(1, 0), std::make_shared<TraceNode>());
}

} // namespace

TEST_CASE("Application startup from YAML", "[application]") {
    Application app(parse_server_config_from_yaml(SERVICE_YAML));

    SECTION("Registry is frozen with the built-ins") {
        REQUIRE(app.registry().is_frozen());
        REQUIRE(app.registry().is_registered("DataTransformer", Version(1, 0)));
    }

    SECTION("Routes and dependencies are bound") {
        REQUIRE(app.routes().list_routes() == std::vector<std::string>{
            "GET /v1/0/hello/{who}", "GET /v1/0/echo", "POST /v1/0/echo"
        });
        REQUIRE(app.dependencies().count("require-token") == 1);
        REQUIRE(app.dependencies().at("require-token")->name() == "auth");
    }

    SECTION("Dependency gate passes with the header") {
        Request request("GET", "/v1/0/hello/ada");
        request.headers["x-token"] = "t";
        Response response = app.dispatcher().dispatch(request);

        REQUIRE(response.status == 200);
        REQUIRE(Value::parse(response.body) == Value{{"greeting", "hello ada"}});
    }

    SECTION("Dependency gate fails without the header") {
        Response response = app.dispatcher().dispatch(Request("GET", "/v1/0/hello/ada"));
        REQUIRE(response.status == 500);
        REQUIRE(Value::parse(response.body)["detail"] == "Requested process failed");
    }

    SECTION("POST body reaches the pipeline") {
        Response response = app.dispatcher().dispatch(Request("POST", "/v1/0/echo", R"({"a":[1,2]})"));
        REQUIRE(response.status == 200);
        REQUIRE(Value::parse(response.body) == Value::parse(R"({"a":[1,2]})"));
    }
}

TEST_CASE("Application startup failures", "[application]") {
    SECTION("Unknown dependency") {
        ServerConfig config;
        EndpointSpec endpoint = trace_endpoint("a", "a");
        endpoint.depends.push_back("missing");
        config.api.push_back(endpoint);
        REQUIRE_THROWS_AS(Application(config, register_trace), UnknownDependency);
    }

    SECTION("Duplicate pipeline names across endpoints") {
        ServerConfig config;
        config.api.push_back(trace_endpoint("a", "same"));
        config.api.push_back(trace_endpoint("b", "same"));
        REQUIRE_THROWS_AS(Application(config, register_trace), DuplicatePipelineName);
    }

    SECTION("Duplicate dependency names") {
        ServerConfig config;
        DependencySpec dependency;
        dependency.name = "dep";
        dependency.pipeline = trace_endpoint("x", "dep").pipeline;
        config.dependencies.push_back(dependency);
        dependency.pipeline.name = "other";
        config.dependencies.push_back(dependency);
        REQUIRE_THROWS_AS(Application(config, register_trace), DuplicatePipelineName);
    }

    SECTION("Duplicate routes") {
        ServerConfig config;
        config.api.push_back(trace_endpoint("a", "first"));
        config.api.push_back(trace_endpoint("/a/", "second"));
        REQUIRE_THROWS_AS(Application(config, register_trace), DuplicateRoute);
    }

    SECTION("Unknown node type") {
        ServerConfig config;
        config.api.push_back(trace_endpoint("a", "a"));
        REQUIRE_THROWS_AS(Application(config), UnknownNodeType);
    }

    SECTION("Structural pipeline errors") {
        ServerConfig config;
        EndpointSpec endpoint = trace_endpoint("a", "a");
        endpoint.pipeline.edges.emplace_back("I", "I");
        config.api.push_back(endpoint);
        REQUIRE_THROWS_AS(Application(config, register_trace), CyclicPipeline);
    }

    SECTION("Hook cannot replace a built-in") {
        ServerConfig config;
        auto hook = [](NodeTypeRegistry& registry) {
            registry.register_type("DataTransformer", Version(1, 0), std::make_shared<TraceNode>());
        };
        REQUIRE_THROWS_AS(Application(config, hook), DuplicateNodeType);
    }

    SECTION("Missing extension aborts startup") {
        ServerConfig config;
        config.extensions.push_back("/nonexistent/libflowapi_ext.so");
        REQUIRE_THROWS_AS(Application(config), ExtensionLoadError);
    }
}

TEST_CASE("Application with a registration hook", "[application]") {
    ServerConfig config;
    config.api.push_back(trace_endpoint("trace", "trace"));
    Application app(config, register_trace);

    REQUIRE(app.registry().is_registered("Trace", Version(1, 0)));
    REQUIRE(app.routes().size() == 1);

    Response response = app.dispatcher().dispatch(Request("GET", "/v0/0/trace"));
    REQUIRE(response.status == 200);
    REQUIRE(Value::parse(response.body)["trace"] == Value::array({""}));
}
