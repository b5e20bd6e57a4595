#include <catch2/catch.hpp>
#include "../src/config_parser.hpp"
#include "../src/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace flowapi;

namespace fs = std::filesystem;

namespace {

const char* const HELLO_YAML = R"(
address: 127.0.0.1
port: 8080
threads: 2
pipeline_workers: 4
request_timeout_ms: 1500
log:
  level: debug
  json: false
dependencies:
  - name: auth
    pipeline:
      node:
        - name: check
          type: DataTransformer
          config:
            script: data.authorized = true
api:
  - route: hello/{who}
    version: "1.2"
    methods: [get, Post]
    min_size: 0
    max_size: 2048
    depends: [auth]
    pipeline:
      name: hello-pipeline
      node:
        - name: I
          type: DataTransformer
          config:
            script: |
              data.body = {"greeting": "hello " + data.param.who}
        - name: O
          type: SleepOperator
          version: 1.0
          config:
            milliseconds: 1
      digraph:
        - I -> O
  - route: /ping
    pipeline:
      node:
        - name: I
          type: DataTransformer
          config: {script: "data.body = 'pong'"}
)";

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("flowapi_config_test_" + std::to_string(std::rand()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = path / name;
        std::ofstream out(file);
        out << content;
        return file.string();
    }
};

} // namespace

TEST_CASE("YAML configuration", "[config_parser]") {
    ServerConfig config = parse_server_config_from_yaml(HELLO_YAML);

    SECTION("Server settings") {
        REQUIRE(config.address == "127.0.0.1");
        REQUIRE(config.port == 8080);
        REQUIRE(config.threads == 2);
        REQUIRE(config.pipeline_workers == 4);
        REQUIRE(config.request_timeout_ms == 1500);
        REQUIRE(config.log.level == "debug");
        REQUIRE_FALSE(config.log.json);
    }

    SECTION("Dependencies") {
        REQUIRE(config.dependencies.size() == 1);
        REQUIRE(config.dependencies[0].name == "auth");
        REQUIRE(config.dependencies[0].pipeline.name == "auth");
        REQUIRE(config.dependencies[0].pipeline.nodes[0].config["script"] == "data.authorized = true");
    }

    SECTION("Endpoint with explicit fields") {
        REQUIRE(config.api.size() == 2);
        const EndpointSpec& hello = config.api[0];
        REQUIRE(hello.route == "hello/{who}");
        REQUIRE(hello.version == Version(1, 2));
        REQUIRE(hello.methods == std::set<std::string>{"GET", "POST"});
        REQUIRE(hello.max_size == 2048);
        REQUIRE(hello.depends == std::vector<std::string>{"auth"});
        REQUIRE(hello.pipeline.name == "hello-pipeline");

        REQUIRE(hello.pipeline.nodes.size() == 2);
        REQUIRE(hello.pipeline.nodes[0].type == "DataTransformer");
        REQUIRE(hello.pipeline.nodes[0].version == Version(1, 0));
        REQUIRE(hello.pipeline.nodes[1].config["milliseconds"] == 1);
        REQUIRE(hello.pipeline.edges == std::vector<Edge>{Edge("I", "O")});
    }

    SECTION("Endpoint defaults") {
        const EndpointSpec& ping = config.api[1];
        REQUIRE(ping.route == "/ping");
        REQUIRE(ping.version == Version(0, 0));
        REQUIRE(ping.methods == std::set<std::string>{"GET", "POST"});
        REQUIRE(ping.min_size == 0);
        REQUIRE(ping.max_size == 1024 * 1024);
        REQUIRE(ping.depends.empty());
        REQUIRE(ping.pipeline.name == "v0/0/ping");
        REQUIRE(ping.pipeline.edges.empty());
    }
}

TEST_CASE("Configuration defaults", "[config_parser]") {
    SECTION("Empty document") {
        ServerConfig config = parse_server_config_from_yaml("");
        REQUIRE(config.address == "0.0.0.0");
        REQUIRE(config.port == 1979);
        REQUIRE(config.threads == 0);
        REQUIRE(config.pipeline_workers == 16);
        REQUIRE(config.request_timeout_ms == 0);
        REQUIRE(config.log.level == "info");
        REQUIRE(config.log.json);
        REQUIRE(config.api.empty());
    }

    SECTION("JSON documents use the same schema") {
        ServerConfig config = parse_server_config_from_string(R"({
            "port": 9000,
            "api": [{"route": "x", "methods": ["PUT"],
                     "pipeline": {"node": [{"name": "I", "type": "SleepOperator"}]}}]
        })");
        REQUIRE(config.port == 9000);
        REQUIRE(config.api[0].methods == std::set<std::string>{"PUT"});
        REQUIRE(config.api[0].pipeline.nodes[0].config == Value::object());
    }
}

TEST_CASE("YAML scalar typing", "[config_parser]") {
    Value v = yaml_to_json(R"(
int: 42
negative: -3
float: 2.5
yes_bool: true
no_bool: False
tilde: ~
quoted_number: "42"
single_quoted: 'true'
text: hello world
list: [1, two]
)");

    REQUIRE(v["int"] == 42);
    REQUIRE(v["negative"] == -3);
    REQUIRE(v["float"] == 2.5);
    REQUIRE(v["yes_bool"] == true);
    REQUIRE(v["no_bool"] == false);
    REQUIRE(v["tilde"].is_null());
    REQUIRE(v["quoted_number"] == "42");
    REQUIRE(v["single_quoted"] == "true");
    REQUIRE(v["text"] == "hello world");
    REQUIRE(v["list"] == Value::array({1, "two"}));

    SECTION("Malformed YAML") {
        REQUIRE_THROWS_AS(yaml_to_json("a: [1, 2"), ConfigParseError);
    }
}

TEST_CASE("Environment variable expansion", "[config_parser]") {
    setenv("FLOWAPI_TEST_HOST", "db.internal", 1);
    unsetenv("FLOWAPI_TEST_UNSET");

    SECTION("Braced and bare references") {
        REQUIRE(expand_environment_variables("http://${FLOWAPI_TEST_HOST}:5432") == "http://db.internal:5432");
        REQUIRE(expand_environment_variables("$FLOWAPI_TEST_HOST/x") == "db.internal/x");
    }

    SECTION("Unset variables expand to empty") {
        REQUIRE(expand_environment_variables("a${FLOWAPI_TEST_UNSET}b") == "ab");
    }

    SECTION("Lone dollar signs are literal") {
        REQUIRE(expand_environment_variables("cost: 5$") == "cost: 5$");
        REQUIRE(expand_environment_variables("$ 1") == "$ 1");
    }

    SECTION("Unterminated reference") {
        REQUIRE_THROWS_AS(expand_environment_variables("${FLOWAPI_TEST_HOST"), ConfigParseError);
    }

    SECTION("Node config strings are expanded but scripts are not") {
        ServerConfig config = parse_server_config_from_yaml(R"(
api:
  - route: x
    pipeline:
      node:
        - name: H
          type: HttpRequester
          config:
            url: http://${FLOWAPI_TEST_HOST}/items
            headers: {Host: $FLOWAPI_TEST_HOST}
        - name: T
          type: DataTransformer
          config:
            script: data.x = "${FLOWAPI_TEST_HOST}"
)");
        const auto& nodes = config.api[0].pipeline.nodes;
        REQUIRE(nodes[0].config["url"] == "http://db.internal/items");
        REQUIRE(nodes[0].config["headers"]["Host"] == "db.internal");
        REQUIRE(nodes[1].config["script"] == "data.x = \"${FLOWAPI_TEST_HOST}\"");
    }
}

TEST_CASE("Configuration errors", "[config_parser]") {
    auto endpoint_with = [](const std::string& fields) {
        return "api:\n  - route: x\n" + fields +
               "    pipeline:\n      node:\n        - {name: I, type: SleepOperator}\n";
    };

    SECTION("Top level") {
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("- just\n- a list\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("port: 70000\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("port: -1\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("port: http\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("pipeline_workers: 0\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("api: {}\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("log: {level: loud}\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_string("{\"port\": "), ConfigParseError);
    }

    SECTION("Endpoints") {
        REQUIRE_NOTHROW(parse_server_config_from_yaml(endpoint_with("")));
        REQUIRE_THROWS_AS(parse_server_config_from_yaml(endpoint_with("    methods: []\n")), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml(endpoint_with("    methods: GET\n")), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml(endpoint_with("    min_size: 10\n    max_size: 5\n")),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml(endpoint_with("    version: one\n")), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("api:\n  - pipeline: {node: []}\n"), ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("api:\n  - route: x\n"), ConfigParseError);
    }

    SECTION("Pipelines") {
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("api:\n  - route: x\n    pipeline: {}\n"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(
            parse_server_config_from_yaml("api:\n  - route: x\n    pipeline:\n      node:\n        - {type: A}\n"),
            ConfigParseError);
        REQUIRE_THROWS_AS(
            parse_server_config_from_yaml("api:\n  - route: x\n    pipeline:\n      node:\n        - {name: A}\n"),
            ConfigParseError);
        REQUIRE_THROWS_AS(
            parse_server_config_from_yaml(
                "api:\n  - route: x\n    pipeline:\n      node:\n        - {name: A, type: T, config: [1]}\n"),
            ConfigParseError);
        REQUIRE_THROWS_AS(
            parse_server_config_from_yaml(
                "api:\n  - route: x\n    pipeline:\n      node:\n        - {name: A, type: T}\n"
                "      digraph: [A B]\n"),
            ConfigParseError);
    }

    SECTION("Dependencies") {
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("dependencies:\n  - pipeline: {node: []}\n"),
                          ConfigParseError);
        REQUIRE_THROWS_AS(parse_server_config_from_yaml("dependencies:\n  - name: auth\n"), ConfigParseError);
    }
}

TEST_CASE("Configuration files", "[config_parser]") {
    TempDir dir;

    SECTION("YAML file with relative extension and log paths") {
        std::string path = dir.write("service.yaml",
            "extensions:\n  - plugins/libcustom.so\n  - geo\n"
            "log:\n  file: logs/server.log\n");
        ServerConfig config = parse_server_config_from_file(path);

        REQUIRE(config.extensions.size() == 2);
        REQUIRE(config.extensions[0] == (dir.path / "plugins/libcustom.so").string());
        REQUIRE(config.extensions[1] == "geo");
        REQUIRE(config.log.file == (dir.path / "logs/server.log").string());
    }

    SECTION("JSON file is detected by extension") {
        std::string path = dir.write("service.json", R"({"port": 4242})");
        REQUIRE(parse_server_config_from_file(path).port == 4242);
    }

    SECTION("Absolute paths are kept") {
        REQUIRE(resolve_relative_path("/opt/ext.so", "/etc/flowapi/server.yaml") == "/opt/ext.so");
        REQUIRE(resolve_relative_path("ext.so", "/etc/flowapi/server.yaml") == "/etc/flowapi/ext.so");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_server_config_from_file((dir.path / "absent.yaml").string()), ConfigParseError);
    }
}
