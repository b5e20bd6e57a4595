#include <catch2/catch.hpp>
#include "../src/route_table.hpp"
#include "../src/errors.hpp"
#include "test_nodes.hpp"

using namespace flowapi;
using namespace flowapi::testing;

namespace {

struct RouteFixture {
    NodeTypeRegistry registry;

    RouteFixture() {
        registry.register_type("Trace", Version(1, 0), std::make_shared<TraceNode>());
        registry.freeze();
    }

    std::shared_ptr<const CompiledPipeline> pipeline(const std::string& name) const {
        PipelineDef def(name);
        def.nodes.emplace_back("I", "Trace", Version(1, 0));
        return PipelineCompiler(registry).compile(def);
    }

    std::shared_ptr<const EndpointSpec> endpoint(const std::string& route,
                                                 std::set<std::string> methods = {"GET", "POST"},
                                                 Version version = Version(1, 0),
                                                 size_t max_size = 1024) const {
        auto result = std::make_shared<EndpointSpec>();
        result->route = route;
        result->methods = std::move(methods);
        result->version = version;
        result->max_size = max_size;
        return result;
    }
};

} // namespace

TEST_CASE("Route formatting", "[route_table]") {
    SECTION("normalize_route strips and collapses slashes") {
        REQUIRE(normalize_route("/hello/") == "hello");
        REQUIRE(normalize_route("//a///b") == "a/b");
        REQUIRE(normalize_route("/") == "");
    }

    SECTION("format_route prefixes the version") {
        REQUIRE(format_route(Version(1, 0), "hello") == "v1/0/hello");
        REQUIRE(format_route(Version(2, 13), "/a/b/") == "v2/13/a/b");
        REQUIRE(format_route(Version(0, 0), "") == "v0/0");
    }

    SECTION("url_decode") {
        REQUIRE(url_decode("a%20b") == "a b");
        REQUIRE(url_decode("a+b") == "a+b");
        REQUIRE(url_decode("a+b", true) == "a b");
        REQUIRE(url_decode("%7Bx%7d") == "{x}");
        REQUIRE(url_decode("100%") == "100%");
        REQUIRE(url_decode("%zz") == "%zz");
        REQUIRE(url_decode("%4") == "%4");
    }
}

TEST_CASE("RouteTable binding", "[route_table]") {
    RouteFixture fixture;
    RouteTable table;

    SECTION("Each method of an endpoint is bound") {
        table.bind(fixture.endpoint("hello"), fixture.pipeline("hello"));
        REQUIRE(table.size() == 2);
        REQUIRE(table.list_routes() == std::vector<std::string>{"GET /v1/0/hello", "POST /v1/0/hello"});
    }

    SECTION("Same route under different versions is distinct") {
        table.bind(fixture.endpoint("hello"), fixture.pipeline("a"));
        REQUIRE_NOTHROW(table.bind(fixture.endpoint("hello", {"GET"}, Version(2, 0)), fixture.pipeline("b")));
        REQUIRE(table.size() == 3);
    }

    SECTION("Disjoint methods on one route are allowed") {
        table.bind(fixture.endpoint("items", {"GET"}), fixture.pipeline("list"));
        table.bind(fixture.endpoint("items", {"DELETE"}), fixture.pipeline("clear"));
        REQUIRE(table.match("GET", "/v1/0/items").entry->pipeline->name() == "list");
        REQUIRE(table.match("DELETE", "/v1/0/items").entry->pipeline->name() == "clear");
    }

    SECTION("Duplicate (route, method) is rejected and binds nothing") {
        table.bind(fixture.endpoint("hello", {"GET"}), fixture.pipeline("a"));
        REQUIRE_THROWS_AS(
            table.bind(fixture.endpoint("/hello/", {"POST", "GET"}), fixture.pipeline("b")),
            DuplicateRoute
        );
        REQUIRE(table.size() == 1);
        REQUIRE_THROWS_AS(table.match("POST", "/v1/0/hello"), MethodNotAllowed);
    }

    SECTION("Largest body limit over all endpoints") {
        table.bind(fixture.endpoint("a", {"GET"}, Version(1, 0), 10), fixture.pipeline("a"));
        table.bind(fixture.endpoint("b", {"GET"}, Version(1, 0), 5000), fixture.pipeline("b"));
        REQUIRE(table.max_body_size() == 5000);
    }
}

TEST_CASE("RouteTable lookup", "[route_table]") {
    RouteFixture fixture;
    RouteTable table;
    table.bind(fixture.endpoint("hello"), fixture.pipeline("hello"));
    table.bind(fixture.endpoint("users/{id}", {"GET"}), fixture.pipeline("user"));
    table.bind(fixture.endpoint("users/me", {"GET"}), fixture.pipeline("me"));
    table.bind(fixture.endpoint("users/{id}/posts/{post}", {"GET"}), fixture.pipeline("post"));

    SECTION("Exact route") {
        RouteMatch match = table.match("POST", "/v1/0/hello");
        REQUIRE(match.entry->pipeline->name() == "hello");
        REQUIRE(match.route == "v1/0/hello");
        REQUIRE(match.path_params.empty());
    }

    SECTION("Trailing slash is tolerated") {
        REQUIRE(table.match("GET", "/v1/0/hello/").entry->pipeline->name() == "hello");
    }

    SECTION("Template captures decoded parameters") {
        RouteMatch match = table.match("GET", "/v1/0/users/ada%20l/posts/7");
        REQUIRE(match.entry->pipeline->name() == "post");
        REQUIRE(match.route == "v1/0/users/{id}/posts/{post}");
        REQUIRE(match.path_params == std::map<std::string, std::string>{{"id", "ada l"}, {"post", "7"}});
    }

    SECTION("Concrete route wins over a template bound earlier") {
        REQUIRE(table.match("GET", "/v1/0/users/me").entry->pipeline->name() == "me");
        REQUIRE(table.match("GET", "/v1/0/users/42").entry->pipeline->name() == "user");
    }

    SECTION("Unknown path") {
        REQUIRE_THROWS_AS(table.match("GET", "/v1/0/nothing"), NoSuchEndpoint);
        REQUIRE_THROWS_AS(table.match("GET", "/v2/0/hello"), NoSuchEndpoint);
        REQUIRE_THROWS_AS(table.match("GET", "/hello"), NoSuchEndpoint);
    }

    SECTION("Known path, wrong method lists the allowed methods") {
        try {
            table.match("DELETE", "/v1/0/hello");
            FAIL("Expected MethodNotAllowed");
        } catch (const MethodNotAllowed& e) {
            REQUIRE(e.http_status() == 405);
            REQUIRE(e.allowed() == std::vector<std::string>{"GET", "POST"});
        }
    }

    SECTION("Status codes of lookup failures") {
        try {
            table.match("GET", "/v1/0/nothing");
            FAIL("Expected NoSuchEndpoint");
        } catch (const DispatchError& e) {
            REQUIRE(e.http_status() == 404);
        }
    }
}

TEST_CASE("bind_routes", "[route_table]") {
    RouteFixture fixture;

    SECTION("Builds a table from compiled endpoints") {
        std::vector<BoundEndpoint> endpoints = {
            {fixture.endpoint("a"), fixture.pipeline("a"), {}},
            {fixture.endpoint("b", {"PUT"}), fixture.pipeline("b"), {fixture.pipeline("dep")}},
        };
        auto table = bind_routes(endpoints);
        REQUIRE(table->size() == 3);

        RouteMatch match = table->match("PUT", "/v1/0/b");
        REQUIRE(match.entry->dependencies.size() == 1);
        REQUIRE(match.entry->dependencies[0]->name() == "dep");
    }

    SECTION("Duplicates abort") {
        std::vector<BoundEndpoint> endpoints = {
            {fixture.endpoint("a"), fixture.pipeline("a"), {}},
            {fixture.endpoint("a", {"GET"}), fixture.pipeline("b"), {}},
        };
        REQUIRE_THROWS_AS(bind_routes(endpoints), DuplicateRoute);
    }
}
