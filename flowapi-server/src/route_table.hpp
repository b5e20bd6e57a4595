/**
 * @file route_table.hpp
 * @brief Versioned route table binding (route, method) to compiled pipelines
 *
 * External routes have the form `v<major>/<minor>/<route>`. Route segments
 * written `{name}` capture a path parameter. Lookups try the concrete route
 * first, then templated routes in the order they were bound.
 *
 * The table is filled once at startup and only read afterwards; lookups take
 * no locks.
 */

#ifndef FLOWAPI_ROUTE_TABLE_HPP
#define FLOWAPI_ROUTE_TABLE_HPP

#include "pipeline_def.hpp"
#include "pipeline_compiler.hpp"
#include <map>
#include <string>
#include <vector>
#include <memory>

namespace flowapi {

/**
 * @brief What a (route, method) pair dispatches to
 */
struct RouteEntry {
    std::shared_ptr<const EndpointSpec> endpoint;
    std::shared_ptr<const CompiledPipeline> pipeline;
    std::vector<std::shared_ptr<const CompiledPipeline>> dependencies;  ///< Run first, in order
};

/**
 * @brief Result of a successful lookup
 */
struct RouteMatch {
    const RouteEntry* entry;                            ///< Owned by the table
    std::string route;                                  ///< Bound route, e.g. "v1/0/hello/{who}"
    std::map<std::string, std::string> path_params;     ///< Decoded `{name}` captures
};

/**
 * @brief Strip leading and trailing slashes and collapse repeated ones
 */
std::string normalize_route(const std::string& route);

/**
 * @brief Build the external route "v<major>/<minor>/<route>"
 */
std::string format_route(const Version& version, const std::string& route);

/**
 * @brief Decode %XX escapes (and '+' as space when plus_as_space is set)
 *
 * Malformed escapes are kept verbatim.
 */
std::string url_decode(const std::string& text, bool plus_as_space = false);

class RouteTable {
public:
    RouteTable() = default;

    RouteTable(const RouteTable&) = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    /**
     * @brief Bind every method of an endpoint
     *
     * @throws DuplicateRoute If any (version, route, method) is already bound;
     *         nothing is bound in that case
     */
    void bind(
        std::shared_ptr<const EndpointSpec> endpoint,
        std::shared_ptr<const CompiledPipeline> pipeline,
        std::vector<std::shared_ptr<const CompiledPipeline>> dependencies = {}
    );

    /**
     * @brief Find the entry for a request path (without query string)
     *
     * @throws NoSuchEndpoint If no route matches the path
     * @throws MethodNotAllowed If routes match but none accepts the method
     */
    RouteMatch match(const std::string& method, const std::string& path) const;

    /**
     * @brief Bound routes as "METHOD /route", in binding order
     */
    std::vector<std::string> list_routes() const;

    /**
     * @brief Largest max_size over all bound endpoints
     */
    size_t max_body_size() const;

    size_t size() const;

private:
    struct RoutePattern {
        std::string route;
        std::vector<std::string> segments;
        bool templated;
        std::map<std::string, RouteEntry> methods;
        std::vector<std::string> method_order;
    };

    std::vector<RoutePattern> patterns_;
    std::map<std::string, size_t> index_;   ///< route -> position in patterns_

    static bool match_segments(
        const RoutePattern& pattern,
        const std::vector<std::string>& path_segments,
        std::map<std::string, std::string>& params
    );
};

/**
 * @brief An endpoint together with its compiled pipelines, ready to bind
 */
struct BoundEndpoint {
    std::shared_ptr<const EndpointSpec> endpoint;
    std::shared_ptr<const CompiledPipeline> pipeline;
    std::vector<std::shared_ptr<const CompiledPipeline>> dependencies;
};

/**
 * @brief Build a route table from compiled endpoints, logging each binding
 *
 * @throws DuplicateRoute
 */
std::unique_ptr<RouteTable> bind_routes(const std::vector<BoundEndpoint>& endpoints);

} // namespace flowapi

#endif // FLOWAPI_ROUTE_TABLE_HPP
