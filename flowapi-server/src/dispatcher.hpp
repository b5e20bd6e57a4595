/**
 * @file dispatcher.hpp
 * @brief Per-request admission, execution and response mapping
 *
 * The dispatcher is transport-independent: the HTTP server converts each
 * request into a Request and writes back the Response. dispatch() is const,
 * reads only the shared route table, and keeps all mutable state in a
 * per-call ExecutionContext, so any number of threads may call it at once.
 */

#ifndef FLOWAPI_DISPATCHER_HPP
#define FLOWAPI_DISPATCHER_HPP

#include "route_table.hpp"
#include "pipeline_executor.hpp"
#include <map>
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <chrono>
#include <utility>

namespace flowapi {

/**
 * @brief Transport-neutral request
 */
struct Request {
    std::string method;                             // Upper-case verb
    std::string target;                             // Path plus optional "?query"
    std::map<std::string, std::string> headers;     // Lower-case names
    std::string body;
    std::string client_host;
    unsigned short client_port;

    Request() : client_port(0) {}
    Request(const std::string& method_, const std::string& target_, const std::string& body_ = "")
        : method(method_), target(target_), body(body_), client_port(0) {}
};

/**
 * @brief Transport-neutral response
 */
struct Response {
    int status;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    Response() : status(200) {}

    /**
     * @brief First header value with the given name (case-insensitive), or ""
     */
    std::string header(const std::string& name) const;
};

struct DispatchOptions {
    std::chrono::milliseconds request_timeout;      // 0 = no deadline

    DispatchOptions() : request_timeout(0) {}
};

/**
 * @brief Turns requests into pipeline executions
 *
 * Usage Example:
 *   @code
 *   RequestDispatcher dispatcher(route_table);
 *   Response response = dispatcher.dispatch(Request("GET", "/v1/0/hello?name=ada"));
 *   @endcode
 */
class RequestDispatcher {
public:
    explicit RequestDispatcher(
        std::shared_ptr<const RouteTable> routes,
        DispatchOptions options = DispatchOptions()
    );

    /**
     * @brief Handle one request
     *
     * Never throws for request-level problems: routing misses, size violations
     * and malformed bodies become 4xx responses; node failures become an
     * opaque 500 and deadline expiry a 504, both carrying an error id that
     * also appears in the log.
     *
     * @param cancelled Optional flag checked between nodes (e.g., client gone)
     */
    Response dispatch(const Request& request, const std::atomic<bool>* cancelled = nullptr) const;

    const RouteTable& routes() const { return *routes_; }

private:
    std::shared_ptr<const RouteTable> routes_;
    DispatchOptions options_;
};

/**
 * @brief Build the initial `data` document for a request
 *
 * `{"headers": {...}, "param": {...}, "client": [host, port]}`. Body-carrying
 * methods (POST, PUT, PATCH) take `param` from the JSON object body, others
 * from the query string; path parameters are overlaid last.
 *
 * @throws InvalidPayload If a body-carrying method sends a body that is not a JSON object
 */
Value build_request_data(const Request& request, const std::map<std::string, std::string>& path_params);

/**
 * @brief Map a finished pipeline's data to a response
 *
 * Body: `data.body` when present, else the whole document, serialized as
 * JSON. Status: `data.status` when present. Headers: `data.response_headers`.
 *
 * @throws FlowApiError If `data.status` is not an integer in [100, 599]
 */
Response build_response(const Value& data);

/**
 * @brief Random 16-hex-digit identifier
 */
std::string generate_request_id();

} // namespace flowapi

#endif // FLOWAPI_DISPATCHER_HPP
