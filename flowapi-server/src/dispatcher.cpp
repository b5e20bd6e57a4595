#include "dispatcher.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <random>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace flowapi {

namespace {

const char* const CONTENT_TYPE_JSON = "application/json";

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool carries_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

std::string serialize(const Value& value) {
    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

Response json_response(int status, const Value& body) {
    Response response;
    response.status = status;
    response.headers.emplace_back("Content-Type", CONTENT_TYPE_JSON);
    response.body = serialize(body);
    return response;
}

Value parse_query(const std::string& query) {
    Value params = Value::object();
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq), true);
        std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1), true);
        params[key] = value;
    }
    return params;
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

std::string Response::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return "";
}

std::string generate_request_id() {
    thread_local std::mt19937_64 generator(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << generator();
    return oss.str();
}

Value build_request_data(const Request& request, const std::map<std::string, std::string>& path_params) {
    Value data = Value::object();

    Value headers = Value::object();
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }
    data["headers"] = std::move(headers);

    Value param = Value::object();
    if (carries_body(request.method)) {
        if (!request.body.empty()) {
            param = Value::parse(request.body, nullptr, false);
            if (param.is_discarded()) {
                throw InvalidPayload("body is not valid JSON");
            }
            if (!param.is_object()) {
                throw InvalidPayload("body must be a JSON object");
            }
        }
    } else {
        size_t query_pos = request.target.find('?');
        if (query_pos != std::string::npos) {
            param = parse_query(request.target.substr(query_pos + 1));
        }
    }
    for (const auto& [name, value] : path_params) {
        param[name] = value;
    }
    data["param"] = std::move(param);

    data["client"] = Value::array({request.client_host, request.client_port});
    return data;
}

Response build_response(const Value& data) {
    Response response;

    bool is_object = data.is_object();

    if (is_object && data.contains("status")) {
        const Value& status = data["status"];
        if (!status.is_number_integer() || status.get<long long>() < 100 || status.get<long long>() > 599) {
            throw FlowApiError("data.status must be an integer HTTP status, got " + serialize(status));
        }
        response.status = status.get<int>();
    }

    bool has_content_type = false;
    if (is_object && data.contains("response_headers")) {
        const Value& headers = data["response_headers"];
        if (!headers.is_object()) {
            throw FlowApiError("data.response_headers must be an object");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            std::string value = it.value().is_string() ? it.value().get<std::string>() : serialize(it.value());
            if (iequals(it.key(), "Content-Type")) {
                has_content_type = true;
            }
            response.headers.emplace_back(it.key(), value);
        }
    }
    if (!has_content_type) {
        response.headers.emplace_back("Content-Type", CONTENT_TYPE_JSON);
    }

    response.body = (is_object && data.contains("body")) ? serialize(data["body"]) : serialize(data);
    return response;
}

RequestDispatcher::RequestDispatcher(std::shared_ptr<const RouteTable> routes, DispatchOptions options)
    : routes_(std::move(routes)), options_(options) {
    if (!routes_) {
        throw FlowApiError("RequestDispatcher requires a route table");
    }
}

Response RequestDispatcher::dispatch(const Request& request, const std::atomic<bool>* cancelled) const {
    auto start_time = std::chrono::steady_clock::now();
    Logger& logger = Logger::get_instance();

    std::string path = request.target.substr(0, request.target.find('?'));
    LogContext ctx(generate_request_id(), request.method, path);

    // Admission: nothing below runs a node until routing, size and body checks pass
    RouteMatch match{nullptr, "", {}};
    Value data;
    try {
        match = routes_->match(request.method, path);
        ctx.route = match.route;

        const EndpointSpec& endpoint = *match.entry->endpoint;
        size_t body_size = request.body.size();
        if (body_size < endpoint.min_size || body_size > endpoint.max_size) {
            throw PayloadSizeViolation(body_size, endpoint.min_size, endpoint.max_size);
        }

        data = build_request_data(request, match.path_params);
    } catch (const DispatchError& e) {
        logger.log_request_rejected(ctx, e.http_status(), e.what());

        Response response = json_response(e.http_status(), Value{{"detail", e.what()}});
        if (const auto* not_allowed = dynamic_cast<const MethodNotAllowed*>(&e)) {
            std::string allow;
            for (const auto& method : not_allowed->allowed()) {
                if (!allow.empty()) allow += ", ";
                allow += method;
            }
            response.headers.emplace_back("Allow", allow);
        }
        return response;
    }

    ExecutionLimits limits;
    if (options_.request_timeout.count() > 0) {
        limits = ExecutionLimits::with_timeout(options_.request_timeout);
    }
    limits.cancelled = cancelled;

    Response response;
    try {
        for (const auto& dependency : match.entry->dependencies) {
            ExecutionContext dependency_context(data);
            execute_pipeline(*dependency, dependency_context, limits, ctx);
        }

        ExecutionContext context(std::move(data));
        execute_pipeline(*match.entry->pipeline, context, limits, ctx);

        response = build_response(context.data);
    } catch (const OperatorError& e) {
        logger.log_node_failure(ctx, e);
        response = json_response(500, Value{
            {"detail", "Requested process failed"},
            {"error_id", ctx.request_id}
        });
    } catch (const PipelineCancelled& e) {
        logger.log_error(ctx, e.what());
        response = json_response(504, Value{
            {"detail", "Request deadline exceeded"},
            {"error_id", ctx.request_id}
        });
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        response = json_response(500, Value{
            {"detail", "Requested process failed"},
            {"error_id", ctx.request_id}
        });
    }

    logger.log_request_complete(ctx, response.status, elapsed_ms(start_time));
    return response;
}

} // namespace flowapi
