#include "route_table.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace flowapi {

namespace {

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string segment;
    std::istringstream stream(path);
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

bool is_parameter(const std::string& segment) {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string normalize_route(const std::string& route) {
    std::string result;
    for (const auto& segment : split_segments(route)) {
        if (!result.empty()) result += "/";
        result += segment;
    }
    return result;
}

std::string format_route(const Version& version, const std::string& route) {
    std::string result = "v" + std::to_string(version.major_version) + "/" +
                         std::to_string(version.minor_version);
    std::string normalized = normalize_route(route);
    if (!normalized.empty()) {
        result += "/" + normalized;
    }
    return result;
}

std::string url_decode(const std::string& text, bool plus_as_space) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            result += ' ';
            continue;
        }
        result += c;
    }
    return result;
}

void RouteTable::bind(
    std::shared_ptr<const EndpointSpec> endpoint,
    std::shared_ptr<const CompiledPipeline> pipeline,
    std::vector<std::shared_ptr<const CompiledPipeline>> dependencies
) {
    std::string route = format_route(endpoint->version, endpoint->route);

    auto it = index_.find(route);
    if (it != index_.end()) {
        const RoutePattern& existing = patterns_[it->second];
        for (const auto& method : endpoint->methods) {
            if (existing.methods.count(method)) {
                throw DuplicateRoute(method, route);
            }
        }
    }

    if (it == index_.end()) {
        RoutePattern pattern;
        pattern.route = route;
        pattern.segments = split_segments(route);
        pattern.templated = std::any_of(pattern.segments.begin(), pattern.segments.end(), is_parameter);
        patterns_.push_back(std::move(pattern));
        it = index_.emplace(route, patterns_.size() - 1).first;
    }

    RoutePattern& pattern = patterns_[it->second];
    for (const auto& method : endpoint->methods) {
        pattern.methods[method] = RouteEntry{endpoint, pipeline, dependencies};
        pattern.method_order.push_back(method);
    }
}

bool RouteTable::match_segments(
    const RoutePattern& pattern,
    const std::vector<std::string>& path_segments,
    std::map<std::string, std::string>& params
) {
    if (pattern.segments.size() != path_segments.size()) {
        return false;
    }

    std::map<std::string, std::string> captured;
    for (size_t i = 0; i < path_segments.size(); ++i) {
        const std::string& expected = pattern.segments[i];
        if (is_parameter(expected)) {
            captured[expected.substr(1, expected.size() - 2)] = url_decode(path_segments[i]);
        } else if (expected != path_segments[i]) {
            return false;
        }
    }

    params = std::move(captured);
    return true;
}

RouteMatch RouteTable::match(const std::string& method, const std::string& path) const {
    std::string route = normalize_route(path);
    std::vector<std::string> path_segments = split_segments(route);
    std::vector<std::string> allowed;

    auto try_pattern = [&](const RoutePattern& pattern, RouteMatch& result) {
        std::map<std::string, std::string> params;
        if (!match_segments(pattern, path_segments, params)) {
            return false;
        }
        auto entry = pattern.methods.find(method);
        if (entry == pattern.methods.end()) {
            for (const auto& m : pattern.method_order) {
                if (std::find(allowed.begin(), allowed.end(), m) == allowed.end()) {
                    allowed.push_back(m);
                }
            }
            return false;
        }
        result = RouteMatch{&entry->second, pattern.route, std::move(params)};
        return true;
    };

    RouteMatch result{nullptr, "", {}};

    auto exact = index_.find(route);
    if (exact != index_.end() && !patterns_[exact->second].templated) {
        if (try_pattern(patterns_[exact->second], result)) {
            return result;
        }
    }

    for (const auto& pattern : patterns_) {
        if (pattern.templated && try_pattern(pattern, result)) {
            return result;
        }
    }

    if (!allowed.empty()) {
        throw MethodNotAllowed(method, "/" + route, allowed);
    }
    throw NoSuchEndpoint("/" + route);
}

std::vector<std::string> RouteTable::list_routes() const {
    std::vector<std::string> routes;
    for (const auto& pattern : patterns_) {
        for (const auto& method : pattern.method_order) {
            routes.push_back(method + " /" + pattern.route);
        }
    }
    return routes;
}

size_t RouteTable::max_body_size() const {
    size_t result = 0;
    for (const auto& pattern : patterns_) {
        for (const auto& [method, entry] : pattern.methods) {
            result = std::max(result, entry.endpoint->max_size);
        }
    }
    return result;
}

size_t RouteTable::size() const {
    size_t count = 0;
    for (const auto& pattern : patterns_) {
        count += pattern.methods.size();
    }
    return count;
}

std::unique_ptr<RouteTable> bind_routes(const std::vector<BoundEndpoint>& endpoints) {
    auto table = std::make_unique<RouteTable>();
    Logger& logger = Logger::get_instance();

    for (const auto& bound : endpoints) {
        table->bind(bound.endpoint, bound.pipeline, bound.dependencies);

        std::string route = format_route(bound.endpoint->version, bound.endpoint->route);
        for (const auto& method : bound.endpoint->methods) {
            logger.log_route_bound(method, route, bound.pipeline->name());
        }
    }

    return table;
}

} // namespace flowapi
