#include "config_parser.hpp"
#include "errors.hpp"
#include "pipeline_compiler.hpp"
#include "route_table.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <limits>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace flowapi {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }

        // A lone '$' is literal
        if (pos == name_start) {
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++; // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ---------------------------------------------------------------------------
// YAML
// ---------------------------------------------------------------------------

namespace {

Value scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted scalars carry the non-specific tag "!"
    if (node.Tag() == "!") {
        return text;
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value();
    }
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    const char* begin = text.c_str();
    char* endptr = nullptr;

    errno = 0;
    long long integer_value = std::strtoll(begin, &endptr, 10);
    if (endptr && *endptr == '\0' && errno == 0) {
        return integer_value;
    }

    errno = 0;
    double numeric_value = std::strtod(begin, &endptr);
    if (endptr && *endptr == '\0' && errno == 0 &&
        text.find_first_of("0123456789") != std::string::npos) {
        return numeric_value;
    }

    return text;
}

Value yaml_node_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return Value();

        case YAML::NodeType::Scalar:
            return scalar_to_json(node);

        case YAML::NodeType::Sequence: {
            Value array = Value::array();
            for (size_t i = 0; i < node.size(); ++i) {
                array.push_back(yaml_node_to_json(node[i]));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            Value object = Value::object();
            for (auto it : node) {
                object[it.first.as<std::string>()] = yaml_node_to_json(it.second);
            }
            return object;
        }
    }

    throw ConfigParseError("Unsupported YAML node");
}

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

std::string get_string(const Value& object, const std::string& key, const std::string& where) {
    const Value& v = object.at(key);
    if (!v.is_string()) {
        throw ConfigParseError(where + ": field '" + key + "' must be a string");
    }
    return v.get<std::string>();
}

unsigned long long get_unsigned(const Value& object, const std::string& key, const std::string& where,
                                unsigned long long max = std::numeric_limits<unsigned long long>::max()) {
    const Value& v = object.at(key);
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<long long>() < 0)) {
        throw ConfigParseError(where + ": field '" + key + "' must be a non-negative integer");
    }
    unsigned long long result = v.get<unsigned long long>();
    if (result > max) {
        throw ConfigParseError(where + ": field '" + key + "' must not exceed " + std::to_string(max));
    }
    return result;
}

Version get_version(const Value& object, const std::string& where) {
    if (!object.contains("version")) {
        return Version(0, 0);
    }
    const Value& v = object["version"];
    if (v.is_string()) {
        return Version::parse(v.get<std::string>());
    }
    // Unquoted YAML versions arrive as numbers
    if (v.is_number_integer() && v.get<long long>() >= 0) {
        return Version(v.get<unsigned int>(), 0);
    }
    if (v.is_number_float() && v.get<double>() >= 0) {
        return Version::parse(v.dump());
    }
    throw ConfigParseError(where + ": field 'version' must be \"major.minor\"");
}

std::vector<std::string> get_string_list(const Value& object, const std::string& key, const std::string& where) {
    std::vector<std::string> result;
    const Value& list = object.at(key);
    if (!list.is_array()) {
        throw ConfigParseError(where + ": field '" + key + "' must be a list");
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw ConfigParseError(where + ": field '" + key + "' must contain only strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

// Expand ${VAR} in node config strings; scripts are left untouched
Value expand_node_config(const Value& config) {
    if (config.is_string()) {
        return expand_environment_variables(config.get<std::string>());
    }
    if (config.is_array()) {
        Value result = Value::array();
        for (const auto& item : config) {
            result.push_back(expand_node_config(item));
        }
        return result;
    }
    if (config.is_object()) {
        Value result = Value::object();
        for (auto it = config.begin(); it != config.end(); ++it) {
            result[it.key()] = it.key() == "script" ? it.value() : expand_node_config(it.value());
        }
        return result;
    }
    return config;
}

PipelineDef parse_pipeline(const Value& pipeline_json, const std::string& default_name) {
    if (!pipeline_json.is_object()) {
        throw ConfigParseError("Pipeline for '" + default_name + "' must be a mapping");
    }

    PipelineDef pipeline(default_name);
    if (pipeline_json.contains("name")) {
        pipeline.name = get_string(pipeline_json, "name", "Pipeline '" + default_name + "'");
    }
    std::string where = "Pipeline '" + pipeline.name + "'";

    if (!pipeline_json.contains("node")) {
        throw ConfigParseError(where + " missing required field: node");
    }
    const Value& nodes = pipeline_json["node"];
    if (!nodes.is_array()) {
        throw ConfigParseError(where + ": field 'node' must be a list");
    }

    for (const auto& node_json : nodes) {
        if (!node_json.is_object()) {
            throw ConfigParseError(where + ": every node must be a mapping");
        }

        NodeDef node;
        if (!node_json.contains("name")) {
            throw ConfigParseError(where + ": node missing required field: name");
        }
        node.name = get_string(node_json, "name", where);

        std::string node_where = where + " node '" + node.name + "'";
        if (!node_json.contains("type")) {
            throw ConfigParseError(node_where + " missing required field: type");
        }
        node.type = get_string(node_json, "type", node_where);
        node.version = node_json.contains("version") ? get_version(node_json, node_where) : Version(1, 0);

        if (node_json.contains("config")) {
            const Value& config = node_json["config"];
            if (!config.is_object() && !config.is_null()) {
                throw ConfigParseError(node_where + ": field 'config' must be a mapping");
            }
            node.config = config.is_null() ? Value::object() : expand_node_config(config);
        }

        pipeline.nodes.push_back(std::move(node));
    }

    if (pipeline_json.contains("digraph")) {
        for (const auto& edge : get_string_list(pipeline_json, "digraph", where)) {
            pipeline.edges.push_back(parse_edge(edge));
        }
    }

    return pipeline;
}

EndpointSpec parse_endpoint(const Value& api_json, size_t index) {
    if (!api_json.is_object()) {
        throw ConfigParseError("api[" + std::to_string(index) + "] must be a mapping");
    }

    EndpointSpec endpoint;
    if (!api_json.contains("route")) {
        throw ConfigParseError("api[" + std::to_string(index) + "] missing required field: route");
    }
    endpoint.route = get_string(api_json, "route", "api[" + std::to_string(index) + "]");

    std::string where = "Endpoint '" + endpoint.route + "'";
    endpoint.version = get_version(api_json, where);

    if (api_json.contains("methods")) {
        for (auto method : get_string_list(api_json, "methods", where)) {
            std::transform(method.begin(), method.end(), method.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (method.empty()) {
                throw ConfigParseError(where + ": empty HTTP method");
            }
            endpoint.methods.insert(method);
        }
        if (endpoint.methods.empty()) {
            throw ConfigParseError(where + ": at least one method is required");
        }
    } else {
        endpoint.methods = {"GET", "POST"};
    }

    if (api_json.contains("min_size")) {
        endpoint.min_size = static_cast<size_t>(get_unsigned(api_json, "min_size", where));
    }
    if (api_json.contains("max_size")) {
        endpoint.max_size = static_cast<size_t>(get_unsigned(api_json, "max_size", where));
    }
    if (endpoint.min_size > endpoint.max_size) {
        throw ConfigParseError(where + ": min_size (" + std::to_string(endpoint.min_size) +
                               ") exceeds max_size (" + std::to_string(endpoint.max_size) + ")");
    }

    if (api_json.contains("depends")) {
        endpoint.depends = get_string_list(api_json, "depends", where);
    }

    if (!api_json.contains("pipeline")) {
        throw ConfigParseError(where + " missing required field: pipeline");
    }
    endpoint.pipeline = parse_pipeline(api_json["pipeline"], format_route(endpoint.version, endpoint.route));

    return endpoint;
}

void parse_log_settings(const Value& log_json, LogSettings& log) {
    if (!log_json.is_object()) {
        throw ConfigParseError("Field 'log' must be a mapping");
    }
    if (log_json.contains("level")) {
        log.level = get_string(log_json, "level", "log");
        std::string level = log.level;
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        static const char* const known[] = {"trace", "debug", "info", "warn", "warning", "error", "critical"};
        if (std::find(std::begin(known), std::end(known), level) == std::end(known)) {
            throw ConfigParseError("Unknown log level: " + log.level);
        }
    }
    if (log_json.contains("file")) {
        log.file = expand_environment_variables(get_string(log_json, "file", "log"));
    }
    if (log_json.contains("json")) {
        if (!log_json["json"].is_boolean()) {
            throw ConfigParseError("log: field 'json' must be a boolean");
        }
        log.json = log_json["json"].get<bool>();
    }
}

} // namespace

Value yaml_to_json(const std::string& yaml_string) {
    try {
        return yaml_node_to_json(YAML::Load(yaml_string));
    } catch (const YAML::Exception& e) {
        throw ConfigParseError(std::string("YAML parse error: ") + e.what());
    }
}

ServerConfig parse_server_config(const Value& document) {
    ServerConfig config;

    if (document.is_null()) {
        return config;
    }
    if (!document.is_object()) {
        throw ConfigParseError("Top-level document must be a mapping");
    }

    try {
        if (document.contains("address")) {
            config.address = expand_environment_variables(get_string(document, "address", "server"));
        }
        if (document.contains("port")) {
            config.port = static_cast<unsigned short>(get_unsigned(document, "port", "server", 65535));
        }
        if (document.contains("threads")) {
            config.threads = static_cast<unsigned int>(get_unsigned(document, "threads", "server", 1024));
        }
        if (document.contains("pipeline_workers")) {
            config.pipeline_workers =
                static_cast<unsigned int>(get_unsigned(document, "pipeline_workers", "server", 4096));
            if (config.pipeline_workers == 0) {
                throw ConfigParseError("server: field 'pipeline_workers' must be positive");
            }
        }
        if (document.contains("request_timeout_ms")) {
            config.request_timeout_ms = static_cast<unsigned int>(
                get_unsigned(document, "request_timeout_ms", "server", std::numeric_limits<unsigned int>::max()));
        }
        if (document.contains("log")) {
            parse_log_settings(document["log"], config.log);
        }

        if (document.contains("extensions")) {
            for (const auto& extension : get_string_list(document, "extensions", "server")) {
                config.extensions.push_back(expand_environment_variables(extension));
            }
        }

        if (document.contains("dependencies")) {
            const Value& dependencies = document["dependencies"];
            if (!dependencies.is_array()) {
                throw ConfigParseError("Field 'dependencies' must be a list");
            }
            for (const auto& dependency_json : dependencies) {
                if (!dependency_json.is_object() || !dependency_json.contains("name")) {
                    throw ConfigParseError("Dependency missing required field: name");
                }
                DependencySpec dependency;
                dependency.name = get_string(dependency_json, "name", "dependency");
                if (!dependency_json.contains("pipeline")) {
                    throw ConfigParseError("Dependency '" + dependency.name + "' missing required field: pipeline");
                }
                dependency.pipeline = parse_pipeline(dependency_json["pipeline"], dependency.name);
                config.dependencies.push_back(std::move(dependency));
            }
        }

        if (document.contains("api")) {
            const Value& api = document["api"];
            if (!api.is_array()) {
                throw ConfigParseError("Field 'api' must be a list");
            }
            for (size_t i = 0; i < api.size(); ++i) {
                config.api.push_back(parse_endpoint(api[i], i));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

ServerConfig parse_server_config_from_string(const std::string& json_string) {
    Value document;
    try {
        document = Value::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_server_config(document);
}

ServerConfig parse_server_config_from_yaml(const std::string& yaml_string) {
    return parse_server_config(yaml_to_json(yaml_string));
}

ServerConfig parse_server_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    std::string extension = fs::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    ServerConfig config = extension == ".json"
        ? parse_server_config_from_string(text)
        : parse_server_config_from_yaml(text);

    // Paths (anything with a '/') are relative to the config file; bare names go to the loader
    for (auto& extension_path : config.extensions) {
        if (extension_path.find('/') != std::string::npos) {
            extension_path = resolve_relative_path(extension_path, file_path);
        }
    }
    if (!config.log.file.empty()) {
        config.log.file = resolve_relative_path(config.log.file, file_path);
    }

    return config;
}

} // namespace flowapi
