#include "builtin_nodes.hpp"
#include "errors.hpp"
#include <curl/curl.h>
#include <thread>
#include <mutex>
#include <memory>
#include <algorithm>
#include <cctype>

namespace flowapi {

// ---------------------------------------------------------------------------
// DataTransformer
// ---------------------------------------------------------------------------

namespace {

const std::string& script_source(const Value& config) {
    if (!config.is_object() || !config.contains("script")) {
        throw FlowApiError("missing required field: script");
    }
    const Value& source = config["script"];
    if (!source.is_string()) {
        throw FlowApiError("field 'script' must be a string");
    }
    return source.get_ref<const std::string&>();
}

} // namespace

void DataTransformerNode::validate(const Value& config) const {
    get_script(config);
}

script::Script DataTransformerNode::get_script(const Value& config) const {
    const std::string& source = script_source(config);

    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        auto it = cache_.find(source);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    script::Script compiled = script::Script::compile(source);

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto result = cache_.emplace(source, compiled);
    return result.first->second;
}

NodeOutput DataTransformerNode::execute(Value data, Value state, const Value& config) const {
    script::Script compiled = get_script(config);
    compiled.run(data, state, config);
    return {std::move(data), std::move(state)};
}

// ---------------------------------------------------------------------------
// SleepOperator
// ---------------------------------------------------------------------------

std::chrono::milliseconds SleepNode::duration(const Value& config) {
    if (!config.is_object()) {
        throw FlowApiError("config must be an object");
    }

    if (config.contains("milliseconds")) {
        const Value& ms = config["milliseconds"];
        if (!ms.is_number() || ms.get<double>() < 0) {
            throw FlowApiError("field 'milliseconds' must be a non-negative number");
        }
        return std::chrono::milliseconds(static_cast<long long>(ms.get<double>()));
    }

    if (config.contains("sleep")) {
        const Value& seconds = config["sleep"];
        if (!seconds.is_number() || seconds.get<double>() < 0) {
            throw FlowApiError("field 'sleep' must be a non-negative number of seconds");
        }
        return std::chrono::milliseconds(static_cast<long long>(seconds.get<double>() * 1000.0));
    }

    return std::chrono::milliseconds(0);
}

void SleepNode::validate(const Value& config) const {
    duration(config);
}

NodeOutput SleepNode::execute(Value data, Value state, const Value& config) const {
    std::this_thread::sleep_for(duration(config));
    return {std::move(data), std::move(state)};
}

// ---------------------------------------------------------------------------
// HttpRequester
// ---------------------------------------------------------------------------

namespace {

std::once_flag curl_init_flag;

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// CURL header callback, "Name: Value\r\n" lines
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string line(buffer, total_size);

    auto* headers = static_cast<Value*>(userdata);

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        *headers = Value::object();
        return total_size;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = line.substr(0, colon_pos);
        std::string value = line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        (*headers)[name] = value;
    }

    return total_size;
}

struct CurlHandle {
    CURL* curl;
    curl_slist* headers;

    CurlHandle() : curl(curl_easy_init()), headers(nullptr) {
        if (!curl) {
            throw FlowApiError("Failed to initialize CURL");
        }
    }

    ~CurlHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        curl_easy_cleanup(curl);
    }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

HttpRequesterNode::HttpRequesterNode() {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void HttpRequesterNode::validate(const Value& config) const {
    if (!config.is_object()) {
        throw FlowApiError("config must be an object");
    }
    if (!config.contains("url") || !config["url"].is_string() ||
        config["url"].get<std::string>().empty()) {
        throw FlowApiError("missing required field: url");
    }
    if (config.contains("method") && !config["method"].is_string()) {
        throw FlowApiError("field 'method' must be a string");
    }
    if (config.contains("headers")) {
        const Value& headers = config["headers"];
        if (!headers.is_object()) {
            throw FlowApiError("field 'headers' must be an object");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (!it.value().is_string()) {
                throw FlowApiError("header '" + it.key() + "' must be a string");
            }
        }
    }
    if (config.contains("timeout_ms") &&
        (!config["timeout_ms"].is_number_integer() || config["timeout_ms"].get<long long>() <= 0)) {
        throw FlowApiError("field 'timeout_ms' must be a positive integer");
    }
    if (config.contains("output") &&
        (!config["output"].is_string() || config["output"].get<std::string>().empty())) {
        throw FlowApiError("field 'output' must be a non-empty string");
    }
}

NodeOutput HttpRequesterNode::execute(Value data, Value state, const Value& config) const {
    const std::string url = config.at("url").get<std::string>();
    const std::string method = upper(config.value("method", std::string("GET")));
    const long timeout_ms = config.value("timeout_ms", 5000L);
    const std::string output = config.value("output", std::string("response"));

    std::string request_body;
    bool has_body = data.is_object() && data.contains("body") && !data["body"].is_null();
    if (has_body) {
        const Value& body = data["body"];
        request_body = body.is_string()
            ? body.get<std::string>()
            : body.dump(-1, ' ', false, Value::error_handler_t::replace);
    }

    CurlHandle handle;
    curl_easy_setopt(handle.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(handle.curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "GET") {
        curl_easy_setopt(handle.curl, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        curl_easy_setopt(handle.curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(handle.curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    if (has_body && method != "GET" && method != "HEAD") {
        curl_easy_setopt(handle.curl, CURLOPT_POSTFIELDS, request_body.c_str());
        curl_easy_setopt(handle.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
        handle.headers = curl_slist_append(handle.headers, "Content-Type: application/json");
    }

    if (config.contains("headers")) {
        for (auto it = config["headers"].begin(); it != config["headers"].end(); ++it) {
            std::string header_line = it.key() + ": " + it.value().get<std::string>();
            handle.headers = curl_slist_append(handle.headers, header_line.c_str());
        }
    }
    if (handle.headers) {
        curl_easy_setopt(handle.curl, CURLOPT_HTTPHEADER, handle.headers);
    }

    std::string response_body;
    Value response_headers = Value::object();

    curl_easy_setopt(handle.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle.curl, CURLOPT_HEADERDATA, &response_headers);

    CURLcode res = curl_easy_perform(handle.curl);
    if (res != CURLE_OK) {
        throw FlowApiError(method + " " + url + " failed: " + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(handle.curl, CURLINFO_RESPONSE_CODE, &status_code);

    Value result = Value::object();
    result["status"] = status_code;
    result["headers"] = std::move(response_headers);

    Value parsed = Value::parse(response_body, nullptr, false);
    result["body"] = parsed.is_discarded() ? Value(response_body) : std::move(parsed);

    if (!data.is_object()) {
        data = Value::object();
    }
    data[output] = std::move(result);
    return {std::move(data), std::move(state)};
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void register_builtin_node_types(NodeTypeRegistry& registry) {
    registry.register_type(NodeTypeName::DATA_TRANSFORMER, Version(1, 0),
                           std::make_shared<DataTransformerNode>());
    registry.register_type(NodeTypeName::SLEEP_OPERATOR, Version(1, 0),
                           std::make_shared<SleepNode>());
    registry.register_type(NodeTypeName::HTTP_REQUESTER, Version(1, 0),
                           std::make_shared<HttpRequesterNode>());
}

} // namespace flowapi
