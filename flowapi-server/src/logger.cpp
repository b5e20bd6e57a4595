#include "logger.hpp"
#include "errors.hpp"
#include "pipeline_compiler.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace flowapi {

namespace {

// ISO 8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[24];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%s.%03dZ", date, static_cast<int>(millis));
    return stamp;
}

std::string format_ms(double duration_ms) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", duration_ms);
    return buffer;
}

LogFields with_context(const LogContext& ctx, LogFields fields) {
    if (!ctx.request_id.empty()) fields["request_id"] = ctx.request_id;
    if (!ctx.method.empty()) fields["method"] = ctx.method;
    if (!ctx.route.empty()) fields["route"] = ctx.route;
    if (!ctx.pipeline.empty()) fields["pipeline"] = ctx.pipeline;
    return fields;
}

} // namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

LogLevel string_to_level(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, LogLevel> levels = {
        {"trace", LogLevel::DEBUG},
        {"debug", LogLevel::DEBUG},
        {"info", LogLevel::INFO},
        {"warn", LogLevel::WARN},
        {"warning", LogLevel::WARN},
        {"error", LogLevel::ERROR},
        {"critical", LogLevel::ERROR},
    };
    auto it = levels.find(lowered);
    return it == levels.end() ? LogLevel::INFO : it->second;
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (file_.is_open()) {
        file_.close();
    }
    if (config_.enable_file) {
        file_.clear();
        file_.open(config_.log_file_path, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "flowapi: cannot open log file " << config_.log_file_path << '\n';
        }
    }
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void Logger::log_pipeline_compiled(const CompiledPipeline& pipeline) {
    std::string order;
    for (const auto& name : pipeline.execution_order()) {
        if (!order.empty()) order += " -> ";
        order += name;
    }

    emit(LogLevel::INFO, "Pipeline compiled", {
        {"event", "pipeline_compiled"},
        {"pipeline", pipeline.name()},
        {"node_count", std::to_string(pipeline.size())},
        {"execution_order", order}
    });
}

void Logger::log_route_bound(const std::string& method, const std::string& route, const std::string& pipeline) {
    emit(LogLevel::INFO, "Route bound", {
        {"event", "route_bound"},
        {"method", method},
        {"route", "/" + route},
        {"pipeline", pipeline}
    });
}

void Logger::log_node_complete(const LogContext& ctx, const std::string& node_name,
                               const std::string& node_type, double duration_ms) {
    // Hot path: skip building the record when DEBUG is off
    if (!is_enabled(LogLevel::DEBUG)) {
        return;
    }
    emit(LogLevel::DEBUG, "Node completed", with_context(ctx, {
        {"event", "node_complete"},
        {"node", node_name},
        {"node_type", node_type},
        {"duration_ms", format_ms(duration_ms)}
    }));
}

void Logger::log_node_failure(const LogContext& ctx, const OperatorError& error) {
    emit(LogLevel::ERROR, "Pipeline node failed", with_context(ctx, {
        {"event", "node_failure"},
        {"node", error.node_name()},
        {"node_type", error.node_type()},
        {"error_message", error.detail()}
    }));
}

void Logger::log_request_complete(const LogContext& ctx, int status, double duration_ms) {
    emit(status >= 500 ? LogLevel::ERROR : LogLevel::INFO, "Request completed", with_context(ctx, {
        {"event", "request_complete"},
        {"status", std::to_string(status)},
        {"duration_ms", format_ms(duration_ms)}
    }));
}

void Logger::log_request_rejected(const LogContext& ctx, int status, const std::string& reason) {
    emit(LogLevel::WARN, "Request rejected", with_context(ctx, {
        {"event", "request_rejected"},
        {"status", std::to_string(status)},
        {"reason", reason}
    }));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    emit(LogLevel::ERROR, error_message, with_context(ctx, {
        {"event", "error"},
        {"error_message", error_message}
    }));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    emit(LogLevel::WARN, warning_message, with_context(ctx, {
        {"event", "warning"},
        {"warning", warning_message}
    }));
}

void Logger::log_event(LogLevel level, const std::string& message, const LogFields& fields) {
    emit(level, message, fields);
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string Logger::render(LogLevel level, const std::string& message, const LogFields& fields) const {
    std::string timestamp = utc_timestamp();

    if (config_.enable_json) {
        nlohmann::json record(fields);
        record["timestamp"] = timestamp;
        record["level"] = level_to_string(level);
        record["message"] = message;
        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string line = timestamp + " [" + level_to_string(level) + "] " + message;
    if (!fields.empty()) {
        std::string joined;
        for (const auto& [key, value] : fields) {
            if (!joined.empty()) joined += ", ";
            joined += key + "=" + value;
        }
        line += " {" + joined + "}";
    }
    return line;
}

void Logger::emit(LogLevel level, const std::string& message, const LogFields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = render(level, message, fields);
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

} // namespace flowapi
