/**
 * @file logger.hpp
 * @brief Process-wide structured event log
 *
 * Every record is one line: either a JSON object whose values are all strings
 * (`timestamp`, `level`, `message` plus the event's fields) or a plain-text
 * line `<timestamp> [LEVEL] message {key=value, ...}`. Records go to stderr,
 * a file, or both. Writers from concurrent requests are serialized, so lines
 * never interleave.
 */

#ifndef FLOWAPI_LOGGER_HPP
#define FLOWAPI_LOGGER_HPP

#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace flowapi {

class CompiledPipeline;
class OperatorError;

using LogFields = std::map<std::string, std::string>;

enum class LogLevel {
    DEBUG,   ///< Per-node timings
    INFO,    ///< Startup, completed requests
    WARN,    ///< Rejected requests
    ERROR    ///< Failed pipelines, 5xx responses
};

std::string level_to_string(LogLevel level);

/**
 * @brief Case-insensitive level lookup; unknown names map to INFO
 *
 * "trace" is folded into DEBUG and "critical" into ERROR.
 */
LogLevel string_to_level(const std::string& name);

/**
 * @brief Identifies the request a record belongs to
 */
struct LogContext {
    std::string request_id;
    std::string method;
    std::string route;      // Bound route once matched, else the raw path
    std::string pipeline;

    LogContext() = default;
    LogContext(const std::string& id, const std::string& method_, const std::string& route_)
        : request_id(id), method(method_), route(route_) {}
};

struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;            // stderr
    bool enable_file;
    std::string log_file_path;      // Opened in append mode
    bool enable_json;

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("flowapi-server.log"),
          enable_json(true) {}
};

/**
 * @brief Singleton sink for structured events
 *
 * Usage Example:
 *   @code
 *   LogContext ctx("3f2a9c1e00000000", "GET", "v1/0/hello");
 *   Logger::get_instance().log_request_complete(ctx, 200, 1.25);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Replace the configuration; reopens the log file if one is set
     */
    void configure(const LoggerConfig& config);

    LogLevel get_min_level() const;
    void set_min_level(LogLevel level);
    bool is_enabled(LogLevel level) const { return level >= get_min_level(); }

    // Startup

    void log_pipeline_compiled(const CompiledPipeline& pipeline);
    void log_route_bound(const std::string& method, const std::string& route, const std::string& pipeline);

    // Requests

    void log_node_complete(const LogContext& ctx, const std::string& node_name,
                           const std::string& node_type, double duration_ms);

    /**
     * @brief Record an operator failure in full
     *
     * Clients only ever see the request id; the detail lives here.
     */
    void log_node_failure(const LogContext& ctx, const OperatorError& error);

    /**
     * @brief Logged at ERROR for 5xx statuses, INFO otherwise
     */
    void log_request_complete(const LogContext& ctx, int status, double duration_ms);

    void log_request_rejected(const LogContext& ctx, int status, const std::string& reason);

    void log_error(const LogContext& ctx, const std::string& error_message);
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

    void flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    void emit(LogLevel level, const std::string& message, const LogFields& fields);
    std::string render(LogLevel level, const std::string& message, const LogFields& fields) const;
};

} // namespace flowapi

#endif // FLOWAPI_LOGGER_HPP
