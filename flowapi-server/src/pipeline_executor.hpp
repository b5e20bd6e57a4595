/**
 * @file pipeline_executor.hpp
 * @brief Sequential DAG walk of a compiled pipeline over one execution context
 */

#ifndef FLOWAPI_PIPELINE_EXECUTOR_HPP
#define FLOWAPI_PIPELINE_EXECUTOR_HPP

#include "node_type.hpp"
#include "pipeline_compiler.hpp"
#include "logger.hpp"
#include <atomic>
#include <chrono>

namespace flowapi {

/**
 * @brief Per-request mutable payload and accumulator
 *
 * Exclusively owned by one request; never shared across executions.
 */
struct ExecutionContext {
    Value data;
    Value state;

    ExecutionContext() : data(Value::object()), state(Value::object()) {}
    explicit ExecutionContext(Value data_)
        : data(std::move(data_)), state(Value::object()) {}
};

/**
 * @brief Conditions under which a walk is abandoned between nodes
 */
struct ExecutionLimits {
    using Clock = std::chrono::steady_clock;

    Clock::time_point deadline;                      ///< Abandon once reached
    const std::atomic<bool>* cancelled;              ///< Abandon once set (optional)

    ExecutionLimits() : deadline(Clock::time_point::max()), cancelled(nullptr) {}

    static ExecutionLimits with_timeout(std::chrono::milliseconds timeout) {
        ExecutionLimits limits;
        limits.deadline = Clock::now() + timeout;
        return limits;
    }

    bool should_stop() const {
        if (cancelled && cancelled->load(std::memory_order_acquire)) {
            return true;
        }
        return deadline != Clock::time_point::max() && Clock::now() >= deadline;
    }
};

/**
 * @brief Execute a compiled pipeline against a context
 *
 * Nodes run strictly in topological order. Each node receives the context's
 * current (data, state) and its result replaces them before the next node.
 * The limits are checked before every node; a running node is never
 * interrupted.
 *
 * @param pipeline Compiled pipeline (shared, read-only)
 * @param context Context exclusively owned by the caller
 * @param limits Deadline and cancellation flag
 * @param log_ctx Request context attached to per-node log events
 *
 * @throws OperatorError If a node fails; later nodes do not run
 * @throws PipelineCancelled If the limits stop the walk
 */
void execute_pipeline(
    const CompiledPipeline& pipeline,
    ExecutionContext& context,
    const ExecutionLimits& limits = ExecutionLimits(),
    const LogContext& log_ctx = LogContext()
);

} // namespace flowapi

#endif // FLOWAPI_PIPELINE_EXECUTOR_HPP
