#include "pipeline_executor.hpp"
#include "errors.hpp"

namespace flowapi {

void execute_pipeline(
    const CompiledPipeline& pipeline,
    ExecutionContext& context,
    const ExecutionLimits& limits,
    const LogContext& log_ctx
) {
    Logger& logger = Logger::get_instance();

    LogContext node_ctx = log_ctx;
    node_ctx.pipeline = pipeline.name();

    for (const CompiledNode& node : pipeline.nodes()) {
        if (limits.should_stop()) {
            throw PipelineCancelled(pipeline.name(), node.name);
        }

        auto start_time = std::chrono::steady_clock::now();

        NodeOutput output;
        try {
            output = node.capability->execute(
                std::move(context.data), std::move(context.state), node.config
            );
        } catch (const std::exception& e) {
            throw OperatorError(node.name, node.type, e.what());
        }

        context.data = std::move(output.data);
        context.state = std::move(output.state);

        auto end_time = std::chrono::steady_clock::now();
        logger.log_node_complete(
            node_ctx, node.name, node.type,
            std::chrono::duration<double, std::milli>(end_time - start_time).count()
        );
    }
}

} // namespace flowapi
