#include "turnkit/tools/tool_executor.hpp"
#include "turnkit/core/deadline.hpp"

#include <spdlog/spdlog.h>

namespace turnkit::tools {

ToolExecutor::ToolExecutor(ThreadPool& pool, Duration default_timeout)
    : pool_(pool)
    , default_timeout_(default_timeout)
{
}

Duration ToolExecutor::timeout_for(const ToolSpec& spec) const {
    if (spec.timeout_ms && *spec.timeout_ms > 0) {
        return Duration{*spec.timeout_ms};
    }
    return default_timeout_;
}

ToolExecutionResult ToolExecutor::failure(const ToolCallRequest& request,
                                          std::string error,
                                          Json output) {
    ToolExecutionResult result;
    result.success = false;
    result.output = std::move(output);
    result.error = std::move(error);
    result.tool = request.tool;
    result.params = request.params;
    result.turn_id = request.turn_id;
    result.created_at = Clock::now();
    return result;
}

ToolExecutionResult ToolExecutor::validation_failure(const ToolCallRequest& request, const Error& error) {
    return failure(
        request,
        error.message,
        Json{
            {"type", "validation_error"},
            {"missing", error.missing_fields},
            {"errors", error.invalid_fields}
        }
    );
}

Result<ToolExecutionResult, Error> ToolExecutor::execute(const RegisteredTool& tool,
                                                         const ToolCallRequest& request,
                                                         const AgentId& agent_id,
                                                         const CancellationToken& cancellation) {
    auto validation = ToolRegistry::validate_args(tool.spec, request.params);
    if (validation.is_err()) {
        record_execution(false, false, Duration{0});
        return Result<ToolExecutionResult, Error>::ok(validation_failure(request, validation.error()));
    }

    const auto timeout = timeout_for(tool.spec);
    const auto start = std::chrono::steady_clock::now();

    // The handler may outlive this call on timeout, so it captures copies
    auto outcome = run_with_deadline<Json>(
        pool_,
        [handler = tool.handler, params = request.params,
         ctx = ToolContext{agent_id, request.turn_id, {}}](CancellationToken token) mutable {
            ctx.cancellation = token;
            return handler(params, ctx);
        },
        timeout,
        cancellation,
        ErrorCode::ToolTimeout,
        ErrorCode::ToolExecutionFailed,
        request.tool
    );

    const auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

    if (outcome.is_err()) {
        const auto& err = outcome.error();

        if (err.code == ErrorCode::Cancelled) {
            return Result<ToolExecutionResult, Error>::err(err);
        }

        ToolExecutionResult result;
        if (err.code == ErrorCode::ToolTimeout) {
            spdlog::warn("Tool '{}' timed out after {}ms", request.tool, timeout.count());
            result = failure(
                request,
                "Tool '" + request.tool + "' timed out after " + std::to_string(timeout.count()) + "ms",
                Json{{"type", "timeout"}, {"timeout_ms", timeout.count()}}
            );
        } else {
            spdlog::warn("Tool '{}' failed: {}", request.tool, err.full_message());
            result = failure(request, err.message, Json{{"type", "tool_error"}, {"message", err.message}});
        }

        result.execution_time = elapsed;
        record_execution(false, err.code == ErrorCode::ToolTimeout, elapsed);
        return Result<ToolExecutionResult, Error>::ok(std::move(result));
    }

    ToolExecutionResult result;
    result.success = true;
    result.output = std::move(outcome).value();
    result.tool = request.tool;
    result.params = request.params;
    result.turn_id = request.turn_id;
    result.execution_time = elapsed;
    result.created_at = Clock::now();

    record_execution(true, false, elapsed);
    spdlog::debug("Tool '{}' completed in {}ms", request.tool, elapsed.count());
    return Result<ToolExecutionResult, Error>::ok(std::move(result));
}

ToolExecutor::Stats ToolExecutor::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ToolExecutor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

void ToolExecutor::record_execution(bool success, bool timed_out, Duration time) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_executions++;
    if (success) {
        stats_.successful++;
    } else {
        stats_.failed++;
    }
    if (timed_out) {
        stats_.timeouts++;
    }
    stats_.total_time += time;
}

}  // namespace turnkit::tools
