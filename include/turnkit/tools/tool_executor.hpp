#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/core/thread_pool.hpp"
#include "turnkit/core/types.hpp"
#include "tool_call.hpp"
#include "tool_registry.hpp"

#include <mutex>

namespace turnkit::tools {

using namespace turnkit::core;

// Runs tool handlers on the shared pool under a per-call deadline
class ToolExecutor {
public:
    ToolExecutor(ThreadPool& pool, Duration default_timeout);

    // Validates params, then invokes the handler. Every tool-side failure,
    // deadline expiry included, comes back as a failed result; only caller
    // cancellation is returned as an error.
    Result<ToolExecutionResult, Error> execute(const RegisteredTool& tool,
                                               const ToolCallRequest& request,
                                               const AgentId& agent_id,
                                               const CancellationToken& cancellation);

    // Failed result with a machine-readable output payload
    static ToolExecutionResult failure(const ToolCallRequest& request,
                                       std::string error,
                                       Json output);

    // Failed result for a ToolValidationFailed error, listing the bad fields
    static ToolExecutionResult validation_failure(const ToolCallRequest& request, const Error& error);

    Duration timeout_for(const ToolSpec& spec) const;

    struct Stats {
        int total_executions = 0;
        int successful = 0;
        int failed = 0;
        int timeouts = 0;
        Duration total_time{0};
    };
    Stats get_stats() const;
    void reset_stats();

private:
    ThreadPool& pool_;
    Duration default_timeout_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    void record_execution(bool success, bool timed_out, Duration time);
};

}  // namespace turnkit::tools
