#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/core/config.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/core/types.hpp"
#include "turnkit/llm/llm_caller.hpp"
#include "turnkit/memory/state_store.hpp"
#include "turnkit/reasoning/reasoning_manager.hpp"
#include "turnkit/tools/tool_executor.hpp"
#include "turnkit/tools/tool_registry.hpp"
#include "agent_state.hpp"
#include "events.hpp"
#include "idempotency_cache.hpp"
#include "loop_detector.hpp"
#include "message_builder.hpp"
#include "metrics.hpp"
#include "status.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace turnkit::agent {

using namespace turnkit::core;

// Outcome of a single step
struct StepResult {
    bool should_continue = true;
    bool executed_tool = false;
    std::optional<ModelMessage> llm_message;
    std::optional<ToolExecutionResult> tool_result;
    std::optional<std::string> final_output;
    std::optional<Error> error;
    AgentState state;
};

// Outcome of a run to completion
struct RunResult {
    bool succeeded = false;
    std::optional<std::string> final_output;
    std::optional<Error> error;
    AgentState state;
    int turns = 0;  // steps executed by this run
    Duration elapsed{0};
};

// Drives an agent one decision at a time: build the prompt, ask the model,
// parse its reply, and act on it. Model and tool failures are recorded as
// turns and the loop carries on; only the turn ceiling (or a configured loop
// hard stop) ends a run with an error.
//
// Lifecycle events go out on events() as they happen, and metrics() keeps
// running totals across every agent this instance serves.
//
// Steps for the same agent must not overlap; steps for different agents may.
class Orchestrator {
public:
    Orchestrator(
        const Config& config,
        llm::LLMCaller& llm,
        tools::ToolRegistry& tools,
        tools::ToolExecutor& executor,
        memory::AgentStateStore& store,
        StatusBroadcaster& status,
        const MessageBuilder& messages
    );

    // Loads (or creates) the agent's state, runs one turn and saves it.
    // Errors: Cancelled, StateSaveFailed.
    Result<StepResult, Error> step(const AgentId& agent_id,
                                   const std::string& goal,
                                   const CancellationToken& cancellation = CancellationToken::none());

    // One turn against in-memory state; nothing is loaded or saved
    Result<StepResult, Error> execute_step(AgentState& state, const CancellationToken& cancellation);

    // Steps until finish, a fatal error, or max_turns steps
    RunResult run(const AgentId& agent_id,
                  const std::string& goal,
                  const CancellationToken& cancellation = CancellationToken::none());

    // Reasoning runs at turn 0, and at every third turn when the latest tool result failed
    bool should_reason(const AgentState& state, int turn_index) const;

    // Recent thoughts and tool outcomes, handed to the reasoning engines
    static std::string build_reasoning_context(const AgentState& state);

    IdempotencyCache& cache() { return cache_; }
    LoopDetector& loop_detector() { return loop_detector_; }
    EventBus& events() { return events_; }
    MetricsCollector& metrics() { return metrics_; }
    reasoning::ReasoningManager& reasoning() { return *reasoning_; }

    static constexpr const char* kRetryHintThoughts =
        "Controller: The last tool call failed. Use the TOOL CATALOG and retry with required params.";
    static constexpr const char* kLoopBreakerThoughts =
        "Controller: You're repeating the same failing call. Read the validation_error.missing "
        "and adjust parameters or try a different tool.";

private:
    // Model call plus parse. Model-side failures come back in `error`;
    // `handled` is set when the reply was already recorded as a turn.
    struct Decision {
        std::optional<ModelMessage> message;
        std::optional<Error> error;
        std::optional<StepResult> handled;
    };
    Result<Decision, Error> decide(AgentState& state,
                                   int turn_index,
                                   const TurnId& turn_id,
                                   const std::optional<std::string>& insight,
                                   const CancellationToken& cancellation);

    Result<StepResult, Error> process_action(AgentState& state,
                                             ModelMessage message,
                                             int turn_index,
                                             const TurnId& turn_id,
                                             const CancellationToken& cancellation);

    Result<StepResult, Error> process_tool_call(AgentState& state,
                                                ModelMessage message,
                                                int turn_index,
                                                const TurnId& turn_id,
                                                const CancellationToken& cancellation);

    // Appends the failed turn plus controller hints
    StepResult failed_tool_turn(AgentState& state,
                                std::optional<ModelMessage> message,
                                ToolCallRequest request,
                                ToolExecutionResult result);

    // Controller turns after a failure; returns LoopDetected when the hard stop trips
    std::optional<Error> add_retry_hints(AgentState& state, const ToolExecutionResult& result);

    std::optional<reasoning::ReasoningResult> maybe_reason(const AgentState& state,
                                                           int turn_index,
                                                           const CancellationToken& cancellation);

    // Publishes StepCompleted and records the step's metrics
    void finish_step(const AgentId& agent_id,
                     int turn_index,
                     const Result<StepResult, Error>& outcome,
                     std::chrono::steady_clock::time_point started);

    void emit_status(const AgentState& state,
                     int turn_index,
                     std::string title,
                     std::optional<std::string> details = std::nullopt,
                     std::optional<std::string> hint = std::nullopt,
                     std::optional<int> progress = std::nullopt);

    Config config_;
    llm::LLMCaller& llm_;
    tools::ToolRegistry& tools_;
    tools::ToolExecutor& executor_;
    memory::AgentStateStore& store_;
    StatusBroadcaster& status_;
    const MessageBuilder& messages_;

    IdempotencyCache cache_;
    LoopDetector loop_detector_;
    EventBus events_;
    MetricsCollector metrics_;
    std::unique_ptr<reasoning::ReasoningManager> reasoning_;
    std::mutex reasoning_mutex_;  // the tree engine holds one tree at a time
};

}  // namespace turnkit::agent
