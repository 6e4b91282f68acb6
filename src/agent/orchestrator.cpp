#include "turnkit/agent/orchestrator.hpp"
#include "turnkit/core/fingerprint.hpp"
#include "turnkit/llm/function_call.hpp"
#include "turnkit/parser/response_parser.hpp"

#include <spdlog/spdlog.h>

namespace turnkit::agent {

namespace {

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// Error recorded on the turn when the model call itself fails
Error model_call_error(const Error& err, Duration timeout) {
    if (err.code == ErrorCode::LLMTimeout) {
        return Error{ErrorCode::LLMTimeout,
                     "LLM call deadline exceeded after " + std::to_string(timeout.count()) + "ms"};
    }
    const std::string prefix = "LLM call failed: ";
    if (err.message.rfind(prefix, 0) == 0) {
        return Error{err.code, err.message};
    }
    return Error{err.code, prefix + err.message};
}

Duration since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

// Metrics key for an error
std::string error_kind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::LLMTimeout: return "llm_timeout";
        case ErrorCode::LLMConnectionFailed: return "llm_connection_failed";
        case ErrorCode::LLMInvalidResponse:
        case ErrorCode::ResponseValidationFailed: return "invalid_response";
        case ErrorCode::MaxTurnsExceeded: return "max_turns_exceeded";
        case ErrorCode::LoopDetected: return "loop_detected";
        case ErrorCode::StateSaveFailed: return "state_save_failed";
        default: return "error_" + std::to_string(static_cast<int>(code));
    }
}

ModelMessage controller_message(std::string thoughts, std::string summary) {
    ModelMessage message;
    message.thoughts = std::move(thoughts);
    message.action = AgentAction::Retry;
    message.action_input.summary = std::move(summary);
    return message;
}

}  // namespace

Orchestrator::Orchestrator(
    const Config& config,
    llm::LLMCaller& llm,
    tools::ToolRegistry& tools,
    tools::ToolExecutor& executor,
    memory::AgentStateStore& store,
    StatusBroadcaster& status,
    const MessageBuilder& messages)
    : config_(config)
    , llm_(llm)
    , tools_(tools)
    , executor_(executor)
    , store_(store)
    , status_(status)
    , messages_(messages)
    , cache_(Duration{config.agent.dedupe_ttl_ms})
    , loop_detector_(config.agent.max_tool_call_history, config.agent.consecutive_failure_threshold)
    , reasoning_(std::make_unique<reasoning::ReasoningManager>(llm, config.reasoning))
{
}

Result<StepResult, Error> Orchestrator::step(const AgentId& agent_id,
                                             const std::string& goal,
                                             const CancellationToken& cancellation) {
    if (cancellation.is_cancelled()) {
        return Result<StepResult, Error>::err(ErrorCode::Cancelled, "Step cancelled", agent_id);
    }

    auto loaded = store_.load(agent_id);
    AgentState state = loaded ? std::move(*loaded) : AgentState::create(agent_id, goal);
    if (state.goal.empty()) {
        state.goal = goal;
    }

    auto result = execute_step(state, cancellation);
    if (result.is_err()) {
        return result;
    }

    auto saved = store_.save(agent_id, state);
    if (saved.is_err()) {
        spdlog::error("Failed to save state for {}: {}", agent_id, saved.error().full_message());
        return Result<StepResult, Error>::err(saved.error());
    }
    return result;
}

Result<StepResult, Error> Orchestrator::execute_step(AgentState& state, const CancellationToken& cancellation) {
    if (cancellation.is_cancelled()) {
        return Result<StepResult, Error>::err(ErrorCode::Cancelled, "Step cancelled", state.agent_id);
    }

    const int turn_index = state.next_index();
    const TurnId turn_id = make_turn_id(state.agent_id, turn_index);
    const auto started = std::chrono::steady_clock::now();

    events_.publish(AgentEvent::make(AgentEventType::StepStarted, state.agent_id, turn_index));

    auto outcome = [&]() -> Result<StepResult, Error> {
        auto reasoning = maybe_reason(state, turn_index, cancellation);
        if (cancellation.is_cancelled()) {
            return Result<StepResult, Error>::err(ErrorCode::Cancelled, "Step cancelled", state.agent_id);
        }

        std::optional<std::string> insight;
        if (reasoning) {
            insight = reasoning->conclusion;
        }

        emit_status(state, turn_index, "Analyzing task", "Processing goal and history", "Preparing to make decision");

        auto decision = decide(state, turn_index, turn_id, insight, cancellation);
        if (decision.is_err()) {
            return Result<StepResult, Error>::err(std::move(decision).error());
        }
        auto decided = std::move(decision).value();

        if (decided.handled) {
            return Result<StepResult, Error>::ok(std::move(*decided.handled));
        }

        if (decided.error) {
            spdlog::warn("Turn {} of {}: {}", turn_index, state.agent_id, decided.error->message);

            AgentTurn turn;
            turn.error = decided.error->message;
            state.append(std::move(turn));

            StepResult result;
            result.error = std::move(decided.error);
            return Result<StepResult, Error>::ok(std::move(result));
        }

        ModelMessage message = std::move(*decided.message);
        if (reasoning) {
            message.reasoning_chain = reasoning->chain;
            message.reasoning_tree = reasoning->tree;
        }
        if (message.status_title) {
            emit_status(state, turn_index, *message.status_title, message.status_details,
                        message.next_step_hint, message.progress_pct);
        }
        return process_action(state, std::move(message), turn_index, turn_id, cancellation);
    }();

    if (outcome.is_ok()) {
        outcome.value().state = state;
    }
    finish_step(state.agent_id, turn_index, outcome, started);
    return outcome;
}

void Orchestrator::finish_step(const AgentId& agent_id,
                               int turn_index,
                               const Result<StepResult, Error>& outcome,
                               std::chrono::steady_clock::time_point started) {
    auto event = AgentEvent::make(AgentEventType::StepCompleted, agent_id, turn_index);
    event.elapsed = since(started);

    if (outcome.is_err()) {
        event.success = false;
        event.error = outcome.error().message;
    } else {
        const auto& result = outcome.value();
        event.success = !result.error.has_value();
        event.should_continue = result.should_continue;
        event.executed_tool = result.executed_tool;
        event.final_output = result.final_output;
        if (result.error) {
            event.error = result.error->message;
        }
    }

    metrics_.record_step(!*event.success, event.elapsed);
    events_.publish(event);
}

RunResult Orchestrator::run(const AgentId& agent_id,
                            const std::string& goal,
                            const CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();

    spdlog::info("Starting run for agent {} (max {} turns)", agent_id, config_.agent.max_turns);

    auto started = AgentEvent::make(AgentEventType::RunStarted, agent_id, 0);
    started.goal = goal;
    events_.publish(started);

    RunResult run_result;
    run_result.state = AgentState::create(agent_id, goal);

    auto finish = [&]() -> RunResult {
        run_result.elapsed = since(start);

        auto event = AgentEvent::make(AgentEventType::RunCompleted, agent_id, run_result.turns);
        event.success = run_result.succeeded;
        event.final_output = run_result.final_output;
        event.total_turns = run_result.turns;
        event.elapsed = run_result.elapsed;

        std::optional<std::string> kind;
        if (run_result.error) {
            event.error = run_result.error->message;
            kind = error_kind(run_result.error->code);
        }
        metrics_.record_run(run_result.succeeded, run_result.elapsed, kind);
        if (run_result.final_output) {
            metrics_.record_final_output(run_result.final_output->size());
        }

        events_.publish(event);
        return std::move(run_result);
    };

    for (int i = 0; i < config_.agent.max_turns; ++i) {
        auto step_result = step(agent_id, goal, cancellation);
        if (step_result.is_err()) {
            run_result.error = step_result.error();
            if (auto current = store_.load(agent_id)) {
                run_result.state = std::move(*current);
            }
            spdlog::warn("Run for {} aborted: {}", agent_id, run_result.error->full_message());
            return finish();
        }

        auto& result = step_result.value();
        run_result.turns = i + 1;
        run_result.state = std::move(result.state);

        if (!result.should_continue) {
            if (result.final_output) {
                run_result.succeeded = true;
                run_result.final_output = std::move(result.final_output);
                spdlog::info("Agent {} finished after {} turns", agent_id, run_result.turns);
            } else {
                run_result.error = result.error.value_or(Error{ErrorCode::InternalError, "Run stopped without output"});
                spdlog::warn("Agent {} stopped: {}", agent_id, run_result.error->full_message());
            }
            return finish();
        }
    }

    run_result.error = Error{
        ErrorCode::MaxTurnsExceeded,
        "Max turns (" + std::to_string(config_.agent.max_turns) + ") reached"
    };
    spdlog::warn("Agent {} hit maximum turn limit ({})", agent_id, config_.agent.max_turns);
    return finish();
}

Result<Orchestrator::Decision, Error> Orchestrator::decide(AgentState& state,
                                                           int turn_index,
                                                           const TurnId& turn_id,
                                                           const std::optional<std::string>& insight,
                                                           const CancellationToken& cancellation) {
    Decision decision;

    const auto specs = tools_.get_enabled_specs();
    const auto prompt = messages_.build(state, specs, insight);
    const bool use_functions = config_.agent.use_function_calling && llm_.supports_functions() && !specs.empty();

    events_.publish(AgentEvent::make(AgentEventType::LlmCallStarted, state.agent_id, turn_index));
    const auto call_started = std::chrono::steady_clock::now();

    auto call_completed = [&](std::optional<AgentAction> action, const std::optional<Error>& error) {
        auto event = AgentEvent::make(AgentEventType::LlmCallCompleted, state.agent_id, turn_index);
        event.action = action;
        event.success = !error.has_value();
        if (error) {
            event.error = error->message;
        }
        event.elapsed = since(call_started);
        events_.publish(event);
    };

    // Transport-level outcome of the model call
    auto call_failed = [&](const Error& err) {
        metrics_.record_llm_call(false, since(call_started), error_kind(err.code));
        call_completed(std::nullopt, err);
    };

    std::string raw;
    if (use_functions) {
        spdlog::debug("Calling model with {} functions", specs.size());
        auto called = llm_.complete_with_functions(prompt, tools_.to_function_specs(), cancellation);
        if (called.is_err()) {
            call_failed(called.error());
            if (called.error().code == ErrorCode::Cancelled) {
                return Result<Decision, Error>::err(std::move(called).error());
            }
            decision.error = model_call_error(called.error(), llm_.timeout());
            return Result<Decision, Error>::ok(std::move(decision));
        }
        metrics_.record_llm_call(true, since(call_started));

        const auto& reply = called.value();
        if (reply.has_function_call) {
            auto normalized = llm::normalize_function_call(reply);
            metrics_.record_response(normalized.is_ok());
            if (normalized.is_err()) {
                const auto& err = normalized.error();
                call_completed(std::nullopt, err);
                spdlog::warn("Function call rejected: {}", err.full_message());
                emit_status(state, turn_index, "Function call error", "Invalid function arguments",
                            "Will retry with corrected parameters");

                ToolCallRequest request{reply.function_name.empty() ? "unknown" : reply.function_name,
                                        Json::object(), turn_id};
                auto result = tools::ToolExecutor::failure(
                    request, err.message, Json{{"type", "invalid_arguments"}, {"message", err.message}});
                decision.handled = failed_tool_turn(state, std::nullopt, std::move(request), std::move(result));
                return Result<Decision, Error>::ok(std::move(decision));
            }

            call_completed(AgentAction::ToolCall, std::nullopt);
            emit_status(state, turn_index, "Tool call detected", "Calling " + reply.function_name, "Executing tool");
            decision.message = std::move(normalized).value();
            return Result<Decision, Error>::ok(std::move(decision));
        }

        spdlog::debug("No function call in reply, parsing content as JSON");
        raw = reply.assistant_content;
    } else {
        auto completed = llm_.complete(prompt, cancellation);
        if (completed.is_err()) {
            call_failed(completed.error());
            if (completed.error().code == ErrorCode::Cancelled) {
                return Result<Decision, Error>::err(std::move(completed).error());
            }
            decision.error = model_call_error(completed.error(), llm_.timeout());
            return Result<Decision, Error>::ok(std::move(decision));
        }
        metrics_.record_llm_call(true, since(call_started));
        raw = std::move(completed).value().content;
    }

    auto parsed = parser::parse_strict(raw, parser::ParseLimits::from_config(config_.agent));
    metrics_.record_response(parsed.is_ok());
    if (parsed.is_err()) {
        const auto& err = parsed.error();
        decision.error = Error{err.code, "Invalid LLM JSON: " + err.full_message()};
        call_completed(std::nullopt, decision.error);
        return Result<Decision, Error>::ok(std::move(decision));
    }

    call_completed(parsed.value().action, std::nullopt);
    decision.message = std::move(parsed).value();
    return Result<Decision, Error>::ok(std::move(decision));
}

Result<StepResult, Error> Orchestrator::process_action(AgentState& state,
                                                       ModelMessage message,
                                                       int turn_index,
                                                       const TurnId& turn_id,
                                                       const CancellationToken& cancellation) {
    StepResult result;

    switch (message.action) {
        case AgentAction::Plan: {
            spdlog::debug("Model chose to plan");
            emit_status(state, turn_index, "Planning", "Creating execution plan", "Will execute planned steps");
            break;
        }
        case AgentAction::Retry: {
            spdlog::debug("Model chose to retry");
            emit_status(state, turn_index, "Retrying", "Attempting previous action again",
                        "Will retry with adjustments");
            break;
        }
        case AgentAction::Finish: {
            spdlog::info("Agent {} finished", state.agent_id);
            emit_status(state, turn_index, "Finalizing", "Preparing final answer", "Task completion", 100);
            result.should_continue = false;
            result.final_output = message.action_input.final_text.value_or("");
            break;
        }
        case AgentAction::ToolCall:
            return process_tool_call(state, std::move(message), turn_index, turn_id, cancellation);
    }

    AgentTurn turn;
    turn.llm_message = message;
    state.append(std::move(turn));

    result.llm_message = std::move(message);
    return Result<StepResult, Error>::ok(std::move(result));
}

Result<StepResult, Error> Orchestrator::process_tool_call(AgentState& state,
                                                          ModelMessage message,
                                                          int turn_index,
                                                          const TurnId& turn_id,
                                                          const CancellationToken& cancellation) {
    const std::string tool_name = trim(message.action_input.tool.value_or(""));
    ToolCallRequest request{tool_name, message.action_input.params, turn_id};

    auto resolved = tools_.resolve(tool_name);
    if (resolved.is_err()) {
        const auto& err = resolved.error();
        spdlog::warn("Model asked for unavailable tool '{}': {}", tool_name, err.message);
        emit_status(state, turn_index, "Tool not found", err.message + ": " + tool_name, "Will try different approach");

        auto result = tools::ToolExecutor::failure(
            request,
            err.message + ": " + tool_name,
            Json{
                {"type", err.code == ErrorCode::ToolDisabled ? "tool_disabled" : "tool_not_found"},
                {"tool", tool_name}
            }
        );
        loop_detector_.record_tool_call(state.agent_id, tool_name, request.params, false);
        return Result<StepResult, Error>::ok(
            failed_tool_turn(state, std::move(message), std::move(request), std::move(result)));
    }
    const auto& tool = resolved.value();

    auto validation = tools::ToolRegistry::validate_args(tool.spec, request.params);
    if (validation.is_err()) {
        spdlog::warn("Invalid parameters for '{}': {}", tool_name, validation.error().message);
        auto result = tools::ToolExecutor::validation_failure(request, validation.error());
        loop_detector_.record_tool_call(state.agent_id, tool_name, request.params, false);
        return Result<StepResult, Error>::ok(
            failed_tool_turn(state, std::move(message), std::move(request), std::move(result)));
    }

    const auto fingerprint = fingerprint_tool_call(tool_name, request.params);

    if (tool.spec.allows_dedupe()) {
        auto hit = cache_.lookup(fingerprint);
        metrics_.record_dedupe(hit.has_value());
        if (hit) {
            spdlog::info("Reusing result of {} for '{}' ({})", hit->turn_id, tool_name, fingerprint);
            emit_status(state, turn_index, "Reusing cached result", "Same call made in " + hit->turn_id);

            loop_detector_.record_tool_call(state.agent_id, tool_name, request.params, hit->result.success);

            AgentTurn turn;
            turn.llm_message = message;
            turn.tool_call = request;
            turn.tool_call->turn_id = hit->turn_id;
            turn.tool_result = hit->result;
            turn.deduplicated = true;
            state.append(std::move(turn));

            StepResult result;
            result.executed_tool = true;
            result.llm_message = std::move(message);
            result.tool_result = std::move(hit->result);
            return Result<StepResult, Error>::ok(std::move(result));
        }
    }

    emit_status(state, turn_index, "Executing tool", "Calling " + tool_name);

    auto call_started = AgentEvent::make(AgentEventType::ToolCallStarted, state.agent_id, turn_index);
    call_started.tool = tool_name;
    call_started.params = request.params;
    events_.publish(call_started);

    auto call_completed = AgentEvent::make(AgentEventType::ToolCallCompleted, state.agent_id, turn_index);
    call_completed.tool = tool_name;

    auto executed = executor_.execute(tool, request, state.agent_id, cancellation);
    if (executed.is_err()) {
        call_completed.success = false;
        call_completed.error = executed.error().message;
        events_.publish(call_completed);
        return Result<StepResult, Error>::err(std::move(executed).error());
    }
    auto result = std::move(executed).value();
    bool deduplicated = false;

    std::optional<std::string> failure_kind;
    if (!result.success) {
        failure_kind = result.output.is_object() ? result.output.value("type", "tool_error") : "tool_error";
    }
    metrics_.record_tool_call(tool_name, result.success, result.execution_time, failure_kind);

    call_completed.success = result.success;
    call_completed.error = result.error;
    call_completed.elapsed = result.execution_time;
    events_.publish(call_completed);

    if (result.success && tool.spec.allows_dedupe()) {
        std::optional<Duration> ttl;
        if (tool.spec.dedupe && tool.spec.dedupe->custom_ttl) {
            ttl = *tool.spec.dedupe->custom_ttl;
        }
        auto stored = cache_.insert_if_absent(fingerprint, turn_id, result, ttl);
        if (stored.turn_id != turn_id) {
            // A concurrent step stored this call first; its entry is the canonical one
            spdlog::info("Call to '{}' already stored by {} ({})", tool_name, stored.turn_id, fingerprint);
            request.turn_id = stored.turn_id;
            result = std::move(stored.result);
            deduplicated = true;
        }
    }

    loop_detector_.record_tool_call(state.agent_id, tool_name, request.params, result.success);

    if (!result.success) {
        return Result<StepResult, Error>::ok(
            failed_tool_turn(state, std::move(message), std::move(request), std::move(result)));
    }

    AgentTurn turn;
    turn.llm_message = message;
    turn.tool_call = request;
    turn.tool_result = result;
    turn.deduplicated = deduplicated;
    state.append(std::move(turn));

    StepResult step_result;
    step_result.executed_tool = true;
    step_result.llm_message = std::move(message);
    step_result.tool_result = std::move(result);
    return Result<StepResult, Error>::ok(std::move(step_result));
}

StepResult Orchestrator::failed_tool_turn(AgentState& state,
                                          std::optional<ModelMessage> message,
                                          ToolCallRequest request,
                                          ToolExecutionResult result) {
    AgentTurn turn;
    turn.llm_message = message;
    turn.tool_call = std::move(request);
    turn.tool_result = result;
    state.append(std::move(turn));

    StepResult step_result;
    step_result.executed_tool = true;
    step_result.llm_message = std::move(message);
    step_result.tool_result = result;

    if (auto stop = add_retry_hints(state, result)) {
        step_result.should_continue = false;
        step_result.error = std::move(stop);
    }
    return step_result;
}

std::optional<Error> Orchestrator::add_retry_hints(AgentState& state, const ToolExecutionResult& result) {
    const int failed_index = state.next_index() - 1;

    emit_status(state, failed_index, "Adding retry hint", "Tool failed, providing guidance",
                "Will retry with corrected parameters");

    AgentTurn hint;
    hint.llm_message = controller_message(kRetryHintThoughts,
                                          "Retry " + result.tool + " including all required params.");
    state.append(std::move(hint));

    const int failures = loop_detector_.consecutive_failures(state.agent_id, result.tool, result.params);

    if (failures >= config_.agent.consecutive_failure_threshold) {
        spdlog::warn("Loop breaker triggered for '{}' after {} identical failures", result.tool, failures);
        metrics_.record_loop_detection();
        emit_status(state, failed_index, "Loop breaker triggered", "Repeated failures detected",
                    "Will try different approach");

        AgentTurn breaker;
        breaker.llm_message = controller_message(
            kLoopBreakerThoughts,
            "Stop repeating the same failing call to " + result.tool +
            ". Check validation_error details and try different parameters or a different tool.");
        state.append(std::move(breaker));
    }

    const int hard_stop = config_.agent.loop_hard_stop_threshold;
    if (hard_stop > 0 && failures >= hard_stop) {
        spdlog::error("Stopping agent {}: '{}' failed {} times with identical parameters",
                      state.agent_id, result.tool, failures);
        return Error{
            ErrorCode::LoopDetected,
            "Loop detected: '" + result.tool + "' failed " + std::to_string(failures) +
                " times with identical parameters",
            result.tool
        };
    }
    return std::nullopt;
}

bool Orchestrator::should_reason(const AgentState& state, int turn_index) const {
    if (!reasoning_->is_enabled()) {
        return false;
    }
    if (turn_index == 0) {
        return true;
    }
    if (turn_index % 3 != 0) {
        return false;
    }
    for (auto it = state.turns.rbegin(); it != state.turns.rend(); ++it) {
        if (it->tool_result) {
            return !it->tool_result->success;
        }
    }
    return false;
}

std::optional<reasoning::ReasoningResult> Orchestrator::maybe_reason(const AgentState& state,
                                                                     int turn_index,
                                                                     const CancellationToken& cancellation) {
    if (!should_reason(state, turn_index)) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(reasoning_mutex_);

    emit_status(state, turn_index, "Reasoning", "Deliberating before the next decision");

    auto result = reasoning_->reason(state.goal, build_reasoning_context(state),
                                     tools_.get_enabled_specs(), cancellation);
    metrics_.record_reasoning(result.success, result.confidence, result.elapsed);
    if (!result.success) {
        spdlog::warn("Reasoning failed: {}", result.error.value_or("unknown error"));
        return std::nullopt;
    }

    spdlog::info("Reasoning ({}) concluded with confidence {:.2f}",
                 reasoning::mode_to_string(reasoning_->mode()), result.confidence);
    return result;
}

std::string Orchestrator::build_reasoning_context(const AgentState& state) {
    if (state.turns.empty()) {
        return "";
    }

    std::string context = "Recent Actions:";
    const size_t from = state.turns.size() > 3 ? state.turns.size() - 3 : 0;
    for (size_t i = from; i < state.turns.size(); ++i) {
        const auto& turn = state.turns[i];
        if (turn.llm_message && !turn.llm_message->thoughts.empty()) {
            context += "\n- " + turn.llm_message->thoughts;
        }
        if (turn.tool_result) {
            const auto tool = turn.tool_call ? turn.tool_call->tool : turn.tool_result->tool;
            if (turn.tool_result->success) {
                context += "\n- Successfully executed: " + tool;
            } else {
                context += "\n- Failed to execute: " + tool + " - " + turn.tool_result->error.value_or("");
            }
        }
        if (turn.error) {
            context += "\n- Error: " + *turn.error;
        }
    }
    return context;
}

void Orchestrator::emit_status(const AgentState& state,
                               int turn_index,
                               std::string title,
                               std::optional<std::string> details,
                               std::optional<std::string> hint,
                               std::optional<int> progress) {
    if (!config_.agent.emit_public_status) {
        return;
    }

    StatusUpdate update;
    update.agent_id = state.agent_id;
    update.turn_index = turn_index;
    update.status_title = std::move(title);
    update.status_details = std::move(details);
    update.next_step_hint = std::move(hint);
    update.progress_pct = progress;
    update.timestamp = Clock::now();
    status_.emit(update);
}

}  // namespace turnkit::agent
