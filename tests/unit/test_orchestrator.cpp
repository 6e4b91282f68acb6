#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "turnkit/agent/orchestrator.hpp"
#include "turnkit/core/fingerprint.hpp"
#include "fakes.hpp"

#include <atomic>
#include <vector>

using namespace turnkit::agent;
using turnkit::llm::LLMCaller;
using turnkit::llm::LLMClient;
using turnkit::memory::MemoryStateStore;
using turnkit::testing::FunctionCallingClient;
using turnkit::testing::RoutingLLMClient;
using turnkit::testing::ScriptedLLMClient;
using turnkit::testing::SlowLLMClient;
using turnkit::tools::DedupePolicy;
using turnkit::tools::ParamSpec;
using turnkit::tools::ParamType;
using turnkit::tools::ToolContext;
using turnkit::tools::ToolExecutor;
using turnkit::tools::ToolRegistry;
using turnkit::tools::ToolSpec;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

const std::string kFinish =
    R"({"thoughts": "All done", "action": "finish", "action_input": {"final": "done"}})";
const std::string kAdd =
    R"({"thoughts": "Add them", "action": "tool_call", "action_input": {"tool": "add", "params": {"a": 2, "b": 3}}})";
const std::string kAddMissingB =
    R"({"thoughts": "Add them", "action": "tool_call", "action_input": {"tool": "add", "params": {"a": 2}}})";

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// Everything an orchestrator needs, wired the way the replay binary does it
struct Harness {
    explicit Harness(std::shared_ptr<LLMClient> client, Config cfg = {})
        : config(std::move(cfg))
        , caller(std::move(client), pool, Duration{config.agent.llm_timeout_ms})
        , executor(pool, Duration{config.agent.tool_timeout_ms})
        , builder(config.agent.max_recent_turns, config.agent.emit_public_status)
        , orchestrator(config, caller, registry, executor, store, status, builder)
    {
        ToolSpec spec;
        spec.name = "add";
        spec.description = "Add two numbers";
        spec.parameters = {
            {"a", "First addend", ParamType::Number, true, std::nullopt},
            {"b", "Second addend", ParamType::Number, true, std::nullopt}
        };
        auto calls = add_calls;
        REQUIRE(registry.register_tool(spec, [calls](const Json& params, const ToolContext&) {
            calls->fetch_add(1);
            return Result<Json, Error>::ok(Json{{"sum", params["a"].get<double>() + params["b"].get<double>()}});
        }).is_ok());
    }

    Config config;
    ThreadPool pool{4};
    LLMCaller caller;
    ToolRegistry registry;
    ToolExecutor executor;
    MemoryStateStore store;
    StatusBroadcaster status;
    DefaultMessageBuilder builder;
    Orchestrator orchestrator;
    std::shared_ptr<std::atomic<int>> add_calls = std::make_shared<std::atomic<int>>(0);
};

std::shared_ptr<ScriptedLLMClient> scripted(std::vector<std::string> replies) {
    return std::make_shared<ScriptedLLMClient>(std::move(replies));
}

Config with_max_turns(int max_turns) {
    Config config;
    config.agent.max_turns = max_turns;
    return config;
}

}  // namespace

TEST_CASE("A finish reply ends the run with its final text", "[orchestrator]") {
    Harness h(scripted({kFinish}));

    auto result = h.orchestrator.run("agent", "say done");

    REQUIRE(result.succeeded);
    REQUIRE(result.final_output == std::optional<std::string>("done"));
    REQUIRE(result.turns == 1);
    REQUIRE(result.state.turns.size() == 1);
    REQUIRE(result.state.turns[0].llm_message->action == AgentAction::Finish);
    REQUIRE(h.store.load("agent")->turns.size() == 1);
}

TEST_CASE("Tool results feed the next prompt", "[orchestrator]") {
    auto client = scripted({kAdd, kFinish});
    Harness h(client);

    auto result = h.orchestrator.run("agent", "add 2 and 3");

    REQUIRE(result.succeeded);
    REQUIRE(result.turns == 2);
    REQUIRE(h.add_calls->load() == 1);

    const auto& first = result.state.turns[0];
    REQUIRE(first.tool_call->tool == "add");
    REQUIRE(first.tool_result->success);
    REQUIRE(first.tool_result->output["sum"] == 5.0);
    REQUIRE_FALSE(first.deduplicated);

    auto prompts = client->prompts();
    REQUIRE(prompts.size() == 2);
    REQUIRE_FALSE(has(prompts[0], "TOOL_RESULT"));
    REQUIRE_THAT(prompts[1], ContainsSubstring("TOOL_RESULT"));
}

TEST_CASE("Repeated identical calls reuse the first result until max turns", "[orchestrator]") {
    Harness h(scripted({kAdd}), with_max_turns(10));

    auto result = h.orchestrator.run("agent", "add 2 and 3");

    REQUIRE_FALSE(result.succeeded);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->code == ErrorCode::MaxTurnsExceeded);
    REQUIRE(result.error->message == "Max turns (10) reached");
    REQUIRE(result.turns == 10);
    REQUIRE(h.add_calls->load() == 1);

    const auto& turns = result.state.turns;
    REQUIRE(turns.size() == 10);
    const auto& original = turns[0].turn_id;
    REQUIRE(turns[0].tool_call->turn_id == original);
    for (size_t i = 1; i < turns.size(); ++i) {
        REQUIRE(turns[i].deduplicated);
        REQUIRE(turns[i].turn_id != original);
        REQUIRE(turns[i].tool_call->turn_id == original);
        REQUIRE(turns[i].tool_result->turn_id == original);
        REQUIRE(turns[i].tool_result->output == turns[0].tool_result->output);
    }
}

TEST_CASE("Tools can opt out of result reuse", "[orchestrator]") {
    Harness h(scripted({
        R"({"thoughts": "Stamp", "action": "tool_call", "action_input": {"tool": "stamp", "params": {}}})"
    }), with_max_turns(3));

    auto stamps = std::make_shared<std::atomic<int>>(0);
    ToolSpec spec;
    spec.name = "stamp";
    spec.dedupe = DedupePolicy{false, std::nullopt};
    REQUIRE(h.registry.register_tool(spec, [stamps](const Json&, const ToolContext&) {
        return Result<Json, Error>::ok(Json{{"n", stamps->fetch_add(1) + 1}});
    }).is_ok());

    auto result = h.orchestrator.run("agent", "stamp three times");

    REQUIRE(result.error->code == ErrorCode::MaxTurnsExceeded);
    REQUIRE(stamps->load() == 3);
    for (const auto& turn : result.state.turns) {
        REQUIRE_FALSE(turn.deduplicated);
    }
}

TEST_CASE("An entry stored by a concurrent step wins over the local result", "[orchestrator]") {
    Harness h(scripted({
        R"({"thoughts": "Tag it", "action": "tool_call", "action_input": {"tool": "tag", "params": {"x": 1}}})",
        kFinish
    }));

    ToolSpec spec;
    spec.name = "tag";
    spec.parameters = {{"x", "Value to tag", ParamType::Integer, true, std::nullopt}};
    auto& cache = h.orchestrator.cache();
    REQUIRE(h.registry.register_tool(spec, [&cache](const Json& params, const ToolContext&) {
        // Another step for the same call lands while this one runs
        ToolExecutionResult other;
        other.success = true;
        other.tool = "tag";
        other.params = params;
        other.turn_id = "turn_0_other";
        other.output = Json{{"by", "other"}};
        cache.insert_if_absent(fingerprint_tool_call("tag", params), "turn_0_other", other);
        return Result<Json, Error>::ok(Json{{"by", "self"}});
    }).is_ok());

    auto result = h.orchestrator.run("agent", "tag 1");

    REQUIRE(result.succeeded);
    const auto& turn = result.state.turns[0];
    REQUIRE(turn.deduplicated);
    REQUIRE(turn.tool_call->turn_id == "turn_0_other");
    REQUIRE(turn.tool_result->turn_id == "turn_0_other");
    REQUIRE(turn.tool_result->output["by"] == "other");
}

TEST_CASE("Validation failures add controller hints and then a loop breaker", "[orchestrator]") {
    Harness h(scripted({kAddMissingB}));

    auto first = h.orchestrator.step("agent", "add 2 and 3");
    REQUIRE(first.is_ok());
    REQUIRE(first.value().should_continue);
    REQUIRE(first.value().executed_tool);
    REQUIRE(first.value().tool_result->output["type"] == "validation_error");
    REQUIRE(first.value().tool_result->output["missing"] == Json::array({"b"}));

    auto state = *h.store.load("agent");
    REQUIRE(state.turns.size() == 2);
    const auto& hint = *state.turns[1].llm_message;
    REQUIRE(hint.action == AgentAction::Retry);
    REQUIRE(hint.thoughts == Orchestrator::kRetryHintThoughts);
    REQUIRE(hint.action_input.summary == std::optional<std::string>("Retry add including all required params."));

    REQUIRE(h.orchestrator.step("agent", "add 2 and 3").is_ok());
    REQUIRE(h.store.load("agent")->turns.size() == 4);

    REQUIRE(h.orchestrator.step("agent", "add 2 and 3").is_ok());
    state = *h.store.load("agent");
    REQUIRE(state.turns.size() == 7);
    const auto& breaker = *state.turns[6].llm_message;
    REQUIRE(breaker.thoughts == Orchestrator::kLoopBreakerThoughts);
    REQUIRE_THAT(*breaker.action_input.summary, StartsWith("Stop repeating the same failing call to add."));
    REQUIRE(h.add_calls->load() == 0);
    REQUIRE(h.orchestrator.metrics().snapshot().operational.loop_detections == 1);
}

TEST_CASE("The optional hard stop ends a looping run", "[orchestrator]") {
    Config config;
    config.agent.loop_hard_stop_threshold = 2;
    Harness h(scripted({kAddMissingB}), config);

    auto result = h.orchestrator.run("agent", "add 2 and 3");

    REQUIRE_FALSE(result.succeeded);
    REQUIRE(result.turns == 2);
    REQUIRE(result.error->code == ErrorCode::LoopDetected);
    REQUIRE(result.error->message == "Loop detected: 'add' failed 2 times with identical parameters");
    REQUIRE(result.state.turns.size() == 4);
}

TEST_CASE("Unknown and disabled tools become failed turns", "[orchestrator]") {
    Harness h(scripted({
        R"({"thoughts": "Subtract", "action": "tool_call", "action_input": {"tool": "subtract", "params": {}}})",
        kAdd
    }));

    auto unknown = h.orchestrator.step("agent", "goal");
    REQUIRE(unknown.is_ok());
    REQUIRE(unknown.value().should_continue);
    REQUIRE(unknown.value().tool_result->output["type"] == "tool_not_found");
    REQUIRE(unknown.value().tool_result->error == std::optional<std::string>("Tool not found: subtract"));

    REQUIRE(h.registry.disable_tool("add").is_ok());
    auto disabled = h.orchestrator.step("agent", "goal");
    REQUIRE(disabled.value().tool_result->output["type"] == "tool_disabled");
    REQUIRE(h.add_calls->load() == 0);
}

TEST_CASE("Unparseable replies are recorded and the loop goes on", "[orchestrator]") {
    Harness h(scripted({
        "I would rather chat.",
        R"({"action": "plan", "action_input": {}})",
        kFinish
    }));

    auto prose = h.orchestrator.step("agent", "goal");
    REQUIRE(prose.is_ok());
    REQUIRE(prose.value().should_continue);
    REQUIRE(prose.value().error.has_value());
    REQUIRE_THAT(prose.value().error->message, StartsWith("Invalid LLM JSON: "));

    auto missing = h.orchestrator.step("agent", "goal");
    REQUIRE_THAT(missing.value().error->message, ContainsSubstring("thoughts"));

    auto state = *h.store.load("agent");
    REQUIRE(state.turns.size() == 2);
    REQUIRE(state.turns[0].error.has_value());
    REQUIRE_FALSE(state.turns[0].llm_message.has_value());

    auto done = h.orchestrator.step("agent", "goal");
    REQUIRE_FALSE(done.value().should_continue);
    REQUIRE(done.value().final_output == std::optional<std::string>("done"));
}

TEST_CASE("A slow model is cut off at the deadline", "[orchestrator]") {
    Config config;
    config.agent.llm_timeout_ms = 50;
    Harness h(std::make_shared<SlowLLMClient>(Duration{2000}, kFinish), config);

    auto step = h.orchestrator.step("agent", "goal");

    REQUIRE(step.is_ok());
    REQUIRE(step.value().should_continue);
    REQUIRE(step.value().error->code == ErrorCode::LLMTimeout);
    REQUIRE(step.value().error->message == "LLM call deadline exceeded after 50ms");
    REQUIRE(h.store.load("agent")->turns[0].error == std::optional<std::string>("LLM call deadline exceeded after 50ms"));
}

TEST_CASE("Model transport failures are prefixed on the turn", "[orchestrator]") {
    Harness h(scripted({}));

    auto step = h.orchestrator.step("agent", "goal");
    REQUIRE(step.is_ok());
    REQUIRE(step.value().error->message == "LLM call failed: No replies scripted");
}

TEST_CASE("Cancellation aborts without recording a turn", "[orchestrator]") {
    Harness h(scripted({kFinish}));
    CancellationSource source;
    source.cancel();

    auto step = h.orchestrator.step("agent", "goal", source.token());
    REQUIRE(step.is_err());
    REQUIRE(step.error().code == ErrorCode::Cancelled);
    REQUIRE(h.store.size() == 0);

    auto run = h.orchestrator.run("agent", "goal", source.token());
    REQUIRE_FALSE(run.succeeded);
    REQUIRE(run.error->code == ErrorCode::Cancelled);
    REQUIRE(run.turns == 0);
}

TEST_CASE("Steps append to the stored history with derived turn ids", "[orchestrator]") {
    Harness h(scripted({R"({"thoughts": "Think first", "action": "plan", "action_input": {}})"}));

    REQUIRE(h.orchestrator.step("agent", "goal").is_ok());
    REQUIRE(h.orchestrator.step("agent", "ignored once stored").is_ok());

    auto state = *h.store.load("agent");
    REQUIRE(state.goal == "goal");
    REQUIRE(state.turns.size() == 2);
    REQUIRE(state.turns[0].index == 0);
    REQUIRE(state.turns[1].index == 1);
    REQUIRE(state.turns[1].turn_id == make_turn_id("agent", 1));
}

TEST_CASE("Native function calls drive tool execution", "[orchestrator]") {
    FunctionCallResult call;
    call.has_function_call = true;
    call.function_name = "add";
    call.arguments_json = R"({"a": 2, "b": 3})";

    FunctionCallResult finish;
    finish.assistant_content = kFinish;

    auto client = std::make_shared<FunctionCallingClient>(std::vector<FunctionCallResult>{call, finish});
    Harness h(client);

    auto result = h.orchestrator.run("agent", "add 2 and 3");

    REQUIRE(result.succeeded);
    REQUIRE(h.add_calls->load() == 1);
    REQUIRE(result.state.turns[0].tool_result->output["sum"] == 5.0);
    REQUIRE(result.state.turns[0].llm_message->thoughts == "Calling add to advance the plan.");
    REQUIRE(client->last_specs()[0]["name"] == "add");
}

TEST_CASE("Malformed function arguments become a failed tool turn", "[orchestrator]") {
    FunctionCallResult call;
    call.has_function_call = true;
    call.function_name = "add";
    call.arguments_json = "{oops";

    Harness h(std::make_shared<FunctionCallingClient>(std::vector<FunctionCallResult>{call}));

    auto step = h.orchestrator.step("agent", "add 2 and 3");
    REQUIRE(step.is_ok());
    REQUIRE(step.value().should_continue);
    REQUIRE(step.value().tool_result->output["type"] == "invalid_arguments");

    auto state = *h.store.load("agent");
    REQUIRE(state.turns.size() == 2);
    REQUIRE_FALSE(state.turns[0].llm_message.has_value());
    REQUIRE(state.turns[0].tool_call->tool == "add");
    REQUIRE(state.turns[1].llm_message->thoughts == Orchestrator::kRetryHintThoughts);
}

TEST_CASE("Status updates follow the turn", "[orchestrator]") {
    Harness h(scripted({
        R"({"thoughts": "Done", "action": "finish", "action_input": {"final": "5"},
            "status_title": "Wrapping up", "progress_pct": 90})"
    }));

    std::vector<StatusUpdate> updates;
    h.status.subscribe([&updates](const StatusUpdate& u) { updates.push_back(u); });

    REQUIRE(h.orchestrator.run("agent", "goal").succeeded);

    REQUIRE(updates.size() == 3);
    REQUIRE(updates[0].status_title == "Analyzing task");
    REQUIRE(updates[1].status_title == "Wrapping up");
    REQUIRE(updates[1].progress_pct == std::optional<int>(90));
    REQUIRE(updates[2].status_title == "Finalizing");
    REQUIRE(updates[2].progress_pct == std::optional<int>(100));
    REQUIRE(updates[2].agent_id == "agent");
}

TEST_CASE("Lifecycle events trace the run", "[orchestrator]") {
    Harness h(scripted({kAdd, kFinish}));

    std::vector<AgentEvent> events;
    h.orchestrator.events().subscribe([&](const AgentEvent& e) { events.push_back(e); });

    auto result = h.orchestrator.run("agent", "add 2 and 3");
    REQUIRE(result.succeeded);

    std::vector<AgentEventType> types;
    for (const auto& e : events) {
        types.push_back(e.type);
    }
    REQUIRE(types == std::vector<AgentEventType>{
        AgentEventType::RunStarted,
        AgentEventType::StepStarted,
        AgentEventType::LlmCallStarted,
        AgentEventType::LlmCallCompleted,
        AgentEventType::ToolCallStarted,
        AgentEventType::ToolCallCompleted,
        AgentEventType::StepCompleted,
        AgentEventType::StepStarted,
        AgentEventType::LlmCallStarted,
        AgentEventType::LlmCallCompleted,
        AgentEventType::StepCompleted,
        AgentEventType::RunCompleted
    });

    REQUIRE(events[0].goal == std::optional<std::string>("add 2 and 3"));
    REQUIRE(events[3].action == std::optional<AgentAction>(AgentAction::ToolCall));
    REQUIRE(events[4].tool == std::optional<std::string>("add"));
    REQUIRE(events[4].params["b"] == 3);
    REQUIRE(events[5].success == std::optional<bool>(true));
    REQUIRE(events[6].executed_tool);
    REQUIRE(events[6].should_continue);
    REQUIRE(events[7].turn_index == 1);
    REQUIRE(events[9].action == std::optional<AgentAction>(AgentAction::Finish));
    REQUIRE(events[10].final_output == std::optional<std::string>("done"));
    REQUIRE_FALSE(events[10].should_continue);

    const auto& done = events.back();
    REQUIRE(done.success == std::optional<bool>(true));
    REQUIRE(done.total_turns == 2);
    REQUIRE(done.final_output == std::optional<std::string>("done"));
}

TEST_CASE("Rejected replies surface in events and metrics", "[orchestrator]") {
    Harness h(scripted({"definitely not json"}), with_max_turns(1));

    std::vector<AgentEvent> completed;
    h.orchestrator.events().subscribe(AgentEventType::LlmCallCompleted,
                                      [&](const AgentEvent& e) { completed.push_back(e); });
    std::optional<AgentEvent> run_done;
    h.orchestrator.events().subscribe(AgentEventType::RunCompleted, [&](const AgentEvent& e) { run_done = e; });

    auto result = h.orchestrator.run("agent", "anything");

    REQUIRE_FALSE(result.succeeded);
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].success == std::optional<bool>(false));
    REQUIRE_THAT(*completed[0].error, StartsWith("Invalid LLM JSON: "));
    REQUIRE_FALSE(completed[0].action.has_value());

    REQUIRE(run_done.has_value());
    REQUIRE(run_done->success == std::optional<bool>(false));
    REQUIRE(run_done->error == std::optional<std::string>("Max turns (1) reached"));

    auto snap = h.orchestrator.metrics().snapshot();
    REQUIRE(snap.quality.responses == 1);
    REQUIRE(snap.quality.responses_rejected == 1);
    REQUIRE(snap.performance.llm_calls.count == 1);
    REQUIRE(snap.operational.llm_calls_failed == 0);
}

TEST_CASE("Metrics aggregate runs, steps, tools and the cache", "[orchestrator]") {
    Harness h(scripted({kAdd}), with_max_turns(4));

    auto result = h.orchestrator.run("agent", "add 2 and 3");
    REQUIRE(result.error->code == ErrorCode::MaxTurnsExceeded);

    auto snap = h.orchestrator.metrics().snapshot();
    REQUIRE(snap.performance.runs.count == 1);
    REQUIRE(snap.operational.runs_failed == 1);
    REQUIRE(snap.operational.error_counts.at("max_turns_exceeded") == 1);
    REQUIRE(snap.performance.steps.count == 4);
    REQUIRE(snap.operational.steps_failed == 0);
    REQUIRE(snap.performance.llm_calls.count == 4);
    REQUIRE(snap.operational.tools.at("add").calls == 1);
    REQUIRE(snap.operational.dedupe_misses == 1);
    REQUIRE(snap.operational.dedupe_hits == 3);
    REQUIRE(snap.quality.final_outputs == 0);

    Harness finishing(scripted({kFinish}));
    REQUIRE(finishing.orchestrator.run("agent", "say done").succeeded);
    auto finished = finishing.orchestrator.metrics().snapshot();
    REQUIRE(finished.operational.runs_succeeded == 1);
    REQUIRE(finished.quality.final_outputs == 1);
    REQUIRE(finished.quality.final_output_chars == 4);
}

TEST_CASE("A tool that fails is counted by kind", "[orchestrator]") {
    Harness h(scripted({
        R"({"thoughts": "Break it", "action": "tool_call", "action_input": {"tool": "broken", "params": {}}})",
        kFinish
    }));

    ToolSpec spec;
    spec.name = "broken";
    REQUIRE(h.registry.register_tool(spec, [](const Json&, const ToolContext&) {
        return Result<Json, Error>::err(ErrorCode::ToolExecutionFailed, "gears jammed");
    }).is_ok());

    std::optional<AgentEvent> tool_done;
    h.orchestrator.events().subscribe(AgentEventType::ToolCallCompleted, [&](const AgentEvent& e) { tool_done = e; });

    REQUIRE(h.orchestrator.run("agent", "break it").succeeded);

    REQUIRE(tool_done.has_value());
    REQUIRE(tool_done->success == std::optional<bool>(false));
    REQUIRE(tool_done->tool == std::optional<std::string>("broken"));

    auto snap = h.orchestrator.metrics().snapshot();
    REQUIRE(snap.operational.tools.at("broken").failures == 1);
    REQUIRE(snap.operational.tool_calls_failed == 1);
    REQUIRE(snap.operational.error_counts.at("tool_error") == 1);
}

TEST_CASE("Public status can be switched off", "[orchestrator]") {
    Config config;
    config.agent.emit_public_status = false;
    auto client = scripted({kFinish});
    Harness h(client, config);

    int delivered = 0;
    h.status.subscribe([&delivered](const StatusUpdate&) { delivered++; });

    REQUIRE(h.orchestrator.run("agent", "goal").succeeded);
    REQUIRE(delivered == 0);
    REQUIRE_FALSE(has(client->prompts()[0], "STATUS UPDATES"));
}

TEST_CASE("Reasoning runs on the first turn and after failures every third turn", "[orchestrator]") {
    Config config;
    config.reasoning.mode = "chain_of_thought";
    Harness h(scripted({kFinish}), config);

    auto state = AgentState::create("agent", "goal");
    REQUIRE(h.orchestrator.should_reason(state, 0));

    AgentTurn failed;
    ToolExecutionResult failure;
    failure.success = false;
    failed.tool_result = failure;
    state.append(failed);
    AgentTurn hint;
    ModelMessage message;
    message.thoughts = "retry";
    hint.llm_message = message;
    state.append(hint);

    REQUIRE(h.orchestrator.should_reason(state, 3));
    REQUIRE_FALSE(h.orchestrator.should_reason(state, 4));

    AgentTurn succeeded;
    ToolExecutionResult success;
    success.success = true;
    succeeded.tool_result = success;
    state.append(succeeded);
    REQUIRE_FALSE(h.orchestrator.should_reason(state, 3));

    Harness disabled(scripted({kFinish}));
    REQUIRE_FALSE(disabled.orchestrator.should_reason(AgentState::create("agent", "goal"), 0));
}

TEST_CASE("Reasoning context lists the last three turns", "[orchestrator]") {
    auto state = AgentState::create("agent", "goal");
    REQUIRE(Orchestrator::build_reasoning_context(state).empty());

    auto with_thoughts = [](std::string thoughts) {
        AgentTurn turn;
        ModelMessage message;
        message.thoughts = std::move(thoughts);
        turn.llm_message = message;
        return turn;
    };

    state.append(with_thoughts("First look"));

    auto ok_turn = with_thoughts("Add them");
    ok_turn.tool_call = ToolCallRequest{"add", Json::object(), "t1"};
    ToolExecutionResult ok;
    ok.success = true;
    ok.tool = "add";
    ok_turn.tool_result = ok;
    state.append(ok_turn);

    auto bad_turn = with_thoughts("Add again");
    bad_turn.tool_call = ToolCallRequest{"add", Json::object(), "t2"};
    ToolExecutionResult bad;
    bad.success = false;
    bad.tool = "add";
    bad.error = "missing: b";
    bad_turn.tool_result = bad;
    state.append(bad_turn);

    AgentTurn error_turn;
    error_turn.error = "Invalid LLM JSON: nope";
    state.append(error_turn);

    REQUIRE(Orchestrator::build_reasoning_context(state) ==
            "Recent Actions:"
            "\n- Add them"
            "\n- Successfully executed: add"
            "\n- Add again"
            "\n- Failed to execute: add - missing: b"
            "\n- Error: Invalid LLM JSON: nope");
}

TEST_CASE("Reasoning conclusions reach the decision prompt", "[orchestrator]") {
    auto saw_insight = std::make_shared<std::atomic<bool>>(false);
    auto client = std::make_shared<RoutingLLMClient>([saw_insight](const std::string& prompt) {
        if (has(prompt, "Review the following reasoning chain")) {
            return Result<std::string, Error>::ok(R"({"is_valid": true})");
        }
        if (has(prompt, "PHASE: evaluation")) {
            return Result<std::string, Error>::ok(
                R"({"reasoning": "Adding suffices", "confidence": 0.9, "conclusion": "Use add"})");
        }
        if (has(prompt, "You are reasoning step by step")) {
            return Result<std::string, Error>::ok(R"({"reasoning": "Thinking", "confidence": 0.8})");
        }
        if (has(prompt, "REASONING INSIGHTS:\nUse add")) {
            saw_insight->store(true);
        }
        return Result<std::string, Error>::ok(kFinish);
    });

    Config config;
    config.reasoning.mode = "chain_of_thought";
    Harness h(client, config);

    auto result = h.orchestrator.run("agent", "add 2 and 3");

    REQUIRE(result.succeeded);
    REQUIRE(saw_insight->load());
    const auto& decision = *result.state.turns[0].llm_message;
    REQUIRE(decision.reasoning_chain.has_value());
    REQUIRE(decision.reasoning_chain->steps().size() == 4);
    REQUIRE_FALSE(decision.reasoning_tree.has_value());
}

TEST_CASE("Failed reasoning does not block the decision", "[orchestrator]") {
    auto client = std::make_shared<RoutingLLMClient>([](const std::string& prompt) {
        if (has(prompt, "You are reasoning step by step")) {
            return Result<std::string, Error>::err(ErrorCode::LLMConnectionFailed, "reasoner down");
        }
        return Result<std::string, Error>::ok(kFinish);
    });

    Config config;
    config.reasoning.mode = "chain_of_thought";
    Harness h(client, config);

    auto result = h.orchestrator.run("agent", "goal");
    REQUIRE(result.succeeded);
    REQUIRE_FALSE(result.state.turns[0].llm_message->reasoning_chain.has_value());
}
