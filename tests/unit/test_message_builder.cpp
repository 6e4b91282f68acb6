#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "turnkit/agent/message_builder.hpp"

using namespace turnkit::agent;
using turnkit::tools::ParamSpec;
using turnkit::tools::ParamType;
using turnkit::tools::ToolSpec;
using Catch::Matchers::ContainsSubstring;

namespace {

size_t count_of(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

ToolSpec add_spec() {
    ToolSpec spec;
    spec.name = "add";
    spec.description = "Add two numbers";
    spec.parameters = {
        {"a", "", ParamType::Number, true, std::nullopt},
        {"b", "", ParamType::Number, true, std::nullopt}
    };
    return spec;
}

AgentTurn plan_turn(std::string thoughts) {
    AgentTurn turn;
    ModelMessage message;
    message.thoughts = std::move(thoughts);
    message.action = AgentAction::Plan;
    turn.llm_message = message;
    return turn;
}

}  // namespace

TEST_CASE("The prompt is a system contract plus one user message", "[message_builder]") {
    DefaultMessageBuilder builder;
    auto state = AgentState::create("agent", "add 2 and 3");

    auto messages = builder.build(state, {add_spec()}, std::nullopt);

    REQUIRE(messages.size() == 2);
    REQUIRE(messages[0].role == Role::System);
    REQUIRE_THAT(messages[0].content, ContainsSubstring("MODEL OUTPUT CONTRACT"));
    REQUIRE(messages[1].role == Role::User);

    const auto& user = messages[1].content;
    REQUIRE_THAT(user, ContainsSubstring("GOAL:\nadd 2 and 3"));
    REQUIRE_THAT(user, ContainsSubstring("TOOL CATALOG"));
    REQUIRE_THAT(user, ContainsSubstring("add: {\"description\":\"Add two numbers\""));
    REQUIRE_THAT(user, ContainsSubstring("STATUS UPDATES"));
    REQUIRE_THAT(user, ContainsSubstring("HISTORY (most recent last):"));
    REQUIRE_FALSE(count_of(user, "REASONING INSIGHTS") > 0);
}

TEST_CASE("Reasoning insights and status guidance are optional sections", "[message_builder]") {
    DefaultMessageBuilder builder(10, false);
    auto state = AgentState::create("agent", "goal");

    auto user = builder.build(state, {}, std::string("Use add")).at(1).content;
    REQUIRE_THAT(user, ContainsSubstring("REASONING INSIGHTS:\nUse add"));
    REQUIRE_THAT(user, ContainsSubstring("(no tools available)"));
    REQUIRE(count_of(user, "STATUS UPDATES") == 0);

    auto blank = builder.build(state, {}, std::string("")).at(1).content;
    REQUIRE(count_of(blank, "REASONING INSIGHTS") == 0);
}

TEST_CASE("Older turns collapse into summaries", "[message_builder]") {
    DefaultMessageBuilder builder(1);
    auto state = AgentState::create("agent", "goal");
    state.append(plan_turn("first idea"));
    state.append(plan_turn("second idea"));
    state.append(plan_turn("third idea"));

    auto user = builder.build(state, {}, std::nullopt).at(1).content;

    REQUIRE(count_of(user, "SUMMARY: LLM: plan - ") == 2);
    REQUIRE_THAT(user, ContainsSubstring("SUMMARY: LLM: plan - first idea"));
    REQUIRE(count_of(user, "LLM:\n{") == 1);
    REQUIRE_THAT(user, ContainsSubstring("third idea"));
}

TEST_CASE("Turn summaries mention tools, failures and errors", "[message_builder]") {
    AgentTurn turn;
    turn.tool_call = ToolCallRequest{"add", Json{{"a", 1}}, "turn_0_x"};
    ToolExecutionResult result;
    result.success = false;
    result.error = "missing: b";
    turn.tool_result = result;

    REQUIRE(DefaultMessageBuilder::summarize_turn(turn) == "TOOL: add | RESULT: FAILED (missing: b)");

    AgentTurn broken;
    broken.error = "Invalid LLM JSON: no object";
    REQUIRE(DefaultMessageBuilder::summarize_turn(broken) == "ERROR: Invalid LLM JSON: no object");
}

TEST_CASE("Large tool outputs are truncated in the prompt", "[message_builder]") {
    DefaultMessageBuilder builder;
    auto state = AgentState::create("agent", "goal");

    AgentTurn turn;
    turn.tool_call = ToolCallRequest{"dump", Json::object(), "turn_0_x"};
    ToolExecutionResult result;
    result.success = true;
    result.tool = "dump";
    result.output = Json{{"blob", std::string(10000, 'x')}};
    turn.tool_result = result;
    state.append(std::move(turn));

    auto user = builder.build(state, {}, std::nullopt).at(1).content;
    REQUIRE_THAT(user, ContainsSubstring("\"output_truncated\":true"));
    REQUIRE(user.size() < 8000);

    // The stored result is untouched
    REQUIRE(state.turns[0].tool_result->output["blob"].get<std::string>().size() == 10000);
}
