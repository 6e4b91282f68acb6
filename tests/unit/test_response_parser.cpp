#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "turnkit/parser/response_parser.hpp"

using namespace turnkit::parser;
using turnkit::core::ErrorCode;
using Catch::Matchers::WithinAbs;

TEST_CASE("Plan decision parses", "[parser]") {
    auto parsed = parse_strict(R"({"thoughts":"t","action":"plan","action_input":{}})");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().thoughts == "t");
    REQUIRE(parsed.value().action == AgentAction::Plan);
}

TEST_CASE("Fenced reply with trailing prose parses", "[parser]") {
    auto parsed = parse_strict(
        "Here is my answer:\n```json\n{\"thoughts\":\"t\",\"action\":\"plan\",\"action_input\":{}}\n```\n"
        "Hope this helps {really}.");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().thoughts == "t");
}

TEST_CASE("Fenced reply after prose with braces parses", "[parser]") {
    auto parsed = parse_strict(
        "I will reply in {json} form:\n```json\n{\"thoughts\":\"t\",\"action\":\"plan\",\"action_input\":{}}\n```\n"
        "Hope that helps.");
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().thoughts == "t");
    REQUIRE(parsed.value().action == AgentAction::Plan);
}

TEST_CASE("Tool call carries tool and params", "[parser]") {
    auto parsed = parse_strict(
        R"({"thoughts":"add them","action":"TOOL_CALL","action_input":{"tool":" add ","params":{"a":1,"b":1}}})");
    REQUIRE(parsed.is_ok());

    const auto& msg = parsed.value();
    REQUIRE(msg.action == AgentAction::ToolCall);
    REQUIRE(msg.action_input.tool == std::optional<std::string>("add"));
    REQUIRE(msg.action_input.params["a"] == 1);
}

TEST_CASE("Finish requires final text", "[parser]") {
    auto ok = parse_strict(R"({"thoughts":"t","action":"finish","action_input":{"final":"done"}})");
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().action_input.final_text == std::optional<std::string>("done"));

    auto missing = parse_strict(R"({"thoughts":"t","action":"finish","action_input":{}})");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == ErrorCode::ResponseValidationFailed);
    REQUIRE(missing.error().context == std::optional<std::string>("final"));
}

TEST_CASE("Validation failures name the offending field", "[parser]") {
    struct Case {
        const char* text;
        const char* field;
    };
    const Case cases[] = {
        {R"({"action":"plan","action_input":{}})", "thoughts"},
        {R"({"thoughts":"   ","action":"plan","action_input":{}})", "thoughts"},
        {R"({"thoughts":"t","action":"dance","action_input":{}})", "action"},
        {R"({"thoughts":"t","action":"plan"})", "action_input"},
        {R"({"thoughts":"t","action":"tool_call","action_input":{}})", "tool"},
        {R"({"thoughts":"t","action":"tool_call","action_input":{"tool":"add","params":[1]}})", "params"},
        {R"(["not", "an", "object"])", "root"},
    };

    for (const auto& c : cases) {
        INFO(c.text);
        auto parsed = parse_strict(c.text);
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.error().code == ErrorCode::ResponseValidationFailed);
        REQUIRE(parsed.error().context == std::optional<std::string>(c.field));
    }
}

TEST_CASE("Unrepairable text is reported as invalid response", "[parser]") {
    auto parsed = parse_strict("I think we should add the numbers.");
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.error().code == ErrorCode::LLMInvalidResponse);
}

TEST_CASE("Length caps apply to required text", "[parser]") {
    ParseLimits limits;
    limits.max_thoughts_length = 5;

    auto parsed = parse_strict(R"({"thoughts":"far too long","action":"plan","action_input":{}})", limits);
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.error().context == std::optional<std::string>("thoughts"));
}

TEST_CASE("Optional status fields are truncated or dropped", "[parser]") {
    const std::string long_title(100, 'x');
    auto parsed = parse_strict(
        R"({"thoughts":"t","action":"plan","action_input":{},"status_title":")" + long_title +
        R"(","status_details":42,"progress_pct":140})");
    REQUIRE(parsed.is_ok());

    const auto& msg = parsed.value();
    REQUIRE(msg.status_title->size() == kMaxStatusTitleLength);
    REQUIRE_FALSE(msg.status_details.has_value());
    REQUIRE_FALSE(msg.progress_pct.has_value());
}

TEST_CASE("Parsing a serialized message reproduces it", "[parser]") {
    ModelMessage original;
    original.thoughts = "call the adder";
    original.action = AgentAction::ToolCall;
    original.action_input.tool = "add";
    original.action_input.params = {{"a", 1}, {"b", {{"nested", true}}}};
    original.action_input.summary = "adding";

    const auto text = original.to_json().dump();
    auto first = parse_strict(text);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().thoughts == original.thoughts);
    REQUIRE(first.value().action == original.action);
    REQUIRE(first.value().action_input == original.action_input);

    auto second = parse_strict(first.value().to_json().dump());
    REQUIRE(second.is_ok());
    REQUIRE(second.value().to_json() == first.value().to_json());
}

TEST_CASE("Chain of thought replies degrade to plain text", "[parser]") {
    auto plain = parse_chain_of_thought("  The goal needs two numbers.  ");
    REQUIRE(plain.reasoning == "The goal needs two numbers.");
    REQUIRE_THAT(plain.confidence, WithinAbs(0.5, 1e-9));

    auto structured = parse_chain_of_thought(
        R"({"reasoning":"r","confidence":1.7,"insights":["a",3,"b"],"conclusion":"  "})");
    REQUIRE(structured.reasoning == "r");
    REQUIRE_THAT(structured.confidence, WithinAbs(1.0, 1e-9));
    const std::vector<std::string> expected{"a", "b"};
    REQUIRE(structured.insights == expected);
    REQUIRE_FALSE(structured.conclusion.has_value());
}

TEST_CASE("Tree of thoughts replies accept every shape", "[parser]") {
    auto children = parse_tree_of_thoughts(
        R"({"children":[{"thought":"x","thought_type":"Analysis","estimated_score":0.7},{"thought":""},{"thought":"y"}]})");
    REQUIRE(children.is_ok());
    REQUIRE(children.value().thoughts.size() == 2);
    REQUIRE(children.value().thoughts[0].type == turnkit::reasoning::ThoughtType::Analysis);
    REQUIRE(children.value().thoughts[0].estimated_score == std::optional<double>(0.7));
    REQUIRE_FALSE(children.value().thoughts[1].estimated_score.has_value());

    auto score = parse_tree_of_thoughts(R"({"score":-2,"reasoning":"weak"})");
    REQUIRE(score.is_ok());
    REQUIRE(score.value().score == std::optional<double>(0.0));
    REQUIRE(score.value().reasoning == "weak");

    auto conclusion = parse_tree_of_thoughts(R"({"conclusion":"do it"})");
    REQUIRE(conclusion.value().conclusion == std::optional<std::string>("do it"));

    REQUIRE(parse_tree_of_thoughts("[1,2]").is_err());
}

TEST_CASE("UTF-8 truncation never splits a sequence", "[parser]") {
    REQUIRE(truncate_utf8("h\xC3\xA9llo", 2) == "h");
    REQUIRE(truncate_utf8("h\xC3\xA9llo", 3) == "h\xC3\xA9");
    REQUIRE(truncate_utf8("abc", 10) == "abc");
}
