#include "turnkit/agent/message_builder.hpp"
#include "turnkit/parser/response_parser.hpp"

#include <algorithm>

namespace turnkit::agent {

namespace {

std::string shorten(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) return text;
    return parser::truncate_utf8(text, max_chars - 3) + "...";
}

Json render_tool_result(const ToolExecutionResult& result) {
    Json j = result.to_json();
    if (!result.output.is_null()) {
        auto output = result.output.dump();
        if (output.size() > DefaultMessageBuilder::kMaxToolOutputChars) {
            j["output"] = shorten(output, DefaultMessageBuilder::kMaxToolOutputChars);
            j["output_truncated"] = true;
        }
    }
    return j;
}

}  // namespace

DefaultMessageBuilder::DefaultMessageBuilder(int max_recent_turns, bool emit_public_status)
    : max_recent_turns_(std::max(0, max_recent_turns))
    , emit_public_status_(emit_public_status)
{
}

std::string DefaultMessageBuilder::system_prompt() {
    return
        "You are an agent that works toward a goal one decision at a time.\n"
        "Every reply is a single JSON object, the MODEL OUTPUT CONTRACT:\n"
        "{\n"
        "  \"thoughts\": \"short reasoning for this decision\",\n"
        "  \"action\": \"plan\" | \"tool_call\" | \"finish\" | \"retry\",\n"
        "  \"action_input\": {\n"
        "    \"tool\": \"tool name, for tool_call\",\n"
        "    \"params\": { \"tool parameters, for tool_call\" },\n"
        "    \"summary\": \"optional summary of progress\",\n"
        "    \"final\": \"final answer, for finish\"\n"
        "  }\n"
        "}\n"
        "Use plan to lay out next steps, tool_call to invoke exactly one tool, retry to try again "
        "after a failure, and finish once the goal is met.";
}

std::string DefaultMessageBuilder::summarize_turn(const AgentTurn& turn) {
    std::string summary;

    if (turn.llm_message) {
        summary += "LLM: " + std::string(parser::action_to_string(turn.llm_message->action)) +
                   " - " + shorten(turn.llm_message->thoughts, 100);
    }
    if (turn.tool_call) {
        if (!summary.empty()) summary += " | ";
        summary += "TOOL: " + turn.tool_call->tool;
    }
    if (turn.tool_result) {
        if (!summary.empty()) summary += " | ";
        summary += std::string("RESULT: ") + (turn.tool_result->success ? "SUCCESS" : "FAILED");
        if (!turn.tool_result->success && turn.tool_result->error) {
            summary += " (" + shorten(*turn.tool_result->error, 50) + ")";
        }
    }
    if (turn.error) {
        if (!summary.empty()) summary += " | ";
        summary += "ERROR: " + shorten(*turn.error, 80);
    }
    return summary;
}

std::vector<Message> DefaultMessageBuilder::build(const AgentState& state,
                                                  const std::vector<tools::ToolSpec>& tools,
                                                  const std::optional<std::string>& reasoning_insight) const {
    std::string user =
        "You will receive your GOAL, TOOL CATALOG, and HISTORY. "
        "Respond ONLY with a single JSON object per the MODEL OUTPUT CONTRACT.\n\n";

    user += "GOAL:\n" + state.goal + "\n\n";

    if (reasoning_insight && !reasoning_insight->empty()) {
        user += "REASONING INSIGHTS:\n" + *reasoning_insight + "\n\n";
    }

    user += "TOOL CATALOG (name and params you may call via action:\"tool_call\"):\n";
    if (tools.empty()) {
        user += "(no tools available)\n";
    }
    for (const auto& tool : tools) {
        user += tool.name + ": " + Json{
            {"description", tool.description},
            {"params", tool.parameters_schema()}
        }.dump() + "\n";
    }
    user += "Use the JSON schemas exactly; do not invent fields.\n\n";

    if (emit_public_status_) {
        user +=
            "STATUS UPDATES (optional): you may add these public fields to your reply:\n"
            "- \"status_title\": string, at most 60 chars\n"
            "- \"status_details\": string, at most 160 chars\n"
            "- \"next_step_hint\": string, at most 60 chars\n"
            "- \"progress_pct\": integer 0-100\n\n";
    }

    user += "HISTORY (most recent last):\n";
    const size_t total = state.turns.size();
    const size_t recent_from = total > static_cast<size_t>(max_recent_turns_)
        ? total - static_cast<size_t>(max_recent_turns_) : 0;

    for (size_t i = 0; i < total; ++i) {
        const auto& turn = state.turns[i];
        if (i < recent_from) {
            user += "SUMMARY: " + summarize_turn(turn) + "\n---\n";
            continue;
        }
        if (turn.llm_message) {
            user += "LLM:\n" + turn.llm_message->to_json().dump() + "\n";
        }
        if (turn.tool_call) {
            user += "TOOL_CALL:\n" + turn.tool_call->to_json().dump() + "\n";
        }
        if (turn.tool_result) {
            user += "TOOL_RESULT:\n" + render_tool_result(*turn.tool_result).dump() + "\n";
        }
        if (turn.error) {
            user += "ERROR:\n" + *turn.error + "\n";
        }
        user += "---\n";
    }

    user +=
        "\nIMPORTANT: Reply with JSON only. No prose or markdown. When a tool call fails, read the "
        "validation_error details in HISTORY and retry with corrected parameters. "
        "Avoid repeating identical failing calls.";

    return {Message::system(system_prompt()), Message::user(std::move(user))};
}

}  // namespace turnkit::agent
