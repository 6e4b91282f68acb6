#include "turnkit/parser/model_message.hpp"

#include <algorithm>
#include <cctype>

namespace turnkit::parser {

std::string_view action_to_string(AgentAction action) {
    switch (action) {
        case AgentAction::Plan: return "plan";
        case AgentAction::ToolCall: return "tool_call";
        case AgentAction::Finish: return "finish";
        case AgentAction::Retry: return "retry";
    }
    return "plan";
}

std::optional<AgentAction> action_from_string(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "plan") return AgentAction::Plan;
    if (lower == "tool_call") return AgentAction::ToolCall;
    if (lower == "finish") return AgentAction::Finish;
    if (lower == "retry") return AgentAction::Retry;
    return std::nullopt;
}

// ActionInput
Json ActionInput::to_json() const {
    Json j = Json::object();
    if (tool) {
        j["tool"] = *tool;
        j["params"] = params;
    } else if (!params.empty()) {
        j["params"] = params;
    }
    if (summary) j["summary"] = *summary;
    if (final_text) j["final"] = *final_text;
    return j;
}

ActionInput ActionInput::from_json(const Json& j) {
    ActionInput input;
    if (!j.is_object()) return input;

    if (j.contains("tool") && j["tool"].is_string()) {
        input.tool = j["tool"].get<std::string>();
    }
    if (j.contains("params") && j["params"].is_object()) {
        input.params = j["params"];
    }
    if (j.contains("summary") && j["summary"].is_string()) {
        input.summary = j["summary"].get<std::string>();
    }
    if (j.contains("final") && j["final"].is_string()) {
        input.final_text = j["final"].get<std::string>();
    }
    return input;
}

bool ActionInput::operator==(const ActionInput& other) const {
    return tool == other.tool &&
           params == other.params &&
           summary == other.summary &&
           final_text == other.final_text;
}

// ModelMessage
Json ModelMessage::to_json() const {
    Json j{
        {"thoughts", thoughts},
        {"action", std::string(action_to_string(action))},
        {"action_input", action_input.to_json()}
    };
    if (status_title) j["status_title"] = *status_title;
    if (status_details) j["status_details"] = *status_details;
    if (next_step_hint) j["next_step_hint"] = *next_step_hint;
    if (progress_pct) j["progress_pct"] = *progress_pct;
    if (reasoning_chain) j["reasoning_chain"] = reasoning_chain->to_json();
    if (reasoning_tree) j["reasoning_tree"] = reasoning_tree->to_json();
    return j;
}

ModelMessage ModelMessage::from_json(const Json& j) {
    ModelMessage msg;
    msg.thoughts = j.value("thoughts", "");
    msg.action = action_from_string(j.value("action", "plan")).value_or(AgentAction::Plan);
    if (j.contains("action_input")) {
        msg.action_input = ActionInput::from_json(j["action_input"]);
    }
    if (j.contains("status_title") && j["status_title"].is_string()) {
        msg.status_title = j["status_title"].get<std::string>();
    }
    if (j.contains("status_details") && j["status_details"].is_string()) {
        msg.status_details = j["status_details"].get<std::string>();
    }
    if (j.contains("next_step_hint") && j["next_step_hint"].is_string()) {
        msg.next_step_hint = j["next_step_hint"].get<std::string>();
    }
    if (j.contains("progress_pct") && j["progress_pct"].is_number()) {
        msg.progress_pct = j["progress_pct"].get<int>();
    }
    if (j.contains("reasoning_chain") && j["reasoning_chain"].is_object()) {
        msg.reasoning_chain = reasoning::ReasoningChain::from_json(j["reasoning_chain"]);
    }
    if (j.contains("reasoning_tree") && j["reasoning_tree"].is_object()) {
        msg.reasoning_tree = reasoning::ReasoningTree::from_json(j["reasoning_tree"]);
    }
    return msg;
}

}  // namespace turnkit::parser
