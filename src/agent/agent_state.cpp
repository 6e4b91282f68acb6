#include "turnkit/agent/agent_state.hpp"
#include "turnkit/core/fingerprint.hpp"

namespace turnkit::agent {

// AgentTurn
Json AgentTurn::to_json() const {
    Json j{
        {"index", index},
        {"turn_id", turn_id},
        {"deduplicated", deduplicated},
        {"created_at", to_epoch_ms(created_at)}
    };
    if (llm_message) j["llm_message"] = llm_message->to_json();
    if (tool_call) j["tool_call"] = tool_call->to_json();
    if (tool_result) j["tool_result"] = tool_result->to_json();
    if (error) j["error"] = *error;
    return j;
}

AgentTurn AgentTurn::from_json(const Json& j) {
    AgentTurn turn;
    turn.index = j.value("index", 0);
    turn.turn_id = j.value("turn_id", "");
    turn.deduplicated = j.value("deduplicated", false);
    turn.created_at = from_epoch_ms(j.value("created_at", int64_t{0}));
    if (j.contains("llm_message") && j["llm_message"].is_object()) {
        turn.llm_message = ModelMessage::from_json(j["llm_message"]);
    }
    if (j.contains("tool_call") && j["tool_call"].is_object()) {
        turn.tool_call = ToolCallRequest::from_json(j["tool_call"]);
    }
    if (j.contains("tool_result") && j["tool_result"].is_object()) {
        turn.tool_result = ToolExecutionResult::from_json(j["tool_result"]);
    }
    if (j.contains("error") && j["error"].is_string()) {
        turn.error = j["error"].get<std::string>();
    }
    return turn;
}

// AgentState
AgentState AgentState::create(AgentId agent_id, std::string goal) {
    AgentState state;
    state.agent_id = std::move(agent_id);
    state.goal = std::move(goal);
    state.last_updated = Clock::now();
    return state;
}

AgentTurn& AgentState::append(AgentTurn turn) {
    turn.index = next_index();
    turn.turn_id = make_turn_id(agent_id, turn.index);
    turn.created_at = Clock::now();
    turns.push_back(std::move(turn));
    last_updated = turns.back().created_at;
    return turns.back();
}

Json AgentState::to_json() const {
    Json turns_json = Json::array();
    for (const auto& turn : turns) {
        turns_json.push_back(turn.to_json());
    }
    return Json{
        {"agent_id", agent_id},
        {"goal", goal},
        {"turns", turns_json},
        {"last_updated", to_epoch_ms(last_updated)}
    };
}

AgentState AgentState::from_json(const Json& j) {
    AgentState state;
    state.agent_id = j.at("agent_id").get<std::string>();
    state.goal = j.value("goal", "");
    for (const auto& turn : j.at("turns")) {
        state.turns.push_back(AgentTurn::from_json(turn));
    }
    state.last_updated = from_epoch_ms(j.value("last_updated", int64_t{0}));
    return state;
}

}  // namespace turnkit::agent
