#pragma once

#include "turnkit/core/types.hpp"
#include "turnkit/parser/model_message.hpp"
#include "turnkit/tools/tool_call.hpp"

#include <optional>
#include <string>
#include <vector>

namespace turnkit::agent {

using namespace turnkit::core;
using parser::AgentAction;
using parser::ModelMessage;
using tools::ToolCallRequest;
using tools::ToolExecutionResult;

// One decision cycle appended to an agent's history
struct AgentTurn {
    int index = 0;
    TurnId turn_id;  // derived from (agent id, index)
    std::optional<ModelMessage> llm_message;
    std::optional<ToolCallRequest> tool_call;
    std::optional<ToolExecutionResult> tool_result;
    bool deduplicated = false;  // tool_result was reused from an earlier turn
    std::optional<std::string> error;  // model-side failure recorded for this turn
    TimePoint created_at;

    bool tool_failed() const { return tool_result && !tool_result->success; }

    Json to_json() const;
    static AgentTurn from_json(const Json& j);
};

// Persisted history of one agent
struct AgentState {
    AgentId agent_id;
    std::string goal;
    std::vector<AgentTurn> turns;
    TimePoint last_updated;

    static AgentState create(AgentId agent_id, std::string goal);

    int next_index() const { return turns.empty() ? 0 : turns.back().index + 1; }
    const AgentTurn* last_turn() const { return turns.empty() ? nullptr : &turns.back(); }

    // Assigns index and turn id, stamps times, returns the stored turn
    AgentTurn& append(AgentTurn turn);

    Json to_json() const;
    static AgentState from_json(const Json& j);
};

}  // namespace turnkit::agent
