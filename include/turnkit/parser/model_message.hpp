#pragma once

#include "turnkit/core/types.hpp"
#include "turnkit/reasoning/reasoning_types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace turnkit::parser {

using namespace turnkit::core;

// Closed set of decisions a model can return. Consumers switch over it
// exhaustively, so a new action is a compile-time change everywhere.
enum class AgentAction {
    Plan,
    ToolCall,
    Finish,
    Retry
};

std::string_view action_to_string(AgentAction action);

// Case-insensitive
std::optional<AgentAction> action_from_string(std::string_view str);

// Fields populated per action: tool/params for ToolCall, final_text for Finish
struct ActionInput {
    std::optional<std::string> tool;
    Json params = Json::object();
    std::optional<std::string> summary;
    std::optional<std::string> final_text;

    Json to_json() const;
    static ActionInput from_json(const Json& j);

    bool operator==(const ActionInput& other) const;
};

// Caps applied to optional status fields
inline constexpr size_t kMaxStatusTitleLength = 60;
inline constexpr size_t kMaxStatusDetailsLength = 160;
inline constexpr size_t kMaxNextStepHintLength = 60;

// One validated model decision
struct ModelMessage {
    std::string thoughts;
    AgentAction action = AgentAction::Plan;
    ActionInput action_input;

    // Optional public status; invalid values are dropped during parsing
    std::optional<std::string> status_title;
    std::optional<std::string> status_details;
    std::optional<std::string> next_step_hint;
    std::optional<int> progress_pct;

    // Deliberation attached before the decision, when reasoning is enabled
    std::optional<reasoning::ReasoningChain> reasoning_chain;
    std::optional<reasoning::ReasoningTree> reasoning_tree;

    bool has_status() const { return status_title.has_value(); }

    // Wire shape the model is asked to produce
    Json to_json() const;

    // Lenient inverse of to_json() for persisted state
    static ModelMessage from_json(const Json& j);
};

}  // namespace turnkit::parser
