#pragma once

#include "turnkit/core/types.hpp"
#include "turnkit/tools/tool_spec.hpp"
#include "agent_state.hpp"

#include <optional>
#include <string>
#include <vector>

namespace turnkit::agent {

using namespace turnkit::core;

// Prompt assembly boundary
class MessageBuilder {
public:
    virtual ~MessageBuilder() = default;

    virtual std::vector<Message> build(const AgentState& state,
                                       const std::vector<tools::ToolSpec>& tools,
                                       const std::optional<std::string>& reasoning_insight) const = 0;
};

// System prompt with the JSON reply protocol, then a user message holding the
// goal, tool catalog and history. The last max_recent_turns turns are shown in
// full; older ones as one-line summaries.
class DefaultMessageBuilder : public MessageBuilder {
public:
    static constexpr size_t kMaxToolOutputChars = 4000;

    explicit DefaultMessageBuilder(int max_recent_turns = 10, bool emit_public_status = true);

    std::vector<Message> build(const AgentState& state,
                               const std::vector<tools::ToolSpec>& tools,
                               const std::optional<std::string>& reasoning_insight) const override;

    static std::string system_prompt();
    static std::string summarize_turn(const AgentTurn& turn);

private:
    int max_recent_turns_;
    bool emit_public_status_;
};

}  // namespace turnkit::agent
