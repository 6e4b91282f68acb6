#pragma once

#include "turnkit/core/types.hpp"
#include "turnkit/parser/model_message.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace turnkit::agent {

using namespace turnkit::core;
using parser::AgentAction;

// Lifecycle points of a run
enum class AgentEventType {
    RunStarted,
    StepStarted,
    LlmCallStarted,
    LlmCallCompleted,
    ToolCallStarted,
    ToolCallCompleted,
    StepCompleted,
    RunCompleted
};

std::string_view event_type_to_string(AgentEventType type);

// One lifecycle notification. Fields past the common ones are filled in
// only for the event types noted beside them.
struct AgentEvent {
    AgentEventType type = AgentEventType::RunStarted;
    AgentId agent_id;
    int turn_index = 0;
    TimePoint timestamp;

    std::optional<std::string> goal;          // RunStarted
    std::optional<std::string> tool;          // ToolCall*
    Json params;                              // ToolCallStarted
    std::optional<AgentAction> action;        // LlmCallCompleted
    std::optional<bool> success;              // *Completed
    std::optional<std::string> error;         // *Completed
    std::optional<std::string> final_output;  // StepCompleted, RunCompleted
    bool should_continue = false;             // StepCompleted
    bool executed_tool = false;               // StepCompleted
    int total_turns = 0;                      // RunCompleted
    Duration elapsed{0};                      // *Completed

    Json to_json() const;

    static AgentEvent make(AgentEventType type, const AgentId& agent_id, int turn_index);
};

using EventCallback = std::function<void(const AgentEvent&)>;

// Synchronous fan-out of lifecycle events. Handlers run on the publishing
// thread; one that throws is logged and the rest still get the event.
class EventBus {
public:
    using SubscriptionId = size_t;

    SubscriptionId subscribe(EventCallback callback);

    // Only events of `type`
    SubscriptionId subscribe(AgentEventType type, EventCallback callback);

    bool unsubscribe(SubscriptionId id);

    void publish(const AgentEvent& event);

    size_t subscriber_count() const;

private:
    struct Subscription {
        std::optional<AgentEventType> filter;
        EventCallback callback;
    };

    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, Subscription> subscribers_;
};

}  // namespace turnkit::agent
