#include "turnkit/agent/events.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace turnkit::agent {

std::string_view event_type_to_string(AgentEventType type) {
    switch (type) {
        case AgentEventType::RunStarted: return "run_started";
        case AgentEventType::StepStarted: return "step_started";
        case AgentEventType::LlmCallStarted: return "llm_call_started";
        case AgentEventType::LlmCallCompleted: return "llm_call_completed";
        case AgentEventType::ToolCallStarted: return "tool_call_started";
        case AgentEventType::ToolCallCompleted: return "tool_call_completed";
        case AgentEventType::StepCompleted: return "step_completed";
        case AgentEventType::RunCompleted: return "run_completed";
    }
    return "unknown";
}

AgentEvent AgentEvent::make(AgentEventType type, const AgentId& agent_id, int turn_index) {
    AgentEvent event;
    event.type = type;
    event.agent_id = agent_id;
    event.turn_index = turn_index;
    event.timestamp = Clock::now();
    return event;
}

Json AgentEvent::to_json() const {
    Json j{
        {"type", std::string(event_type_to_string(type))},
        {"agent_id", agent_id},
        {"turn_index", turn_index},
        {"timestamp", to_epoch_ms(timestamp)}
    };

    switch (type) {
        case AgentEventType::RunStarted:
            if (goal) j["goal"] = *goal;
            break;
        case AgentEventType::StepStarted:
        case AgentEventType::LlmCallStarted:
            break;
        case AgentEventType::ToolCallStarted:
            if (tool) j["tool"] = *tool;
            j["params"] = params;
            break;
        case AgentEventType::LlmCallCompleted:
            if (action) j["action"] = std::string(parser::action_to_string(*action));
            break;
        case AgentEventType::ToolCallCompleted:
            if (tool) j["tool"] = *tool;
            break;
        case AgentEventType::StepCompleted:
            j["continue"] = should_continue;
            j["executed_tool"] = executed_tool;
            if (final_output) j["final_output"] = *final_output;
            break;
        case AgentEventType::RunCompleted:
            j["total_turns"] = total_turns;
            if (final_output) j["final_output"] = *final_output;
            break;
    }

    if (success) j["success"] = *success;
    if (error) j["error"] = *error;
    if (elapsed.count() > 0) j["elapsed_ms"] = elapsed.count();
    return j;
}

EventBus::SubscriptionId EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    subscribers_[id] = Subscription{std::nullopt, std::move(callback)};
    return id;
}

EventBus::SubscriptionId EventBus::subscribe(AgentEventType type, EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    subscribers_[id] = Subscription{type, std::move(callback)};
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

void EventBus::publish(const AgentEvent& event) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, sub] : subscribers_) {
            if (!sub.filter || *sub.filter == event.type) {
                callbacks.push_back(sub.callback);
            }
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            spdlog::warn("{} handler threw: {}", event_type_to_string(event.type), e.what());
        } catch (...) {
            spdlog::warn("{} handler threw a non-standard exception", event_type_to_string(event.type));
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

}  // namespace turnkit::agent
