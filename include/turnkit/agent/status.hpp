#pragma once

#include "turnkit/core/types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace turnkit::agent {

using namespace turnkit::core;

// Public progress note for observers of a run
struct StatusUpdate {
    AgentId agent_id;
    int turn_index = 0;
    std::string status_title;
    std::optional<std::string> status_details;
    std::optional<std::string> next_step_hint;
    std::optional<int> progress_pct;
    TimePoint timestamp;

    Json to_json() const;
};

using StatusCallback = std::function<void(const StatusUpdate&)>;

// Fire-and-forget fan-out. A subscriber that throws is logged and skipped.
class StatusBroadcaster {
public:
    using SubscriptionId = size_t;

    explicit StatusBroadcaster(bool enabled = true) : enabled_(enabled) {}

    SubscriptionId subscribe(StatusCallback callback);
    bool unsubscribe(SubscriptionId id);

    // No-op while disabled
    void emit(const StatusUpdate& update);

    void set_enabled(bool enabled);
    bool enabled() const;
    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    bool enabled_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, StatusCallback> subscribers_;
};

}  // namespace turnkit::agent
