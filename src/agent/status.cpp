#include "turnkit/agent/status.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace turnkit::agent {

Json StatusUpdate::to_json() const {
    Json j{
        {"agent_id", agent_id},
        {"turn_index", turn_index},
        {"status_title", status_title},
        {"timestamp", to_epoch_ms(timestamp)}
    };
    if (status_details) j["status_details"] = *status_details;
    if (next_step_hint) j["next_step_hint"] = *next_step_hint;
    if (progress_pct) j["progress_pct"] = *progress_pct;
    return j;
}

StatusBroadcaster::SubscriptionId StatusBroadcaster::subscribe(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    subscribers_[id] = std::move(callback);
    return id;
}

bool StatusBroadcaster::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.erase(id) > 0;
}

void StatusBroadcaster::emit(const StatusUpdate& update) {
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!enabled_) return;
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }

    spdlog::debug("Status [{}#{}]: {}", update.agent_id, update.turn_index, update.status_title);

    for (const auto& callback : callbacks) {
        try {
            callback(update);
        } catch (const std::exception& e) {
            spdlog::error("Status subscriber threw: {}", e.what());
        } catch (...) {
            spdlog::error("Status subscriber threw a non-standard exception");
        }
    }
}

void StatusBroadcaster::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_ = enabled;
}

bool StatusBroadcaster::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

size_t StatusBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

}  // namespace turnkit::agent
