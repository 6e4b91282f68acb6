#include "turnkit/agent/loop_detector.hpp"
#include "turnkit/core/fingerprint.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace turnkit::agent {

LoopDetector::LoopDetector(int max_history, int failure_threshold)
    : max_history_(static_cast<size_t>(std::max(1, max_history)))
    , failure_threshold_(std::max(1, failure_threshold))
{
}

void LoopDetector::record_tool_call(const AgentId& agent_id,
                                    const ToolId& tool,
                                    const Json& params,
                                    bool success,
                                    TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& history = histories_[agent_id];
    history.records.push_back(Record{tool, fingerprint_tool_call(tool, params), success, now});
    while (history.records.size() > max_history_) {
        history.records.pop_front();
    }
    history.last_activity = now;

    evict(now);
}

int LoopDetector::consecutive_failures(const AgentId& agent_id, const ToolId& tool, const Json& params) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = histories_.find(agent_id);
    if (it == histories_.end()) {
        return 0;
    }

    const auto fingerprint = fingerprint_tool_call(tool, params);
    int failures = 0;

    // Other tools in between do not reset the count
    for (auto rit = it->second.records.rbegin(); rit != it->second.records.rend(); ++rit) {
        if (rit->tool != tool) continue;
        if (rit->success) break;
        if (rit->fingerprint == fingerprint) {
            failures++;
        }
    }
    return failures;
}

void LoopDetector::forget(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    histories_.erase(agent_id);
}

size_t LoopDetector::tracked_agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return histories_.size();
}

size_t LoopDetector::history_size(const AgentId& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(agent_id);
    return it == histories_.end() ? 0 : it->second.records.size();
}

void LoopDetector::evict(TimePoint now) {
    const auto cutoff = now - kAgentIdleTtl;
    for (auto it = histories_.begin(); it != histories_.end();) {
        if (it->second.last_activity < cutoff) {
            spdlog::debug("Dropping idle loop history for agent {}", it->first);
            it = histories_.erase(it);
        } else {
            ++it;
        }
    }

    if (histories_.size() <= kMaxTrackedAgents) {
        return;
    }

    std::vector<std::pair<TimePoint, AgentId>> by_age;
    by_age.reserve(histories_.size());
    for (const auto& [agent_id, history] : histories_) {
        by_age.emplace_back(history.last_activity, agent_id);
    }
    std::sort(by_age.begin(), by_age.end());

    const size_t excess = histories_.size() - kMaxTrackedAgents;
    for (size_t i = 0; i < excess; ++i) {
        histories_.erase(by_age[i].second);
    }
}

}  // namespace turnkit::agent
