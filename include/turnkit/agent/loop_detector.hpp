#pragma once

#include "turnkit/core/types.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace turnkit::agent {

using namespace turnkit::core;

// Rolling window of (tool, parameter fingerprint, outcome) per agent.
// Agents idle for a day are forgotten, and at most kMaxTrackedAgents are kept.
class LoopDetector {
public:
    static constexpr size_t kMaxTrackedAgents = 100;
    static constexpr std::chrono::hours kAgentIdleTtl{24};

    LoopDetector(int max_history, int failure_threshold);

    void record_tool_call(const AgentId& agent_id,
                          const ToolId& tool,
                          const Json& params,
                          bool success,
                          TimePoint now = Clock::now());

    // Failures of this exact call counted back from the newest record,
    // stopping at a success of the same call or of the same tool
    int consecutive_failures(const AgentId& agent_id, const ToolId& tool, const Json& params) const;

    bool detect_repeated_failures(const AgentId& agent_id, const ToolId& tool, const Json& params) const {
        return consecutive_failures(agent_id, tool, params) >= failure_threshold_;
    }

    void forget(const AgentId& agent_id);
    size_t tracked_agents() const;
    size_t history_size(const AgentId& agent_id) const;

    int failure_threshold() const { return failure_threshold_; }

private:
    struct Record {
        ToolId tool;
        std::string fingerprint;
        bool success = false;
        TimePoint at;
    };

    struct History {
        std::deque<Record> records;
        TimePoint last_activity;
    };

    // Caller holds mutex_
    void evict(TimePoint now);

    size_t max_history_;
    int failure_threshold_;

    mutable std::mutex mutex_;
    std::unordered_map<AgentId, History> histories_;
};

}  // namespace turnkit::agent
