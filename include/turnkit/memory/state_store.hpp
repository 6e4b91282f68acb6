#pragma once

#include "turnkit/agent/agent_state.hpp"
#include "turnkit/core/result.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

namespace turnkit::memory {

using namespace turnkit::core;
using agent::AgentState;

namespace fs = std::filesystem;

// Persistence boundary for agent histories
class AgentStateStore {
public:
    virtual ~AgentStateStore() = default;

    // nullopt when the agent has no usable prior state
    virtual std::optional<AgentState> load(const AgentId& agent_id) = 0;

    virtual Result<void, Error> save(const AgentId& agent_id, const AgentState& state) = 0;
};

// Process-local store holding deep copies
class MemoryStateStore : public AgentStateStore {
public:
    std::optional<AgentState> load(const AgentId& agent_id) override;
    Result<void, Error> save(const AgentId& agent_id, const AgentState& state) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<AgentId, AgentState> states_;
};

// One `<encoded agent_id>.jsonl` file per agent: a header line followed by the
// serialized state. Writes go to a temp file that is renamed into place.
// Unreadable or corrupt files load as "no prior state" and are logged.
class FileStateStore : public AgentStateStore {
public:
    explicit FileStateStore(fs::path directory);

    std::optional<AgentState> load(const AgentId& agent_id) override;
    Result<void, Error> save(const AgentId& agent_id, const AgentState& state) override;

    fs::path path_for(const AgentId& agent_id) const;
    const fs::path& directory() const { return directory_; }

private:
    fs::path directory_;
    std::mutex mutex_;
};

}  // namespace turnkit::memory
