#include "turnkit/memory/state_store.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdio>
#include <fstream>

namespace turnkit::memory {

namespace {

// Percent-encodes every byte outside [A-Za-z0-9.-], '_' and '%' included, so
// distinct agent ids always map to distinct files inside the store directory.
// A leading '.' is encoded too, which rules out "." and "..".
std::string encode_file_name(const AgentId& agent_id) {
    if (agent_id.empty()) {
        return "%";
    }

    std::string name;
    name.reserve(agent_id.size());
    for (size_t i = 0; i < agent_id.size(); ++i) {
        const auto c = static_cast<unsigned char>(agent_id[i]);
        const bool safe = std::isalnum(c) || c == '-' || (c == '.' && i > 0);
        if (safe) {
            name += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            name += buf;
        }
    }
    return name;
}

}  // namespace

// MemoryStateStore
std::optional<AgentState> MemoryStateStore::load(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(agent_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<void, Error> MemoryStateStore::save(const AgentId& agent_id, const AgentState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[agent_id] = state;
    return Result<void, Error>::ok();
}

size_t MemoryStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

// FileStateStore
FileStateStore::FileStateStore(fs::path directory)
    : directory_(std::move(directory))
{
}

fs::path FileStateStore::path_for(const AgentId& agent_id) const {
    return directory_ / (encode_file_name(agent_id) + ".jsonl");
}

std::optional<AgentState> FileStateStore::load(const AgentId& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    fs::path path = path_for(agent_id);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open agent state file {}", path.string());
            return std::nullopt;
        }

        std::string header_line;
        std::string state_line;
        if (!std::getline(file, header_line) || !std::getline(file, state_line)) {
            spdlog::error("Agent state file {} is truncated", path.string());
            return std::nullopt;
        }

        Json header = Json::parse(header_line);
        AgentState state = AgentState::from_json(Json::parse(state_line));

        if (header.value("agent_id", "") != state.agent_id || state.agent_id != agent_id) {
            spdlog::error("Agent state file {} belongs to another agent", path.string());
            return std::nullopt;
        }

        return state;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load agent state from {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

Result<void, Error> FileStateStore::save(const AgentId& agent_id, const AgentState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    fs::path path = path_for(agent_id);
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    try {
        fs::create_directories(directory_);

        Json header{
            {"agent_id", state.agent_id},
            {"goal", state.goal},
            {"last_updated", to_epoch_ms(state.last_updated)}
        };

        {
            std::ofstream file(tmp_path, std::ios::trunc);
            if (!file) {
                return Result<void, Error>::err(
                    ErrorCode::StateSaveFailed,
                    "Failed to open file for writing",
                    tmp_path.string()
                );
            }

            file << header.dump() << '\n' << state.to_json().dump() << '\n';
            file.flush();
            if (!file) {
                return Result<void, Error>::err(
                    ErrorCode::StateSaveFailed,
                    "Failed to write agent state",
                    tmp_path.string()
                );
            }
        }

        fs::rename(tmp_path, path);
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return Result<void, Error>::err(
            ErrorCode::StateSaveFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace turnkit::memory
