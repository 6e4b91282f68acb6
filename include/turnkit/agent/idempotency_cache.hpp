#pragma once

#include "turnkit/core/types.hpp"
#include "turnkit/tools/tool_call.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace turnkit::agent {

using namespace turnkit::core;
using tools::ToolExecutionResult;

// A tool invocation that later identical calls may reuse
struct CachedInvocation {
    TurnId turn_id;
    ToolExecutionResult result;
    TimePoint expires_at;
};

// Fingerprint -> invocation map owned by one orchestrator. All access is
// serialized; expired entries are dropped when a lookup finds them.
class IdempotencyCache {
public:
    explicit IdempotencyCache(Duration default_ttl);

    std::optional<CachedInvocation> lookup(const std::string& key);

    // Stores the invocation unless a live entry already holds the key.
    // Returns whichever entry is stored afterwards.
    CachedInvocation insert_if_absent(const std::string& key,
                                      const TurnId& turn_id,
                                      const ToolExecutionResult& result,
                                      std::optional<Duration> ttl = std::nullopt);

    bool erase(const std::string& key);
    void clear();

    // Includes entries that have expired but were not looked up yet
    size_t size() const;

    Duration default_ttl() const { return default_ttl_; }

private:
    Duration default_ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CachedInvocation> entries_;
};

}  // namespace turnkit::agent
