#include "turnkit/agent/idempotency_cache.hpp"

#include <spdlog/spdlog.h>

namespace turnkit::agent {

IdempotencyCache::IdempotencyCache(Duration default_ttl)
    : default_ttl_(default_ttl)
{
}

std::optional<CachedInvocation> IdempotencyCache::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (Clock::now() >= it->second.expires_at) {
        spdlog::debug("Idempotency entry {} expired", key);
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

CachedInvocation IdempotencyCache::insert_if_absent(const std::string& key,
                                                    const TurnId& turn_id,
                                                    const ToolExecutionResult& result,
                                                    std::optional<Duration> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = Clock::now();
    auto it = entries_.find(key);
    if (it != entries_.end() && now < it->second.expires_at) {
        return it->second;
    }

    CachedInvocation entry{turn_id, result, now + ttl.value_or(default_ttl_)};
    entries_[key] = entry;
    return entry;
}

bool IdempotencyCache::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

void IdempotencyCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t IdempotencyCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace turnkit::agent
