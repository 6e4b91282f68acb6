#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace turnkit::core {

// 64-bit FNV-1a
uint64_t fnv1a64(std::string_view text);

// Compact JSON with object keys sorted at every level
std::string canonical_json(const Json& value);

// Idempotency key for a tool invocation, 16 hex digits
std::string fingerprint_tool_call(const std::string& tool, const Json& params);

// Deterministic turn id: same (agent, index) always yields the same id
std::string make_turn_id(const std::string& agent_id, int index);

}  // namespace turnkit::core
