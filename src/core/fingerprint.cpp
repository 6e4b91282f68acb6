#include "turnkit/core/fingerprint.hpp"

#include <spdlog/fmt/fmt.h>

namespace turnkit::core {

uint64_t fnv1a64(std::string_view text) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= static_cast<uint64_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string canonical_json(const Json& value) {
    // Json objects are backed by std::map, so dump() already emits keys in
    // sorted order at every nesting level regardless of insertion order.
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string fingerprint_tool_call(const std::string& tool, const Json& params) {
    std::string material = tool;
    material += '|';
    material += canonical_json(params.is_null() ? Json::object() : params);
    return fmt::format("{:016x}", fnv1a64(material));
}

std::string make_turn_id(const std::string& agent_id, int index) {
    return fmt::format("turn_{}_{:08x}", index,
                       static_cast<uint32_t>(fnv1a64(agent_id) & 0xffffffffULL));
}

}  // namespace turnkit::core
