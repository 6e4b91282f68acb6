#pragma once

#include "turnkit/core/result.hpp"
#include "tool_spec.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace turnkit::tools {

using namespace turnkit::core;

// Tool registration entry
struct RegisteredTool {
    ToolSpec spec;
    ToolHandler handler;
    bool enabled = true;
};

// Name -> tool lookup. Names are matched exactly, case included.
class ToolRegistry {
public:
    ToolRegistry() = default;

    Result<void, Error> register_tool(const ToolSpec& spec, ToolHandler handler);
    Result<void, Error> unregister_tool(const ToolId& id);

    bool has_tool(const ToolId& id) const;

    // Copy of an enabled tool; ToolNotFound or ToolDisabled otherwise
    Result<RegisteredTool, Error> resolve(const ToolId& id) const;

    std::optional<ToolSpec> get_spec(const ToolId& id) const;

    // Enabled specs sorted by name
    std::vector<ToolSpec> get_enabled_specs() const;

    // Function declarations for structured calling
    Json to_function_specs() const;

    Result<void, Error> enable_tool(const ToolId& id);
    Result<void, Error> disable_tool(const ToolId& id);
    bool is_enabled(const ToolId& id) const;

    size_t size() const;

    // Checks params against the tool's ToolSpec and reports every missing or invalid
    // field at once (ToolValidationFailed)
    static Result<void, Error> validate_args(const ToolSpec& spec, const Json& params);

private:
    mutable std::mutex mutex_;
    std::unordered_map<ToolId, RegisteredTool> tools_;
};

}  // namespace turnkit::tools
