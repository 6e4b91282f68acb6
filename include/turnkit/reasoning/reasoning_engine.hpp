#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/tools/tool_spec.hpp"
#include "reasoning_types.hpp"

#include <string>
#include <vector>

namespace turnkit::reasoning {

using namespace turnkit::core;

// Multi-step deliberation run before an action is committed.
// Implementations never throw; every failure comes back as
// ReasoningResult{success = false, error = message}.
class ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;

    virtual ReasoningMode mode() const = 0;

    virtual ReasoningResult reason(const std::string& goal,
                                   const std::string& context,
                                   const std::vector<tools::ToolSpec>& tools,
                                   const CancellationToken& cancellation) = 0;
};

// "- name: description" per tool, for prompts
inline std::string describe_tools(const std::vector<tools::ToolSpec>& tools) {
    if (tools.empty()) {
        return "(none)";
    }
    std::string out;
    for (const auto& tool : tools) {
        if (!out.empty()) out += "\n";
        out += "- " + tool.name;
        if (!tool.description.empty()) {
            out += ": " + tool.description;
        }
    }
    return out;
}

}  // namespace turnkit::reasoning
