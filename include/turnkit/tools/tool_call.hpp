#pragma once

#include "turnkit/core/types.hpp"

#include <optional>
#include <string>

namespace turnkit::tools {

using namespace turnkit::core;

// A tool invocation requested by the model
struct ToolCallRequest {
    ToolId tool;
    Json params = Json::object();
    TurnId turn_id;

    Json to_json() const {
        return Json{
            {"tool", tool},
            {"params", params},
            {"turn_id", turn_id}
        };
    }

    static ToolCallRequest from_json(const Json& j) {
        return ToolCallRequest{
            .tool = j.value("tool", ""),
            .params = j.value("params", Json::object()),
            .turn_id = j.value("turn_id", "")
        };
    }
};

// Outcome of one invocation; never mutated after it is stored in a turn
struct ToolExecutionResult {
    bool success = false;
    Json output;
    std::optional<std::string> error;
    ToolId tool;
    Json params = Json::object();
    TurnId turn_id;
    Duration execution_time{0};
    TimePoint created_at;

    Json to_json() const {
        Json j{
            {"success", success},
            {"output", output},
            {"tool", tool},
            {"params", params},
            {"turn_id", turn_id},
            {"execution_time_ms", execution_time.count()},
            {"created_at", to_epoch_ms(created_at)}
        };
        if (error) {
            j["error"] = *error;
        }
        return j;
    }

    static ToolExecutionResult from_json(const Json& j) {
        ToolExecutionResult r;
        r.success = j.value("success", false);
        r.output = j.contains("output") ? j["output"] : Json();
        if (j.contains("error") && j["error"].is_string()) {
            r.error = j["error"].get<std::string>();
        }
        r.tool = j.value("tool", "");
        r.params = j.value("params", Json::object());
        r.turn_id = j.value("turn_id", "");
        r.execution_time = Duration{j.value("execution_time_ms", int64_t{0})};
        r.created_at = from_epoch_ms(j.value("created_at", int64_t{0}));
        return r;
    }
};

}  // namespace turnkit::tools
