#include "turnkit/tools/tool_registry.hpp"

#include <algorithm>

namespace turnkit::tools {

Result<void, Error> ToolRegistry::register_tool(const ToolSpec& spec, ToolHandler handler) {
    if (spec.name.empty()) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Tool name must not be empty");
    }
    if (!handler) {
        return Result<void, Error>::err(ErrorCode::InvalidArgument, "Tool handler must be set", spec.name);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (tools_.count(spec.name)) {
        return Result<void, Error>::err(
            ErrorCode::AlreadyExists,
            "Tool already registered",
            spec.name
        );
    }

    tools_[spec.name] = RegisteredTool{spec, std::move(handler), true};
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::unregister_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!tools_.erase(id)) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }
    return Result<void, Error>::ok();
}

bool ToolRegistry::has_tool(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(id) > 0;
}

Result<RegisteredTool, Error> ToolRegistry::resolve(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<RegisteredTool, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }
    if (!it->second.enabled) {
        return Result<RegisteredTool, Error>::err(ErrorCode::ToolDisabled, "Tool is disabled", id);
    }
    return Result<RegisteredTool, Error>::ok(it->second);
}

std::optional<ToolSpec> ToolRegistry::get_spec(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.spec;
}

std::vector<ToolSpec> ToolRegistry::get_enabled_specs() const {
    std::vector<ToolSpec> specs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, tool] : tools_) {
            if (tool.enabled) {
                specs.push_back(tool.spec);
            }
        }
    }

    std::sort(specs.begin(), specs.end(),
        [](const ToolSpec& a, const ToolSpec& b) { return a.name < b.name; });
    return specs;
}

Json ToolRegistry::to_function_specs() const {
    Json functions = Json::array();
    for (const auto& spec : get_enabled_specs()) {
        functions.push_back(spec.to_function_spec());
    }
    return functions;
}

Result<void, Error> ToolRegistry::enable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = true;
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::disable_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }

    it->second.enabled = false;
    return Result<void, Error>::ok();
}

bool ToolRegistry::is_enabled(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    return it != tools_.end() && it->second.enabled;
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

Result<void, Error> ToolRegistry::validate_args(const ToolSpec& spec, const Json& params) {
    Error error{ErrorCode::ToolValidationFailed, "Invalid parameters for tool '" + spec.name + "'", spec.name};

    if (!params.is_object()) {
        error.invalid_fields.push_back("params: expected an object");
        return Result<void, Error>::err(std::move(error));
    }

    for (const auto& param : spec.parameters) {
        if (!params.contains(param.name) || params[param.name].is_null()) {
            if (param.required) {
                error.missing_fields.push_back(param.name);
            }
            continue;
        }

        const auto& value = params[param.name];
        bool valid = true;

        switch (param.type) {
            case ParamType::String:
                valid = value.is_string();
                break;
            case ParamType::Integer:
                valid = value.is_number_integer();
                break;
            case ParamType::Number:
                valid = value.is_number();
                break;
            case ParamType::Boolean:
                valid = value.is_boolean();
                break;
            case ParamType::Array:
                valid = value.is_array();
                break;
            case ParamType::Object:
                valid = value.is_object();
                break;
        }

        if (!valid) {
            error.invalid_fields.push_back(
                param.name + ": expected " + std::string(param_type_to_string(param.type)));
            continue;
        }

        if (param.enum_values && value.is_string()) {
            const auto& allowed = *param.enum_values;
            if (std::find(allowed.begin(), allowed.end(), value.get<std::string>()) == allowed.end()) {
                error.invalid_fields.push_back(param.name + ": value not in allowed set");
            }
        }
    }

    if (error.missing_fields.empty() && error.invalid_fields.empty()) {
        return Result<void, Error>::ok();
    }

    if (!error.missing_fields.empty()) {
        error.message += "; missing:";
        for (const auto& f : error.missing_fields) error.message += " " + f;
    }
    if (!error.invalid_fields.empty()) {
        error.message += "; invalid:";
        for (const auto& f : error.invalid_fields) error.message += " " + f + ";";
    }
    return Result<void, Error>::err(std::move(error));
}

}  // namespace turnkit::tools
