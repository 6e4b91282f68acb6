#include "turnkit/llm/function_call.hpp"

namespace turnkit::llm {

namespace {

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

}  // namespace

Result<parser::ModelMessage, Error> normalize_function_call(const FunctionCallResult& result) {
    if (!result.has_function_call || is_blank(result.function_name)) {
        return Result<parser::ModelMessage, Error>::err(
            ErrorCode::InvalidArgument, "Response carries no function call");
    }

    const auto name = trim(result.function_name);

    Json params = Json::object();
    if (!is_blank(result.arguments_json)) {
        try {
            params = Json::parse(result.arguments_json);
        } catch (const Json::parse_error& e) {
            return Result<parser::ModelMessage, Error>::err(
                ErrorCode::LLMInvalidResponse,
                std::string("Failed to parse function arguments: ") + e.what(),
                name
            );
        }
        if (params.is_null()) {
            params = Json::object();
        }
        if (!params.is_object()) {
            return Result<parser::ModelMessage, Error>::err(
                ErrorCode::LLMInvalidResponse,
                "Failed to parse function arguments: expected a JSON object",
                name
            );
        }
    }

    parser::ModelMessage message;
    message.thoughts = is_blank(result.assistant_content)
        ? "Calling " + name + " to advance the plan."
        : trim(result.assistant_content);
    message.action = parser::AgentAction::ToolCall;
    message.action_input.tool = name;
    message.action_input.params = std::move(params);
    message.action_input.summary = "Execute " + name + " and continue with the results.";
    return Result<parser::ModelMessage, Error>::ok(std::move(message));
}

}  // namespace turnkit::llm
