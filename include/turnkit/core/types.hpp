#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace turnkit::core {

// JSON alias
using Json = nlohmann::json;

// Time types
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Common type aliases
using AgentId = std::string;
using TurnId = std::string;
using ToolId = std::string;
using NodeId = std::string;

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint{std::chrono::milliseconds{ms}};
}

// Message roles
enum class Role {
    System,
    User,
    Assistant
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "unknown";
}

inline Role role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "assistant") return Role::Assistant;
    return Role::User;
}

// Prompt message sent to the model client
struct Message {
    Role role = Role::User;
    std::string content;

    static Message user(std::string content) {
        return Message{Role::User, std::move(content)};
    }

    static Message assistant(std::string content) {
        return Message{Role::Assistant, std::move(content)};
    }

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    Json to_json() const {
        return Json{
            {"role", std::string(role_to_string(role))},
            {"content", content}
        };
    }
};

// Token usage
struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;

    int total() const { return input_tokens + output_tokens; }

    Json to_json() const {
        return Json{
            {"input_tokens", input_tokens},
            {"output_tokens", output_tokens},
            {"total_tokens", total()}
        };
    }
};

// Native function call returned alongside a plain completion
struct FunctionCall {
    std::string name;
    std::string arguments_json;
};

// Plain completion result
struct LLMResponse {
    std::string content;
    TokenUsage usage;
    std::optional<FunctionCall> function_call;
    Duration latency{0};
};

// Structured-calling completion result
struct FunctionCallResult {
    bool has_function_call = false;
    std::string function_name;
    std::string arguments_json;
    std::string assistant_content;
};

}  // namespace turnkit::core
