#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnkit::core {

// Error codes organized by category
enum class ErrorCode {
    // Success
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 2,
    NotFound = 3,
    AlreadyExists = 4,
    Timeout = 6,
    Cancelled = 7,
    InternalError = 9,
    InvalidState = 10,

    // State store errors (100-199)
    StateLoadFailed = 100,
    StateSaveFailed = 101,
    StateCorrupted = 102,

    // Model errors (200-299)
    LLMConnectionFailed = 200,
    LLMInvalidResponse = 203,
    LLMTimeout = 208,
    ResponseValidationFailed = 209,

    // Tool errors (300-399)
    ToolNotFound = 300,
    ToolExecutionFailed = 301,
    ToolValidationFailed = 302,
    ToolTimeout = 303,
    ToolDisabled = 307,

    // Reasoning errors (400-499)
    TreeRootExists = 400,
    TreeDepthExceeded = 401,
    TreeCapacityExceeded = 402,
    ReasoningFailed = 403,
    ReasoningLowConfidence = 404,

    // Run loop errors (500-599)
    MaxTurnsExceeded = 500,
    LoopDetected = 501,

    // Configuration errors (600-699)
    ConfigNotFound = 600,
    ConfigParseFailed = 601,
    ConfigValidationFailed = 602,

    // File system errors (700-799)
    FileReadFailed = 701,
    FileWriteFailed = 702,
};

// Get human-readable message for error code
inline std::string_view error_code_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::Timeout: return "Deadline exceeded";
        case ErrorCode::Cancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::InvalidState: return "Invalid state";

        case ErrorCode::StateLoadFailed: return "Failed to load agent state";
        case ErrorCode::StateSaveFailed: return "Failed to save agent state";
        case ErrorCode::StateCorrupted: return "Agent state corrupted";

        case ErrorCode::LLMConnectionFailed: return "Model call failed";
        case ErrorCode::LLMInvalidResponse: return "Invalid response from model";
        case ErrorCode::LLMTimeout: return "Model call deadline exceeded";
        case ErrorCode::ResponseValidationFailed: return "Model response failed validation";

        case ErrorCode::ToolNotFound: return "Tool not found";
        case ErrorCode::ToolExecutionFailed: return "Tool execution failed";
        case ErrorCode::ToolValidationFailed: return "Tool parameter validation failed";
        case ErrorCode::ToolTimeout: return "Tool execution timed out";
        case ErrorCode::ToolDisabled: return "Tool is disabled";

        case ErrorCode::TreeRootExists: return "Tree already has a root";
        case ErrorCode::TreeDepthExceeded: return "Tree depth limit reached";
        case ErrorCode::TreeCapacityExceeded: return "Tree node limit reached";
        case ErrorCode::ReasoningFailed: return "Reasoning failed";
        case ErrorCode::ReasoningLowConfidence: return "Reasoning confidence below threshold";

        case ErrorCode::MaxTurnsExceeded: return "Turn ceiling reached";
        case ErrorCode::LoopDetected: return "Repeated failing tool call detected";

        case ErrorCode::ConfigNotFound: return "Configuration file not found";
        case ErrorCode::ConfigParseFailed: return "Failed to parse configuration";
        case ErrorCode::ConfigValidationFailed: return "Configuration validation failed";

        case ErrorCode::FileReadFailed: return "Failed to read file";
        case ErrorCode::FileWriteFailed: return "Failed to write file";
    }
    return "Unknown error code";
}

// Check if error is retriable by the model on a later turn
inline bool is_retriable(ErrorCode code) {
    switch (code) {
        case ErrorCode::LLMConnectionFailed:
        case ErrorCode::LLMInvalidResponse:
        case ErrorCode::LLMTimeout:
        case ErrorCode::ResponseValidationFailed:
        case ErrorCode::ToolNotFound:
        case ErrorCode::ToolExecutionFailed:
        case ErrorCode::ToolValidationFailed:
        case ErrorCode::ToolTimeout:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

// Check if error ends a run
inline bool is_fatal(ErrorCode code) {
    switch (code) {
        case ErrorCode::MaxTurnsExceeded:
        case ErrorCode::LoopDetected:
        case ErrorCode::Cancelled:
        case ErrorCode::ConfigParseFailed:
        case ErrorCode::ConfigValidationFailed:
            return true;
        default:
            return false;
    }
}

// Error structure with context
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<std::string> context;  // Offending field, tool name, node id
    std::optional<std::string> source;   // Component that raised it

    // Populated for ToolValidationFailed
    std::vector<std::string> missing_fields;
    std::vector<std::string> invalid_fields;

    Error() : code(ErrorCode::Unknown) {}

    Error(ErrorCode c) : code(c), message(std::string(error_code_message(c))) {}

    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    Error(ErrorCode c, std::string msg, std::string ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    static Error from_code(ErrorCode code, std::string context) {
        Error e{code};
        e.context = std::move(context);
        return e;
    }

    static Error from_exception(const std::exception& e) {
        return Error{ErrorCode::InternalError, e.what()};
    }

    Error& with_source(std::string src) {
        source = std::move(src);
        return *this;
    }

    bool is_retriable() const { return turnkit::core::is_retriable(code); }
    bool is_fatal() const { return turnkit::core::is_fatal(code); }
    bool is_ok() const { return code == ErrorCode::Ok; }

    std::string full_message() const {
        std::string result = message;
        if (context) {
            result += " [" + *context + "]";
        }
        if (source) {
            result += " at " + *source;
        }
        return result;
    }

    // For logging
    std::string to_string() const {
        return "[" + std::to_string(static_cast<int>(code)) + "] " + full_message();
    }
};

}  // namespace turnkit::core
