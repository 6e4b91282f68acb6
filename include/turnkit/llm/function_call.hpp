#pragma once

#include "turnkit/core/result.hpp"
#include "turnkit/core/types.hpp"
#include "turnkit/parser/model_message.hpp"

namespace turnkit::llm {

using namespace turnkit::core;

// Turns a native function call into the equivalent tool_call decision.
// Arguments must be a JSON object (empty text counts as {}); anything else
// fails with LLMInvalidResponse naming the function.
Result<parser::ModelMessage, Error> normalize_function_call(const FunctionCallResult& result);

}  // namespace turnkit::llm
