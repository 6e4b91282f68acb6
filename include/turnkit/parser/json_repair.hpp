#pragma once

#include "turnkit/core/result.hpp"
#include "turnkit/core/types.hpp"

#include <string>
#include <string_view>

namespace turnkit::parser {

using namespace turnkit::core;

// Best-effort normalizer for model text that is meant to be one JSON object.
// This is a fixed sequence of textual heuristics, not a JSON grammar. Every
// stage leaves well-formed JSON byte-identical, so the pipeline is idempotent
// on clean input. Known transformations are pinned in test_json_repair.cpp.

// 1. Interior of the first ``` fenced block that is not part of a JSON string
std::string strip_code_fence(std::string_view text);

// 2. First balanced top-level object; trailing objects or prose are dropped
std::string extract_first_object(std::string_view text);

// 3. Append missing closers and drop unmatched ones; closes an open string
std::string balance_brackets(std::string_view text);

// 4. Remove commas directly before '}' or ']'
std::string strip_trailing_commas(std::string_view text);

// 5. Rewrite single-quoted keys/values as double-quoted strings
std::string normalize_single_quotes(std::string_view text);

// 6. Escape raw newline, carriage return and tab inside strings
std::string escape_control_chars(std::string_view text);

// All stages in order
std::string repair_json(std::string_view text);

// Repair then parse; LLMInvalidResponse when the result is still not JSON
Result<Json, Error> parse_json_lenient(std::string_view text);

}  // namespace turnkit::parser
