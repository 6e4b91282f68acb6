#pragma once

#include "turnkit/core/config.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/reasoning/reasoning_types.hpp"
#include "model_message.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnkit::parser {

using namespace turnkit::core;

// Length caps for required text fields
struct ParseLimits {
    size_t max_thoughts_length = 20000;
    size_t max_summary_length = 40000;
    size_t max_final_length = 50000;

    static ParseLimits from_config(const AgentConfig& config);
};

// Repair then validate a model decision. Required-field violations fail with
// ResponseValidationFailed and the field name as context; unrepairable text
// fails with LLMInvalidResponse.
Result<ModelMessage, Error> parse_strict(std::string_view text, const ParseLimits& limits = {});

// Validate an already-parsed object
Result<ModelMessage, Error> validate_model_message(const Json& j, const ParseLimits& limits = {});

// One deliberation phase. Text that is not JSON becomes the reasoning verbatim.
struct ChainOfThoughtResponse {
    std::string reasoning;
    double confidence = 0.5;
    std::vector<std::string> insights;
    std::optional<std::string> conclusion;
};

ChainOfThoughtResponse parse_chain_of_thought(std::string_view text);

// Candidate thought proposed by the model
struct CandidateThought {
    std::string thought;
    reasoning::ThoughtType type = reasoning::ThoughtType::Hypothesis;
    std::optional<double> estimated_score;
};

// Any of the tree-search reply shapes: {thought}, {children:[...]},
// {score, reasoning} or {conclusion}
struct TreeOfThoughtsResponse {
    std::vector<CandidateThought> thoughts;
    std::optional<double> score;
    std::string reasoning;
    std::optional<std::string> conclusion;
};

Result<TreeOfThoughtsResponse, Error> parse_tree_of_thoughts(std::string_view text);

// Truncate to at most max_bytes without splitting a UTF-8 sequence
std::string truncate_utf8(std::string_view text, size_t max_bytes);

}  // namespace turnkit::parser
