#include "turnkit/parser/response_parser.hpp"
#include "turnkit/parser/json_repair.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace turnkit::parser {

namespace {

Result<ModelMessage, Error> invalid_field(const std::string& field, const std::string& message) {
    return Result<ModelMessage, Error>::err(ErrorCode::ResponseValidationFailed, message, field);
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trimmed(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

double clamp_unit(double value) {
    if (std::isnan(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

// Optional status string: truncated when present, dropped when mistyped
std::optional<std::string> optional_text(const Json& j, const char* key, size_t cap) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    return truncate_utf8(j[key].get<std::string>(), cap);
}

}  // namespace

ParseLimits ParseLimits::from_config(const AgentConfig& config) {
    return ParseLimits{
        .max_thoughts_length = static_cast<size_t>(config.max_thoughts_length),
        .max_summary_length = static_cast<size_t>(config.max_summary_length),
        .max_final_length = static_cast<size_t>(config.max_final_length)
    };
}

std::string truncate_utf8(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return std::string(text);

    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(text.substr(0, cut));
}

Result<ModelMessage, Error> validate_model_message(const Json& j, const ParseLimits& limits) {
    if (!j.is_object()) {
        return invalid_field("root", "Response is not a JSON object");
    }

    ModelMessage msg;

    // thoughts
    if (!j.contains("thoughts") || !j["thoughts"].is_string()) {
        return invalid_field("thoughts", "Missing required string field 'thoughts'");
    }
    msg.thoughts = j["thoughts"].get<std::string>();
    if (is_blank(msg.thoughts)) {
        return invalid_field("thoughts", "Field 'thoughts' must not be empty");
    }
    if (msg.thoughts.size() > limits.max_thoughts_length) {
        return invalid_field("thoughts", "Field 'thoughts' exceeds " +
                             std::to_string(limits.max_thoughts_length) + " characters");
    }

    // action
    if (!j.contains("action") || !j["action"].is_string()) {
        return invalid_field("action", "Missing required string field 'action'");
    }
    auto action_name = j["action"].get<std::string>();
    auto action = action_from_string(trimmed(action_name));
    if (!action) {
        return invalid_field("action", "Unknown action '" + action_name +
                             "', expected plan, tool_call, finish or retry");
    }
    msg.action = *action;

    // action_input
    if (!j.contains("action_input") || !j["action_input"].is_object()) {
        return invalid_field("action_input", "Missing required object field 'action_input'");
    }
    const Json& input = j["action_input"];

    if (input.contains("summary") && input["summary"].is_string()) {
        auto summary = input["summary"].get<std::string>();
        if (summary.size() > limits.max_summary_length) {
            return invalid_field("summary", "Field 'summary' exceeds " +
                                 std::to_string(limits.max_summary_length) + " characters");
        }
        msg.action_input.summary = std::move(summary);
    }

    switch (msg.action) {
        case AgentAction::ToolCall: {
            if (!input.contains("tool") || !input["tool"].is_string() ||
                is_blank(input["tool"].get<std::string>())) {
                return invalid_field("tool", "Action 'tool_call' requires a non-empty 'tool'");
            }
            msg.action_input.tool = trimmed(input["tool"].get<std::string>());

            if (input.contains("params") && !input["params"].is_null()) {
                if (!input["params"].is_object()) {
                    return invalid_field("params", "Field 'params' must be an object");
                }
                msg.action_input.params = input["params"];
            }
            break;
        }
        case AgentAction::Finish: {
            if (!input.contains("final") || !input["final"].is_string()) {
                return invalid_field("final", "Action 'finish' requires a string 'final'");
            }
            auto final_text = input["final"].get<std::string>();
            if (final_text.size() > limits.max_final_length) {
                return invalid_field("final", "Field 'final' exceeds " +
                                     std::to_string(limits.max_final_length) + " characters");
            }
            msg.action_input.final_text = std::move(final_text);
            break;
        }
        case AgentAction::Plan:
        case AgentAction::Retry:
            break;
    }

    // Optional status fields never fail the parse
    msg.status_title = optional_text(j, "status_title", kMaxStatusTitleLength);
    msg.status_details = optional_text(j, "status_details", kMaxStatusDetailsLength);
    msg.next_step_hint = optional_text(j, "next_step_hint", kMaxNextStepHintLength);

    if (j.contains("progress_pct") && j["progress_pct"].is_number()) {
        double pct = j["progress_pct"].get<double>();
        if (pct >= 0.0 && pct <= 100.0) {
            msg.progress_pct = static_cast<int>(pct);
        }
    }

    return Result<ModelMessage, Error>::ok(std::move(msg));
}

Result<ModelMessage, Error> parse_strict(std::string_view text, const ParseLimits& limits) {
    auto parsed = parse_json_lenient(text);
    if (parsed.is_err()) {
        return Result<ModelMessage, Error>::err(std::move(parsed).error());
    }
    return validate_model_message(parsed.value(), limits);
}

ChainOfThoughtResponse parse_chain_of_thought(std::string_view text) {
    ChainOfThoughtResponse response;

    auto parsed = parse_json_lenient(text);
    if (parsed.is_err() || !parsed.value().is_object()) {
        response.reasoning = trimmed(text);
        return response;
    }

    const Json& j = parsed.value();
    if (j.contains("reasoning") && j["reasoning"].is_string()) {
        response.reasoning = j["reasoning"].get<std::string>();
    } else {
        response.reasoning = trimmed(text);
    }
    if (j.contains("confidence") && j["confidence"].is_number()) {
        response.confidence = clamp_unit(j["confidence"].get<double>());
    }
    if (j.contains("insights") && j["insights"].is_array()) {
        for (const auto& insight : j["insights"]) {
            if (insight.is_string()) {
                response.insights.push_back(insight.get<std::string>());
            }
        }
    }
    if (j.contains("conclusion") && j["conclusion"].is_string() &&
        !is_blank(j["conclusion"].get<std::string>())) {
        response.conclusion = j["conclusion"].get<std::string>();
    }
    return response;
}

Result<TreeOfThoughtsResponse, Error> parse_tree_of_thoughts(std::string_view text) {
    auto parsed = parse_json_lenient(text);
    if (parsed.is_err()) {
        return Result<TreeOfThoughtsResponse, Error>::err(std::move(parsed).error());
    }

    const Json& j = parsed.value();
    if (!j.is_object()) {
        return Result<TreeOfThoughtsResponse, Error>::err(
            ErrorCode::LLMInvalidResponse, "Tree reply is not a JSON object");
    }

    auto candidate_from = [](const Json& c) -> std::optional<CandidateThought> {
        if (!c.is_object() || !c.contains("thought") || !c["thought"].is_string()) {
            return std::nullopt;
        }
        CandidateThought candidate;
        candidate.thought = c["thought"].get<std::string>();
        if (is_blank(candidate.thought)) return std::nullopt;
        if (c.contains("thought_type") && c["thought_type"].is_string()) {
            candidate.type = reasoning::thought_type_from_string(c["thought_type"].get<std::string>());
        }
        if (c.contains("estimated_score") && c["estimated_score"].is_number()) {
            candidate.estimated_score = clamp_unit(c["estimated_score"].get<double>());
        }
        return candidate;
    };

    TreeOfThoughtsResponse response;

    if (j.contains("children") && j["children"].is_array()) {
        for (const auto& child : j["children"]) {
            if (auto candidate = candidate_from(child)) {
                response.thoughts.push_back(std::move(*candidate));
            }
        }
    }
    if (auto candidate = candidate_from(j)) {
        response.thoughts.push_back(std::move(*candidate));
    }
    if (j.contains("score") && j["score"].is_number()) {
        response.score = clamp_unit(j["score"].get<double>());
    }
    if (j.contains("reasoning") && j["reasoning"].is_string()) {
        response.reasoning = j["reasoning"].get<std::string>();
    }
    if (j.contains("conclusion") && j["conclusion"].is_string()) {
        response.conclusion = j["conclusion"].get<std::string>();
    }

    return Result<TreeOfThoughtsResponse, Error>::ok(std::move(response));
}

}  // namespace turnkit::parser
