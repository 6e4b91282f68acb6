#include "turnkit/reasoning/chain_of_thought.hpp"
#include "turnkit/parser/json_repair.hpp"
#include "turnkit/parser/response_parser.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace turnkit::reasoning {

namespace {

constexpr const char* kReplyFormat =
    "Respond with a single JSON object:\n"
    "{\n"
    "  \"reasoning\": \"your reasoning for this phase\",\n"
    "  \"confidence\": 0.0 to 1.0,\n"
    "  \"insights\": [\"short insight\", \"...\"]";

std::string elapsed_since(std::chrono::steady_clock::time_point start, Duration& out) {
    out = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    return std::to_string(out.count()) + "ms";
}

}  // namespace

ChainOfThoughtEngine::ChainOfThoughtEngine(llm::LLMCaller& caller, const ReasoningConfig& config)
    : caller_(caller)
    , config_(config)
{
}

const std::vector<ChainOfThoughtEngine::Phase>& ChainOfThoughtEngine::phases() {
    static const std::vector<Phase> kPhases = {
        {"analysis", ReasoningStepType::Analysis,
         "Analyze the goal. Identify what is being asked, the constraints, and what information is missing.",
         false},
        {"planning", ReasoningStepType::Planning,
         "Using the analysis, outline the steps needed to reach the goal and which tools each step needs.",
         false},
        {"strategy", ReasoningStepType::Decision,
         "Choose the most promising approach from the plan and state the first concrete action to take.",
         false},
        {"evaluation", ReasoningStepType::Evaluation,
         "Evaluate the chosen strategy against the goal. Point out risks and state your conclusion.",
         true},
    };
    return kPhases;
}

std::string ChainOfThoughtEngine::build_phase_prompt(const Phase& phase,
                                                     const std::string& goal,
                                                     const std::string& context,
                                                     const std::vector<tools::ToolSpec>& tools,
                                                     const ReasoningChain& chain) {
    std::string prompt = "You are reasoning step by step about how to achieve a goal.\n\n";
    prompt += "GOAL: " + goal + "\n";
    prompt += "CONTEXT: " + (context.empty() ? std::string("(none)") : context) + "\n\n";
    prompt += "AVAILABLE TOOLS:\n" + describe_tools(tools) + "\n\n";

    if (!chain.steps().empty()) {
        prompt += "PREVIOUS STEPS:\n";
        for (const auto& step : chain.steps()) {
            prompt += fmt::format("{}. [{}] {}\n",
                                  step.step_number, step_type_to_string(step.type), step.content);
        }
        prompt += "\n";
    }

    prompt += "PHASE: " + phase.name + "\n";
    prompt += phase.instruction + "\n\n";
    prompt += kReplyFormat;
    if (phase.wants_conclusion) {
        prompt += ",\n  \"conclusion\": \"the final conclusion of your reasoning\"";
    }
    prompt += "\n}";
    return prompt;
}

std::string ChainOfThoughtEngine::build_validation_prompt(const ReasoningChain& chain,
                                                          const std::string& conclusion) {
    std::string prompt = "Review the following reasoning chain for logical errors or gaps.\n\n";
    prompt += "GOAL: " + chain.goal() + "\n\n";
    for (const auto& step : chain.steps()) {
        prompt += fmt::format("Step {} ({}, confidence {:.2f}): {}\n",
                              step.step_number, step_type_to_string(step.type),
                              step.confidence, step.content);
    }
    prompt += "\nCONCLUSION: " + conclusion + "\n\n";
    prompt += "Respond with a single JSON object:\n"
              "{\n"
              "  \"is_valid\": true or false,\n"
              "  \"error\": \"what is wrong, if anything\"\n"
              "}";
    return prompt;
}

ChainOfThoughtEngine::Validation ChainOfThoughtEngine::validate(const ReasoningChain& chain,
                                                                const std::string& conclusion,
                                                                const CancellationToken& cancellation) {
    Validation validation;

    auto response = caller_.complete({Message::user(build_validation_prompt(chain, conclusion))}, cancellation);
    if (response.is_err()) {
        spdlog::warn("Reasoning validation call failed, accepting chain: {}", response.error().full_message());
        return validation;
    }

    auto parsed = parser::parse_json_lenient(response.value().content);
    if (parsed.is_err() || !parsed.value().is_object()) {
        spdlog::warn("Reasoning validation reply was not JSON, accepting chain");
        return validation;
    }

    const Json& j = parsed.value();
    if (j.contains("is_valid") && j["is_valid"].is_boolean()) {
        validation.is_valid = j["is_valid"].get<bool>();
    }
    if (j.contains("error") && j["error"].is_string()) {
        validation.error = j["error"].get<std::string>();
    }
    return validation;
}

ReasoningResult ChainOfThoughtEngine::reason(const std::string& goal,
                                             const std::string& context,
                                             const std::vector<tools::ToolSpec>& tools,
                                             const CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();
    ReasoningChain chain(goal);

    auto fail = [&](std::string message) {
        ReasoningResult result = ReasoningResult::failure(std::move(message));
        spdlog::warn("Chain of thought failed after {}: {}", elapsed_since(start, result.elapsed), *result.error);
        result.chain = chain;
        return result;
    };

    spdlog::info("Starting chain of thought for goal: {}", goal);

    std::string conclusion;
    double confidence = 0.0;
    int total_insights = 0;

    try {
        for (const auto& phase : phases()) {
            if (static_cast<int>(chain.steps().size()) >= config_.max_reasoning_steps) {
                spdlog::debug("Reasoning step ceiling ({}) reached", config_.max_reasoning_steps);
                break;
            }
            if (cancellation.is_cancelled()) {
                return fail("Reasoning cancelled");
            }

            auto prompt = build_phase_prompt(phase, goal, context, tools, chain);
            auto response = caller_.complete({Message::user(std::move(prompt))}, cancellation);
            if (response.is_err()) {
                return fail("Reasoning phase '" + phase.name + "' failed: " + response.error().message);
            }

            const auto& content = response.value().content;
            if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
                return fail("Empty model response in reasoning phase '" + phase.name + "'");
            }

            auto parsed = parser::parse_chain_of_thought(content);
            total_insights += static_cast<int>(parsed.insights.size());

            const auto& step = chain.add_step(parsed.reasoning, phase.type, parsed.confidence,
                                              std::move(parsed.insights));
            spdlog::debug("Reasoning step {} ({}) confidence {:.2f}",
                          step.step_number, phase.name, step.confidence);

            conclusion = parsed.conclusion.value_or(step.content);
            confidence = step.confidence;

            if (phase.wants_conclusion && parsed.conclusion) {
                break;
            }
        }

        if (chain.steps().empty()) {
            return fail("No reasoning steps were produced");
        }

        if (config_.enable_validation) {
            auto validation = validate(chain, conclusion, cancellation);
            if (!validation.is_valid) {
                spdlog::warn("Reasoning chain flagged invalid: {}", validation.error);
                if (confidence < config_.min_confidence) {
                    return fail(fmt::format("Reasoning confidence {:.2f} below threshold {:.2f}",
                                            confidence, config_.min_confidence));
                }
            }
        }
    } catch (const std::exception& e) {
        return fail(std::string("Chain of thought error: ") + e.what());
    }

    chain.complete(conclusion, confidence);

    ReasoningResult result;
    result.success = true;
    result.conclusion = conclusion;
    result.confidence = confidence;
    result.metadata = Json{
        {"steps_completed", chain.steps().size()},
        {"total_insights", total_insights},
        {"reasoning_type", "ChainOfThought"}
    };
    result.chain = std::move(chain);

    spdlog::info("Chain of thought completed in {} with confidence {:.2f}",
                 elapsed_since(start, result.elapsed), confidence);
    return result;
}

}  // namespace turnkit::reasoning
