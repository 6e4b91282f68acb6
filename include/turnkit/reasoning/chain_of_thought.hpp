#pragma once

#include "turnkit/core/config.hpp"
#include "turnkit/llm/llm_caller.hpp"
#include "reasoning_engine.hpp"

#include <optional>
#include <string>
#include <vector>

namespace turnkit::reasoning {

// Linear deliberation: one model call per fixed phase
// (analysis, planning, strategy, evaluation), each appended to a chain.
class ChainOfThoughtEngine : public ReasoningEngine {
public:
    ChainOfThoughtEngine(llm::LLMCaller& caller, const ReasoningConfig& config);

    ReasoningMode mode() const override { return ReasoningMode::ChainOfThought; }

    ReasoningResult reason(const std::string& goal,
                           const std::string& context,
                           const std::vector<tools::ToolSpec>& tools,
                           const CancellationToken& cancellation) override;

    struct Phase {
        std::string name;
        ReasoningStepType type;
        std::string instruction;
        bool wants_conclusion = false;
    };

    // The fixed phase sequence, in call order
    static const std::vector<Phase>& phases();

    // Prompt for one phase given the steps produced so far
    static std::string build_phase_prompt(const Phase& phase,
                                          const std::string& goal,
                                          const std::string& context,
                                          const std::vector<tools::ToolSpec>& tools,
                                          const ReasoningChain& chain);

    static std::string build_validation_prompt(const ReasoningChain& chain,
                                               const std::string& conclusion);

private:
    struct Validation {
        bool is_valid = true;
        std::string error;
    };

    // A failed validation call is reported as valid
    Validation validate(const ReasoningChain& chain,
                        const std::string& conclusion,
                        const CancellationToken& cancellation);

    llm::LLMCaller& caller_;
    ReasoningConfig config_;
};

}  // namespace turnkit::reasoning
