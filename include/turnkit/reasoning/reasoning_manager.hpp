#pragma once

#include "turnkit/core/config.hpp"
#include "turnkit/llm/llm_caller.hpp"
#include "chain_of_thought.hpp"
#include "reasoning_engine.hpp"
#include "tree_of_thoughts.hpp"

#include <memory>
#include <string>
#include <vector>

namespace turnkit::reasoning {

// Dispatches to the configured engine. Hybrid runs the chain and the tree
// concurrently, each on its own engine, and merges the two results.
class ReasoningManager {
public:
    ReasoningManager(llm::LLMCaller& caller, const ReasoningConfig& config);

    // Falls back to None for an unknown mode name
    ReasoningMode mode() const { return mode_; }
    bool is_enabled() const { return mode_ != ReasoningMode::None; }

    ReasoningResult reason(const std::string& goal,
                           const std::string& context,
                           const std::vector<tools::ToolSpec>& tools,
                           const CancellationToken& cancellation);

    ReasoningResult reason(ReasoningMode mode,
                           const std::string& goal,
                           const std::string& context,
                           const std::vector<tools::ToolSpec>& tools,
                           const CancellationToken& cancellation);

    // 0.6 * chain + 0.4 * tree when both succeed, otherwise the survivor
    static ReasoningResult combine(ReasoningResult chain, ReasoningResult tree, Duration elapsed);

    ChainOfThoughtEngine& chain_engine() { return *chain_; }
    TreeOfThoughtsEngine& tree_engine() { return *tree_; }

private:
    ReasoningResult reason_hybrid(const std::string& goal,
                                  const std::string& context,
                                  const std::vector<tools::ToolSpec>& tools,
                                  const CancellationToken& cancellation);

    ReasoningMode mode_ = ReasoningMode::None;
    std::unique_ptr<ChainOfThoughtEngine> chain_;
    std::unique_ptr<TreeOfThoughtsEngine> tree_;
};

}  // namespace turnkit::reasoning
