#pragma once

#include "turnkit/core/config.hpp"
#include "turnkit/llm/llm_caller.hpp"
#include "exploration_strategies.hpp"
#include "reasoning_engine.hpp"

#include <string>
#include <vector>

namespace turnkit::reasoning {

// Oracle backed by model calls. Unparseable score replies count as 0.5 and
// unparseable expansions as no children; call failures are propagated.
class LLMThoughtOracle : public ThoughtOracle {
public:
    explicit LLMThoughtOracle(llm::LLMCaller& caller) : caller_(caller) {}

    Result<double, Error> score(const ReasoningTree& tree,
                                const ThoughtNode& node,
                                const CancellationToken& cancellation) override;

    Result<std::vector<parser::CandidateThought>, Error> expand(
        const ReasoningTree& tree,
        const ThoughtNode& node,
        const CancellationToken& cancellation) override;

private:
    llm::LLMCaller& caller_;
};

// Tree-search deliberation. The engine owns one tree at a time; the
// mutation primitives act on it and are not safe for concurrent use.
class TreeOfThoughtsEngine : public ReasoningEngine {
public:
    TreeOfThoughtsEngine(llm::LLMCaller& caller, const ReasoningConfig& config);

    TreeOfThoughtsEngine(const TreeOfThoughtsEngine&) = delete;
    TreeOfThoughtsEngine& operator=(const TreeOfThoughtsEngine&) = delete;

    ReasoningMode mode() const override { return ReasoningMode::TreeOfThoughts; }

    // Root thought from the model, exploration with the configured strategy,
    // then a conclusion synthesized from the best path
    ReasoningResult reason(const std::string& goal,
                           const std::string& context,
                           const std::vector<tools::ToolSpec>& tools,
                           const CancellationToken& cancellation) override;

    // Replaces the current tree with an empty one
    void reset(std::string goal, ExplorationStrategy strategy);

    Result<NodeId, Error> create_root(std::string thought, ThoughtType type = ThoughtType::Hypothesis);
    Result<NodeId, Error> add_child(const NodeId& parent_id, std::string thought,
                                    ThoughtType type = ThoughtType::Hypothesis);
    Result<void, Error> evaluate_node(const NodeId& node_id, double score);
    Result<void, Error> prune_node(const NodeId& node_id);
    std::vector<NodeId> get_descendants(const NodeId& node_id) const;
    std::vector<NodeId> get_path_to_node(const NodeId& node_id) const;
    void complete(const std::vector<NodeId>& path);

    ExplorationResult explore(ExplorationStrategy strategy, const CancellationToken& cancellation);

    const ReasoningTree& tree() const { return tree_; }

    // Swaps the model-backed oracle, mainly for tests
    void set_oracle(ThoughtOracle* oracle) { oracle_ = oracle ? oracle : &llm_oracle_; }

private:
    Result<std::string, Error> synthesize_conclusion(const ExplorationResult& exploration,
                                                     const std::string& context,
                                                     const std::vector<tools::ToolSpec>& tools,
                                                     const CancellationToken& cancellation);

    llm::LLMCaller& caller_;
    ReasoningConfig config_;
    LLMThoughtOracle llm_oracle_;
    ThoughtOracle* oracle_;
    ReasoningTree tree_;
};

}  // namespace turnkit::reasoning
