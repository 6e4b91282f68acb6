#pragma once

#include "turnkit/core/cancellation.hpp"
#include "turnkit/core/result.hpp"
#include "turnkit/parser/response_parser.hpp"
#include "reasoning_types.hpp"

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace turnkit::reasoning {

using namespace turnkit::core;

// Source of scores and candidate children during tree search.
// Errors abort exploration; unusable replies should degrade to defaults instead.
class ThoughtOracle {
public:
    virtual ~ThoughtOracle() = default;

    virtual Result<double, Error> score(const ReasoningTree& tree,
                                        const ThoughtNode& node,
                                        const CancellationToken& cancellation) = 0;

    virtual Result<std::vector<parser::CandidateThought>, Error> expand(
        const ReasoningTree& tree,
        const ThoughtNode& node,
        const CancellationToken& cancellation) = 0;
};

// Outcome of one exploration run
struct ExplorationResult {
    bool success = false;
    std::vector<NodeId> best_path;
    double best_path_score = 0.0;
    int nodes_explored = 0;
    int max_depth_reached = 0;
    std::optional<std::string> error;

    Json to_json() const;
};

struct ExplorerOptions {
    int beam_width = 3;
    int monte_carlo_simulations = 10;
    double monte_carlo_continue_probability = 0.7;
    unsigned int seed = 0;  // 0 seeds from random_device
};

// Score assumed for a candidate the model gave no estimate for
inline constexpr double kDefaultEstimatedScore = 0.5;

// Base for the search algorithms. Each run evaluates nodes through the oracle,
// keeps the best-scoring leaf seen so far, and expands nodes while the tree's
// depth and node limits allow. At most max_nodes evaluations happen per run.
class TreeExplorer {
public:
    explicit TreeExplorer(ThoughtOracle& oracle) : oracle_(oracle) {}
    virtual ~TreeExplorer() = default;

    virtual ExplorationStrategy strategy() const = 0;

    // Requires a rooted tree
    ExplorationResult explore(ReasoningTree& tree, const CancellationToken& cancellation);

protected:
    // Strategy body; returns an error to abort the run
    virtual Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) = 0;

    // Scores the node and records it as best when it beats the current best
    Result<double, Error> evaluate(ReasoningTree& tree, const NodeId& id,
                                   const CancellationToken& cancellation);

    // Asks for children and adds as many as the limits allow; ids in model order
    Result<std::vector<NodeId>, Error> expand(ReasoningTree& tree, const NodeId& id,
                                              const CancellationToken& cancellation);

    bool budget_exhausted(const ReasoningTree& tree) const {
        return result_.nodes_explored >= tree.max_nodes();
    }

    double estimate(const NodeId& id) const;

    const ExplorationResult& progress() const { return result_; }

private:
    ThoughtOracle& oracle_;
    ExplorationResult result_;
    std::unordered_map<NodeId, double> estimates_;
};

// Highest estimated score first; stops early once a strong path is found
class BestFirstExplorer : public TreeExplorer {
public:
    using TreeExplorer::TreeExplorer;
    ExplorationStrategy strategy() const override { return ExplorationStrategy::BestFirst; }

protected:
    Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) override;
};

// Level by level, oldest node first
class BreadthFirstExplorer : public TreeExplorer {
public:
    using TreeExplorer::TreeExplorer;
    ExplorationStrategy strategy() const override { return ExplorationStrategy::BreadthFirst; }

protected:
    Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) override;
};

// Most recently created node first
class DepthFirstExplorer : public TreeExplorer {
public:
    using TreeExplorer::TreeExplorer;
    ExplorationStrategy strategy() const override { return ExplorationStrategy::DepthFirst; }

protected:
    Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) override;
};

// Keeps the top beam_width nodes of each level and prunes the rest
class BeamSearchExplorer : public TreeExplorer {
public:
    BeamSearchExplorer(ThoughtOracle& oracle, int beam_width);
    ExplorationStrategy strategy() const override { return ExplorationStrategy::BeamSearch; }

protected:
    Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) override;

private:
    int beam_width_;
};

// Random walks from the root, stepping into a child with probability
// proportional to its score
class MonteCarloExplorer : public TreeExplorer {
public:
    MonteCarloExplorer(ThoughtOracle& oracle, const ExplorerOptions& options);
    ExplorationStrategy strategy() const override { return ExplorationStrategy::MonteCarlo; }

protected:
    Result<void, Error> run(ReasoningTree& tree, const CancellationToken& cancellation) override;

private:
    int simulations_;
    double continue_probability_;
    std::mt19937 rng_;
};

std::unique_ptr<TreeExplorer> make_explorer(ExplorationStrategy strategy,
                                            ThoughtOracle& oracle,
                                            const ExplorerOptions& options = {});

}  // namespace turnkit::reasoning
