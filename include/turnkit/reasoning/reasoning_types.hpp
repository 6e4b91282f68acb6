#pragma once

#include "turnkit/core/result.hpp"
#include "turnkit/core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnkit::reasoning {

using namespace turnkit::core;

enum class ReasoningStepType {
    Analysis,
    Decision,
    Observation,
    Planning,
    Evaluation,
    Synthesis
};

enum class ThoughtType {
    Hypothesis,
    Observation,
    Decision,
    Analysis,
    Conclusion,
    Question,
    Alternative
};

enum class ThoughtNodeState {
    Pending,
    Evaluated,
    Pruned,
    BestPath
};

enum class ExplorationStrategy {
    BestFirst,
    BreadthFirst,
    DepthFirst,
    BeamSearch,
    MonteCarlo
};

enum class ReasoningMode {
    None,
    ChainOfThought,
    TreeOfThoughts,
    Hybrid
};

std::string_view step_type_to_string(ReasoningStepType type);
ReasoningStepType step_type_from_string(std::string_view str);

std::string_view thought_type_to_string(ThoughtType type);
// Case-insensitive; unknown names map to Hypothesis
ThoughtType thought_type_from_string(std::string_view str);

std::string_view node_state_to_string(ThoughtNodeState state);
ThoughtNodeState node_state_from_string(std::string_view str);

std::string_view strategy_to_string(ExplorationStrategy strategy);
Result<ExplorationStrategy, Error> strategy_from_string(std::string_view str);

std::string_view mode_to_string(ReasoningMode mode);
Result<ReasoningMode, Error> mode_from_string(std::string_view str);

// One entry of a linear reasoning chain
struct ReasoningStep {
    int step_number = 0;
    std::string content;
    ReasoningStepType type = ReasoningStepType::Analysis;
    double confidence = 0.5;
    std::vector<std::string> insights;
    TimePoint created_at;

    Json to_json() const;
    static ReasoningStep from_json(const Json& j);
};

// Append-only sequence of reasoning steps, numbered from 1
class ReasoningChain {
public:
    ReasoningChain() = default;
    explicit ReasoningChain(std::string goal);

    const ReasoningStep& add_step(std::string content,
                                  ReasoningStepType type,
                                  double confidence,
                                  std::vector<std::string> insights = {});

    // Marks the chain complete; later calls are ignored
    void complete(std::string conclusion, double confidence);

    const std::string& goal() const { return goal_; }
    const std::vector<ReasoningStep>& steps() const { return steps_; }
    bool is_complete() const { return is_complete_; }
    const std::string& final_conclusion() const { return final_conclusion_; }
    double final_confidence() const { return final_confidence_; }

    Json to_json() const;
    static ReasoningChain from_json(const Json& j);

private:
    std::string goal_;
    std::vector<ReasoningStep> steps_;
    bool is_complete_ = false;
    std::string final_conclusion_;
    double final_confidence_ = 0.0;
};

// One vertex of a reasoning tree; children are referenced by id only
struct ThoughtNode {
    NodeId node_id;
    std::optional<NodeId> parent_id;
    std::vector<NodeId> child_ids;
    int depth = 0;
    std::string thought;
    ThoughtType thought_type = ThoughtType::Hypothesis;
    std::optional<double> score;
    ThoughtNodeState state = ThoughtNodeState::Pending;
    std::optional<TimePoint> evaluated_at;
    TimePoint created_at;

    bool is_leaf() const { return child_ids.empty(); }

    Json to_json() const;
    static ThoughtNode from_json(const Json& j);
};

// Arena of thought nodes keyed by id. Not safe for concurrent mutation.
class ReasoningTree {
public:
    ReasoningTree() = default;
    ReasoningTree(std::string goal, int max_depth, int max_nodes,
                  ExplorationStrategy strategy = ExplorationStrategy::BestFirst);

    // Fails with TreeRootExists on a second call
    Result<NodeId, Error> create_root(std::string thought, ThoughtType type);

    // Fails on unknown or pruned parent, depth past max_depth, or max_nodes reached.
    // A failed call leaves the tree untouched.
    Result<NodeId, Error> add_child(const NodeId& parent_id, std::string thought, ThoughtType type);

    // Clamps score into [0, 1] and stamps the evaluation time
    Result<void, Error> evaluate_node(const NodeId& node_id, double score);

    // Prunes the node and every transitive descendant
    Result<void, Error> prune_node(const NodeId& node_id);

    // Breadth-first; empty for unknown ids
    std::vector<NodeId> get_descendants(const NodeId& node_id) const;

    // Root first; empty for unknown ids
    std::vector<NodeId> get_path_to_node(const NodeId& node_id) const;

    // Marks known ids as BestPath and seals the tree: later completes are
    // ignored and every mutation fails with InvalidState
    void complete(const std::vector<NodeId>& path);

    const ThoughtNode* find(const NodeId& node_id) const;

    const std::string& goal() const { return goal_; }
    const std::optional<NodeId>& root_id() const { return root_id_; }
    int max_depth() const { return max_depth_; }
    int max_nodes() const { return max_nodes_; }
    ExplorationStrategy strategy() const { return strategy_; }
    const std::map<NodeId, ThoughtNode>& nodes() const { return nodes_; }
    size_t node_count() const { return nodes_.size(); }
    bool is_complete() const { return is_complete_; }
    const std::vector<NodeId>& best_path() const { return best_path_; }

    bool at_capacity() const { return static_cast<int>(nodes_.size()) >= max_nodes_; }
    int deepest_level() const;

    Json to_json() const;
    static ReasoningTree from_json(const Json& j);

private:
    NodeId next_node_id();

    std::string goal_;
    std::optional<NodeId> root_id_;
    int max_depth_ = 5;
    int max_nodes_ = 50;
    ExplorationStrategy strategy_ = ExplorationStrategy::BestFirst;
    std::map<NodeId, ThoughtNode> nodes_;
    bool is_complete_ = false;
    std::vector<NodeId> best_path_;
    int next_id_ = 1;
};

// Outcome shared by every reasoning engine
struct ReasoningResult {
    bool success = false;
    std::string conclusion;
    double confidence = 0.0;
    Duration elapsed{0};
    std::optional<ReasoningChain> chain;
    std::optional<ReasoningTree> tree;
    std::optional<std::string> error;
    Json metadata = Json::object();

    static ReasoningResult failure(std::string message) {
        ReasoningResult r;
        r.error = std::move(message);
        return r;
    }

    Json to_json() const;
};

}  // namespace turnkit::reasoning
