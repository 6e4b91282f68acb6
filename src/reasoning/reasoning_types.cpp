#include "turnkit/reasoning/reasoning_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>

namespace turnkit::reasoning {

namespace {

// Lowercase with '_' and '-' removed, so "best_first" == "BestFirst"
std::string normalize_name(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        if (c == '_' || c == '-' || c == ' ') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

double clamp_unit(double value) {
    if (std::isnan(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

}  // namespace

std::string_view step_type_to_string(ReasoningStepType type) {
    switch (type) {
        case ReasoningStepType::Analysis: return "analysis";
        case ReasoningStepType::Decision: return "decision";
        case ReasoningStepType::Observation: return "observation";
        case ReasoningStepType::Planning: return "planning";
        case ReasoningStepType::Evaluation: return "evaluation";
        case ReasoningStepType::Synthesis: return "synthesis";
    }
    return "analysis";
}

ReasoningStepType step_type_from_string(std::string_view str) {
    auto name = normalize_name(str);
    if (name == "decision") return ReasoningStepType::Decision;
    if (name == "observation") return ReasoningStepType::Observation;
    if (name == "planning") return ReasoningStepType::Planning;
    if (name == "evaluation") return ReasoningStepType::Evaluation;
    if (name == "synthesis") return ReasoningStepType::Synthesis;
    return ReasoningStepType::Analysis;
}

std::string_view thought_type_to_string(ThoughtType type) {
    switch (type) {
        case ThoughtType::Hypothesis: return "hypothesis";
        case ThoughtType::Observation: return "observation";
        case ThoughtType::Decision: return "decision";
        case ThoughtType::Analysis: return "analysis";
        case ThoughtType::Conclusion: return "conclusion";
        case ThoughtType::Question: return "question";
        case ThoughtType::Alternative: return "alternative";
    }
    return "hypothesis";
}

ThoughtType thought_type_from_string(std::string_view str) {
    auto name = normalize_name(str);
    if (name == "observation") return ThoughtType::Observation;
    if (name == "decision") return ThoughtType::Decision;
    if (name == "analysis") return ThoughtType::Analysis;
    if (name == "conclusion") return ThoughtType::Conclusion;
    if (name == "question") return ThoughtType::Question;
    if (name == "alternative") return ThoughtType::Alternative;
    return ThoughtType::Hypothesis;
}

std::string_view node_state_to_string(ThoughtNodeState state) {
    switch (state) {
        case ThoughtNodeState::Pending: return "pending";
        case ThoughtNodeState::Evaluated: return "evaluated";
        case ThoughtNodeState::Pruned: return "pruned";
        case ThoughtNodeState::BestPath: return "best_path";
    }
    return "pending";
}

ThoughtNodeState node_state_from_string(std::string_view str) {
    auto name = normalize_name(str);
    if (name == "evaluated") return ThoughtNodeState::Evaluated;
    if (name == "pruned") return ThoughtNodeState::Pruned;
    if (name == "bestpath") return ThoughtNodeState::BestPath;
    return ThoughtNodeState::Pending;
}

std::string_view strategy_to_string(ExplorationStrategy strategy) {
    switch (strategy) {
        case ExplorationStrategy::BestFirst: return "best_first";
        case ExplorationStrategy::BreadthFirst: return "breadth_first";
        case ExplorationStrategy::DepthFirst: return "depth_first";
        case ExplorationStrategy::BeamSearch: return "beam_search";
        case ExplorationStrategy::MonteCarlo: return "monte_carlo";
    }
    return "best_first";
}

Result<ExplorationStrategy, Error> strategy_from_string(std::string_view str) {
    auto name = normalize_name(str);
    if (name == "bestfirst") return ExplorationStrategy::BestFirst;
    if (name == "breadthfirst") return ExplorationStrategy::BreadthFirst;
    if (name == "depthfirst") return ExplorationStrategy::DepthFirst;
    if (name == "beamsearch") return ExplorationStrategy::BeamSearch;
    if (name == "montecarlo") return ExplorationStrategy::MonteCarlo;
    return Result<ExplorationStrategy, Error>::err(
        ErrorCode::InvalidArgument, "Unknown exploration strategy", std::string(str));
}

std::string_view mode_to_string(ReasoningMode mode) {
    switch (mode) {
        case ReasoningMode::None: return "none";
        case ReasoningMode::ChainOfThought: return "chain_of_thought";
        case ReasoningMode::TreeOfThoughts: return "tree_of_thoughts";
        case ReasoningMode::Hybrid: return "hybrid";
    }
    return "none";
}

Result<ReasoningMode, Error> mode_from_string(std::string_view str) {
    auto name = normalize_name(str);
    if (name == "none" || name.empty()) return ReasoningMode::None;
    if (name == "chainofthought" || name == "cot") return ReasoningMode::ChainOfThought;
    if (name == "treeofthoughts" || name == "tot") return ReasoningMode::TreeOfThoughts;
    if (name == "hybrid") return ReasoningMode::Hybrid;
    return Result<ReasoningMode, Error>::err(
        ErrorCode::InvalidArgument, "Unknown reasoning mode", std::string(str));
}

// ReasoningStep
Json ReasoningStep::to_json() const {
    return Json{
        {"step_number", step_number},
        {"content", content},
        {"type", std::string(step_type_to_string(type))},
        {"confidence", confidence},
        {"insights", insights},
        {"created_at", to_epoch_ms(created_at)}
    };
}

ReasoningStep ReasoningStep::from_json(const Json& j) {
    ReasoningStep step;
    step.step_number = j.value("step_number", 0);
    step.content = j.value("content", "");
    step.type = step_type_from_string(j.value("type", "analysis"));
    step.confidence = j.value("confidence", 0.5);
    if (j.contains("insights") && j["insights"].is_array()) {
        for (const auto& insight : j["insights"]) {
            if (insight.is_string()) step.insights.push_back(insight.get<std::string>());
        }
    }
    step.created_at = from_epoch_ms(j.value("created_at", int64_t{0}));
    return step;
}

// ReasoningChain
ReasoningChain::ReasoningChain(std::string goal)
    : goal_(std::move(goal))
{
}

const ReasoningStep& ReasoningChain::add_step(std::string content,
                                              ReasoningStepType type,
                                              double confidence,
                                              std::vector<std::string> insights) {
    ReasoningStep step;
    step.step_number = static_cast<int>(steps_.size()) + 1;
    step.content = std::move(content);
    step.type = type;
    step.confidence = clamp_unit(confidence);
    step.insights = std::move(insights);
    step.created_at = Clock::now();
    steps_.push_back(std::move(step));
    return steps_.back();
}

void ReasoningChain::complete(std::string conclusion, double confidence) {
    if (is_complete_) return;
    final_conclusion_ = std::move(conclusion);
    final_confidence_ = clamp_unit(confidence);
    is_complete_ = true;
}

Json ReasoningChain::to_json() const {
    Json steps = Json::array();
    for (const auto& step : steps_) {
        steps.push_back(step.to_json());
    }
    return Json{
        {"goal", goal_},
        {"steps", steps},
        {"is_complete", is_complete_},
        {"final_conclusion", final_conclusion_},
        {"final_confidence", final_confidence_}
    };
}

ReasoningChain ReasoningChain::from_json(const Json& j) {
    ReasoningChain chain(j.value("goal", ""));
    if (j.contains("steps") && j["steps"].is_array()) {
        for (const auto& s : j["steps"]) {
            chain.steps_.push_back(ReasoningStep::from_json(s));
        }
    }
    chain.is_complete_ = j.value("is_complete", false);
    chain.final_conclusion_ = j.value("final_conclusion", "");
    chain.final_confidence_ = j.value("final_confidence", 0.0);
    return chain;
}

// ThoughtNode
Json ThoughtNode::to_json() const {
    Json j{
        {"node_id", node_id},
        {"child_ids", child_ids},
        {"depth", depth},
        {"thought", thought},
        {"thought_type", std::string(thought_type_to_string(thought_type))},
        {"state", std::string(node_state_to_string(state))},
        {"created_at", to_epoch_ms(created_at)}
    };
    if (parent_id) j["parent_id"] = *parent_id;
    if (score) j["score"] = *score;
    if (evaluated_at) j["evaluated_at"] = to_epoch_ms(*evaluated_at);
    return j;
}

ThoughtNode ThoughtNode::from_json(const Json& j) {
    ThoughtNode node;
    node.node_id = j.value("node_id", "");
    if (j.contains("parent_id") && j["parent_id"].is_string()) {
        node.parent_id = j["parent_id"].get<std::string>();
    }
    if (j.contains("child_ids") && j["child_ids"].is_array()) {
        node.child_ids = j["child_ids"].get<std::vector<std::string>>();
    }
    node.depth = j.value("depth", 0);
    node.thought = j.value("thought", "");
    node.thought_type = thought_type_from_string(j.value("thought_type", "hypothesis"));
    if (j.contains("score") && j["score"].is_number()) {
        node.score = j["score"].get<double>();
    }
    node.state = node_state_from_string(j.value("state", "pending"));
    if (j.contains("evaluated_at")) {
        node.evaluated_at = from_epoch_ms(j["evaluated_at"].get<int64_t>());
    }
    node.created_at = from_epoch_ms(j.value("created_at", int64_t{0}));
    return node;
}

// ReasoningTree
ReasoningTree::ReasoningTree(std::string goal, int max_depth, int max_nodes,
                             ExplorationStrategy strategy)
    : goal_(std::move(goal))
    , max_depth_(max_depth)
    , max_nodes_(max_nodes)
    , strategy_(strategy)
{
}

NodeId ReasoningTree::next_node_id() {
    NodeId id;
    do {
        id = "node_" + std::to_string(next_id_++);
    } while (nodes_.count(id));
    return id;
}

Result<NodeId, Error> ReasoningTree::create_root(std::string thought, ThoughtType type) {
    if (is_complete_) {
        return Result<NodeId, Error>::err(ErrorCode::InvalidState, "Tree is complete");
    }
    if (root_id_) {
        return Result<NodeId, Error>::err(ErrorCode::TreeRootExists, "Tree already has a root", *root_id_);
    }
    if (at_capacity()) {
        return Result<NodeId, Error>::err(ErrorCode::TreeCapacityExceeded, "Tree node limit reached");
    }

    ThoughtNode node;
    node.node_id = next_node_id();
    node.depth = 0;
    node.thought = std::move(thought);
    node.thought_type = type;
    node.created_at = Clock::now();

    NodeId id = node.node_id;
    nodes_.emplace(id, std::move(node));
    root_id_ = id;
    return Result<NodeId, Error>::ok(id);
}

Result<NodeId, Error> ReasoningTree::add_child(const NodeId& parent_id, std::string thought, ThoughtType type) {
    if (is_complete_) {
        return Result<NodeId, Error>::err(ErrorCode::InvalidState, "Tree is complete", parent_id);
    }
    auto parent = nodes_.find(parent_id);
    if (parent == nodes_.end()) {
        return Result<NodeId, Error>::err(ErrorCode::NotFound, "Parent node not found", parent_id);
    }
    if (parent->second.state == ThoughtNodeState::Pruned) {
        return Result<NodeId, Error>::err(ErrorCode::InvalidState, "Cannot expand a pruned node", parent_id);
    }

    int depth = parent->second.depth + 1;
    if (depth > max_depth_) {
        return Result<NodeId, Error>::err(
            ErrorCode::TreeDepthExceeded,
            "Child depth " + std::to_string(depth) + " exceeds max depth " + std::to_string(max_depth_),
            parent_id
        );
    }
    if (at_capacity()) {
        return Result<NodeId, Error>::err(
            ErrorCode::TreeCapacityExceeded,
            "Tree already holds " + std::to_string(max_nodes_) + " nodes",
            parent_id
        );
    }

    ThoughtNode node;
    node.node_id = next_node_id();
    node.parent_id = parent_id;
    node.depth = depth;
    node.thought = std::move(thought);
    node.thought_type = type;
    node.created_at = Clock::now();

    NodeId id = node.node_id;
    parent->second.child_ids.push_back(id);
    nodes_.emplace(id, std::move(node));
    return Result<NodeId, Error>::ok(id);
}

Result<void, Error> ReasoningTree::evaluate_node(const NodeId& node_id, double score) {
    if (is_complete_) {
        return Result<void, Error>::err(ErrorCode::InvalidState, "Tree is complete", node_id);
    }
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return Result<void, Error>::err(ErrorCode::NotFound, "Node not found", node_id);
    }

    auto& node = it->second;
    node.score = clamp_unit(score);
    node.evaluated_at = Clock::now();
    // Pruning is terminal
    if (node.state != ThoughtNodeState::Pruned) {
        node.state = ThoughtNodeState::Evaluated;
    }
    return Result<void, Error>::ok();
}

Result<void, Error> ReasoningTree::prune_node(const NodeId& node_id) {
    if (is_complete_) {
        return Result<void, Error>::err(ErrorCode::InvalidState, "Tree is complete", node_id);
    }
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) {
        return Result<void, Error>::err(ErrorCode::NotFound, "Node not found", node_id);
    }

    it->second.state = ThoughtNodeState::Pruned;
    for (const auto& id : get_descendants(node_id)) {
        nodes_.at(id).state = ThoughtNodeState::Pruned;
    }
    return Result<void, Error>::ok();
}

std::vector<NodeId> ReasoningTree::get_descendants(const NodeId& node_id) const {
    std::vector<NodeId> result;
    auto it = nodes_.find(node_id);
    if (it == nodes_.end()) return result;

    std::deque<NodeId> queue(it->second.child_ids.begin(), it->second.child_ids.end());
    while (!queue.empty()) {
        NodeId id = std::move(queue.front());
        queue.pop_front();

        auto child = nodes_.find(id);
        if (child == nodes_.end()) continue;

        result.push_back(id);
        queue.insert(queue.end(), child->second.child_ids.begin(), child->second.child_ids.end());
    }
    return result;
}

std::vector<NodeId> ReasoningTree::get_path_to_node(const NodeId& node_id) const {
    std::vector<NodeId> path;
    auto it = nodes_.find(node_id);

    while (it != nodes_.end()) {
        path.push_back(it->first);
        if (!it->second.parent_id) break;
        it = nodes_.find(*it->second.parent_id);
    }

    std::reverse(path.begin(), path.end());
    return path;
}

void ReasoningTree::complete(const std::vector<NodeId>& path) {
    if (is_complete_) return;

    best_path_.clear();
    for (const auto& id : path) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) continue;
        it->second.state = ThoughtNodeState::BestPath;
        best_path_.push_back(id);
    }
    is_complete_ = true;
}

const ThoughtNode* ReasoningTree::find(const NodeId& node_id) const {
    auto it = nodes_.find(node_id);
    return it == nodes_.end() ? nullptr : &it->second;
}

int ReasoningTree::deepest_level() const {
    int deepest = 0;
    for (const auto& [id, node] : nodes_) {
        deepest = std::max(deepest, node.depth);
    }
    return deepest;
}

Json ReasoningTree::to_json() const {
    Json nodes = Json::object();
    for (const auto& [id, node] : nodes_) {
        nodes[id] = node.to_json();
    }

    Json j{
        {"goal", goal_},
        {"max_depth", max_depth_},
        {"max_nodes", max_nodes_},
        {"exploration_strategy", std::string(strategy_to_string(strategy_))},
        {"nodes", nodes},
        {"is_complete", is_complete_},
        {"best_path", best_path_}
    };
    if (root_id_) j["root_id"] = *root_id_;
    return j;
}

ReasoningTree ReasoningTree::from_json(const Json& j) {
    auto strategy = strategy_from_string(j.value("exploration_strategy", "best_first"));

    ReasoningTree tree(
        j.value("goal", ""),
        j.value("max_depth", 5),
        j.value("max_nodes", 50),
        strategy.unwrap_or(ExplorationStrategy::BestFirst)
    );

    if (j.contains("nodes") && j["nodes"].is_object()) {
        for (const auto& [id, node_json] : j["nodes"].items()) {
            auto node = ThoughtNode::from_json(node_json);
            node.node_id = id;
            tree.nodes_.emplace(id, std::move(node));
        }
    }
    if (j.contains("root_id") && j["root_id"].is_string()) {
        tree.root_id_ = j["root_id"].get<std::string>();
    }
    tree.is_complete_ = j.value("is_complete", false);
    if (j.contains("best_path") && j["best_path"].is_array()) {
        tree.best_path_ = j["best_path"].get<std::vector<std::string>>();
    }
    tree.next_id_ = static_cast<int>(tree.nodes_.size()) + 1;
    return tree;
}

// ReasoningResult
Json ReasoningResult::to_json() const {
    Json j{
        {"success", success},
        {"conclusion", conclusion},
        {"confidence", confidence},
        {"elapsed_ms", elapsed.count()},
        {"metadata", metadata}
    };
    if (chain) j["chain"] = chain->to_json();
    if (tree) j["tree"] = tree->to_json();
    if (error) j["error"] = *error;
    return j;
}

}  // namespace turnkit::reasoning
