#include "turnkit/reasoning/exploration_strategies.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <queue>

namespace turnkit::reasoning {

namespace {

// Best-first stops once a path this strong is found...
constexpr double kStrongPathScore = 0.8;
// ...or a decent one after this many evaluations
constexpr double kGoodPathScore = 0.6;
constexpr int kGoodPathMinExplored = 15;

// Floor for Monte Carlo weights so zero-scored children stay reachable
constexpr double kMinWalkWeight = 0.01;

bool is_pruned(const ThoughtNode* node) {
    return node == nullptr || node->state == ThoughtNodeState::Pruned;
}

}  // namespace

Json ExplorationResult::to_json() const {
    Json j{
        {"success", success},
        {"best_path", best_path},
        {"best_path_score", best_path_score},
        {"nodes_explored", nodes_explored},
        {"max_depth_reached", max_depth_reached}
    };
    if (error) j["error"] = *error;
    return j;
}

ExplorationResult TreeExplorer::explore(ReasoningTree& tree, const CancellationToken& cancellation) {
    result_ = ExplorationResult{};
    estimates_.clear();

    if (!tree.root_id()) {
        result_.error = "Tree has no root to explore from";
        return result_;
    }

    spdlog::debug("Exploring tree with {} (max depth {}, max nodes {})",
                  strategy_to_string(strategy()), tree.max_depth(), tree.max_nodes());

    auto outcome = run(tree, cancellation);
    if (outcome.is_err()) {
        result_.success = false;
        result_.error = outcome.error().message;
        spdlog::warn("Exploration ({}) stopped: {}", strategy_to_string(strategy()), outcome.error().full_message());
        return result_;
    }

    result_.success = true;
    spdlog::debug("Exploration ({}) explored {} nodes, best score {:.2f}",
                  strategy_to_string(strategy()), result_.nodes_explored, result_.best_path_score);
    return result_;
}

Result<double, Error> TreeExplorer::evaluate(ReasoningTree& tree, const NodeId& id,
                                             const CancellationToken& cancellation) {
    if (cancellation.is_cancelled()) {
        return Result<double, Error>::err(ErrorCode::Cancelled, "Exploration cancelled", id);
    }

    const ThoughtNode* node = tree.find(id);
    if (!node) {
        return Result<double, Error>::err(ErrorCode::NotFound, "Node not found", id);
    }

    auto scored = oracle_.score(tree, *node, cancellation);
    if (scored.is_err()) {
        return scored;
    }

    auto evaluated = tree.evaluate_node(id, scored.value());
    if (evaluated.is_err()) {
        return Result<double, Error>::err(evaluated.error());
    }

    const double score = node->score.value_or(0.0);
    result_.nodes_explored++;
    result_.max_depth_reached = std::max(result_.max_depth_reached, node->depth);

    if (node->is_leaf() && score > result_.best_path_score) {
        result_.best_path_score = score;
        result_.best_path = tree.get_path_to_node(id);
    }
    return Result<double, Error>::ok(score);
}

Result<std::vector<NodeId>, Error> TreeExplorer::expand(ReasoningTree& tree, const NodeId& id,
                                                        const CancellationToken& cancellation) {
    std::vector<NodeId> children;

    const ThoughtNode* node = tree.find(id);
    if (is_pruned(node) || node->depth >= tree.max_depth() || tree.at_capacity()) {
        return Result<std::vector<NodeId>, Error>::ok(std::move(children));
    }

    auto candidates = oracle_.expand(tree, *node, cancellation);
    if (candidates.is_err()) {
        return Result<std::vector<NodeId>, Error>::err(std::move(candidates).error());
    }

    for (auto& candidate : candidates.value()) {
        auto added = tree.add_child(id, std::move(candidate.thought), candidate.type);
        if (added.is_err()) {
            spdlog::debug("Stopped expanding {}: {}", id, added.error().message);
            break;
        }
        estimates_[added.value()] = candidate.estimated_score.value_or(kDefaultEstimatedScore);
        children.push_back(added.value());
    }
    return Result<std::vector<NodeId>, Error>::ok(std::move(children));
}

double TreeExplorer::estimate(const NodeId& id) const {
    auto it = estimates_.find(id);
    return it != estimates_.end() ? it->second : kDefaultEstimatedScore;
}

// ---------------------------------------------------------------------------

Result<void, Error> BestFirstExplorer::run(ReasoningTree& tree, const CancellationToken& cancellation) {
    struct Entry {
        double priority;
        int order;
        NodeId id;
    };
    // Highest priority first, ties in creation order
    auto lower = [](const Entry& a, const Entry& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.order > b.order;
    };
    std::priority_queue<Entry, std::vector<Entry>, decltype(lower)> frontier(lower);

    int order = 0;
    frontier.push({kDefaultEstimatedScore, order++, *tree.root_id()});

    while (!frontier.empty() && !budget_exhausted(tree)) {
        Entry entry = frontier.top();
        frontier.pop();

        if (is_pruned(tree.find(entry.id))) continue;

        auto scored = evaluate(tree, entry.id, cancellation);
        if (scored.is_err()) {
            return Result<void, Error>::err(std::move(scored).error());
        }

        const auto& best = progress();
        if (best.best_path_score > kStrongPathScore ||
            (best.nodes_explored >= kGoodPathMinExplored && best.best_path_score > kGoodPathScore)) {
            spdlog::debug("Best-first stopping early at score {:.2f}", best.best_path_score);
            break;
        }

        auto children = expand(tree, entry.id, cancellation);
        if (children.is_err()) {
            return Result<void, Error>::err(std::move(children).error());
        }
        for (const auto& child : children.value()) {
            frontier.push({estimate(child), order++, child});
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> BreadthFirstExplorer::run(ReasoningTree& tree, const CancellationToken& cancellation) {
    std::deque<NodeId> frontier{*tree.root_id()};

    while (!frontier.empty() && !budget_exhausted(tree)) {
        NodeId id = frontier.front();
        frontier.pop_front();

        if (is_pruned(tree.find(id))) continue;

        auto scored = evaluate(tree, id, cancellation);
        if (scored.is_err()) {
            return Result<void, Error>::err(std::move(scored).error());
        }

        auto children = expand(tree, id, cancellation);
        if (children.is_err()) {
            return Result<void, Error>::err(std::move(children).error());
        }
        frontier.insert(frontier.end(), children.value().begin(), children.value().end());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DepthFirstExplorer::run(ReasoningTree& tree, const CancellationToken& cancellation) {
    std::vector<NodeId> stack{*tree.root_id()};

    while (!stack.empty() && !budget_exhausted(tree)) {
        NodeId id = stack.back();
        stack.pop_back();

        if (is_pruned(tree.find(id))) continue;

        auto scored = evaluate(tree, id, cancellation);
        if (scored.is_err()) {
            return Result<void, Error>::err(std::move(scored).error());
        }

        auto children = expand(tree, id, cancellation);
        if (children.is_err()) {
            return Result<void, Error>::err(std::move(children).error());
        }
        // Reversed so the first child is explored first
        stack.insert(stack.end(), children.value().rbegin(), children.value().rend());
    }
    return Result<void, Error>::ok();
}

BeamSearchExplorer::BeamSearchExplorer(ThoughtOracle& oracle, int beam_width)
    : TreeExplorer(oracle)
    , beam_width_(std::max(1, beam_width))
{
}

Result<void, Error> BeamSearchExplorer::run(ReasoningTree& tree, const CancellationToken& cancellation) {
    std::vector<NodeId> level{*tree.root_id()};

    while (!level.empty() && !budget_exhausted(tree)) {
        std::vector<std::pair<NodeId, double>> scored;
        for (const auto& id : level) {
            if (budget_exhausted(tree)) break;
            if (is_pruned(tree.find(id))) continue;

            auto score = evaluate(tree, id, cancellation);
            if (score.is_err()) {
                return Result<void, Error>::err(std::move(score).error());
            }
            scored.emplace_back(id, score.value());
        }

        std::stable_sort(scored.begin(), scored.end(),
            [](const auto& a, const auto& b) { return a.second > b.second; });

        if (static_cast<int>(scored.size()) > beam_width_) {
            for (size_t i = static_cast<size_t>(beam_width_); i < scored.size(); ++i) {
                auto pruned = tree.prune_node(scored[i].first);
                if (pruned.is_err()) {
                    return pruned;
                }
            }
            scored.resize(static_cast<size_t>(beam_width_));
        }

        std::vector<NodeId> next;
        for (const auto& [id, score] : scored) {
            auto children = expand(tree, id, cancellation);
            if (children.is_err()) {
                return Result<void, Error>::err(std::move(children).error());
            }
            next.insert(next.end(), children.value().begin(), children.value().end());
        }
        level = std::move(next);
    }
    return Result<void, Error>::ok();
}

MonteCarloExplorer::MonteCarloExplorer(ThoughtOracle& oracle, const ExplorerOptions& options)
    : TreeExplorer(oracle)
    , simulations_(std::max(1, options.monte_carlo_simulations))
    , continue_probability_(std::clamp(options.monte_carlo_continue_probability, 0.0, 1.0))
    , rng_(options.seed != 0 ? options.seed : std::random_device{}())
{
}

Result<void, Error> MonteCarloExplorer::run(ReasoningTree& tree, const CancellationToken& cancellation) {
    std::bernoulli_distribution keep_walking(continue_probability_);

    for (int sim = 0; sim < simulations_ && !budget_exhausted(tree); ++sim) {
        NodeId current = *tree.root_id();

        while (true) {
            const ThoughtNode* node = tree.find(current);
            if (is_pruned(node)) break;

            if (!node->score) {
                if (budget_exhausted(tree)) break;
                auto scored = evaluate(tree, current, cancellation);
                if (scored.is_err()) {
                    return Result<void, Error>::err(std::move(scored).error());
                }
            }

            if (!keep_walking(rng_)) break;

            if (node->child_ids.empty()) {
                auto children = expand(tree, current, cancellation);
                if (children.is_err()) {
                    return Result<void, Error>::err(std::move(children).error());
                }
            }

            std::vector<NodeId> candidates;
            std::vector<double> weights;
            for (const auto& child_id : node->child_ids) {
                const ThoughtNode* child = tree.find(child_id);
                if (is_pruned(child)) continue;
                candidates.push_back(child_id);
                weights.push_back(std::max(kMinWalkWeight, child->score.value_or(estimate(child_id))));
            }
            if (candidates.empty()) break;

            std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
            current = candidates[pick(rng_)];
        }
    }
    return Result<void, Error>::ok();
}

std::unique_ptr<TreeExplorer> make_explorer(ExplorationStrategy strategy,
                                            ThoughtOracle& oracle,
                                            const ExplorerOptions& options) {
    switch (strategy) {
        case ExplorationStrategy::BestFirst:
            return std::make_unique<BestFirstExplorer>(oracle);
        case ExplorationStrategy::BreadthFirst:
            return std::make_unique<BreadthFirstExplorer>(oracle);
        case ExplorationStrategy::DepthFirst:
            return std::make_unique<DepthFirstExplorer>(oracle);
        case ExplorationStrategy::BeamSearch:
            return std::make_unique<BeamSearchExplorer>(oracle, options.beam_width);
        case ExplorationStrategy::MonteCarlo:
            return std::make_unique<MonteCarloExplorer>(oracle, options);
    }
    return std::make_unique<BestFirstExplorer>(oracle);
}

}  // namespace turnkit::reasoning
