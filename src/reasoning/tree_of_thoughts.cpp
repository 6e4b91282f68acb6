#include "turnkit/reasoning/tree_of_thoughts.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace turnkit::reasoning {

namespace {

constexpr const char* kNoViablePath = "No viable solution path found.";
constexpr const char* kConclusionFallback = "Failed to generate conclusion from best path.";

std::string root_prompt(const std::string& goal,
                        const std::string& context,
                        const std::vector<tools::ToolSpec>& tools) {
    std::string prompt = "You are starting a tree-of-thoughts exploration of a problem.\n\n";
    prompt += "GOAL: " + goal + "\n";
    prompt += "CONTEXT: " + (context.empty() ? std::string("(none)") : context) + "\n\n";
    prompt += "AVAILABLE TOOLS:\n" + describe_tools(tools) + "\n\n";
    prompt += "Propose an initial thought or hypothesis about how to approach the goal. "
              "It should open up several directions to explore.\n\n"
              "Respond with a single JSON object:\n"
              "{\n"
              "  \"thought\": \"your initial thought\",\n"
              "  \"thought_type\": \"Hypothesis\"\n"
              "}";
    return prompt;
}

std::string expand_prompt(const ReasoningTree& tree, const ThoughtNode& node) {
    std::string prompt = "You are generating child thoughts in a tree-of-thoughts exploration.\n\n";
    prompt += "GOAL: " + tree.goal() + "\n";
    prompt += "PARENT THOUGHT: " + node.thought + "\n";
    prompt += fmt::format("PARENT DEPTH: {}\n", node.depth);
    prompt += fmt::format("PARENT SCORE: {:.2f}\n\n", node.score.value_or(0.0));
    prompt += "Propose 2-3 child thoughts that each take a different direction from the parent: "
              "an alternative, a refinement, or a next step.\n\n"
              "Respond with a single JSON object:\n"
              "{\n"
              "  \"children\": [\n"
              "    {\"thought\": \"...\", \"thought_type\": \"Analysis\", \"estimated_score\": 0.7},\n"
              "    {\"thought\": \"...\", \"thought_type\": \"Alternative\", \"estimated_score\": 0.6}\n"
              "  ]\n"
              "}";
    return prompt;
}

std::string score_prompt(const ReasoningTree& tree, const ThoughtNode& node) {
    std::string prompt = "You are evaluating one thought in a tree-of-thoughts exploration.\n\n";
    prompt += "GOAL: " + tree.goal() + "\n";
    prompt += "THOUGHT: " + node.thought + "\n";
    prompt += "THOUGHT TYPE: " + std::string(thought_type_to_string(node.thought_type)) + "\n";
    prompt += fmt::format("DEPTH: {}\n\n", node.depth);
    prompt += "Rate the thought from 0.0 to 1.0 for relevance to the goal, soundness, "
              "and how likely it is to lead to a solution.\n\n"
              "Respond with a single JSON object:\n"
              "{\n"
              "  \"score\": 0.0 to 1.0,\n"
              "  \"reasoning\": \"brief justification\"\n"
              "}";
    return prompt;
}

std::string conclusion_prompt(const ReasoningTree& tree,
                              const std::vector<NodeId>& path,
                              const std::string& context,
                              const std::vector<tools::ToolSpec>& tools) {
    std::string prompt = "You are synthesizing a conclusion from the best path of a tree-of-thoughts exploration.\n\n";
    prompt += "GOAL: " + tree.goal() + "\n";
    prompt += "CONTEXT: " + (context.empty() ? std::string("(none)") : context) + "\n\n";
    prompt += "BEST PATH:\n";
    int step = 1;
    for (const auto& id : path) {
        if (const auto* node = tree.find(id)) {
            prompt += fmt::format("Step {}: {}\n", step++, node->thought);
        }
    }
    prompt += "\nAVAILABLE TOOLS:\n" + describe_tools(tools) + "\n\n";
    prompt += "Give a clear, actionable conclusion that summarizes the approach and the next steps.\n\n"
              "Respond with a single JSON object:\n"
              "{\n"
              "  \"conclusion\": \"your conclusion\"\n"
              "}";
    return prompt;
}

}  // namespace

// ---------------------------------------------------------------------------

Result<double, Error> LLMThoughtOracle::score(const ReasoningTree& tree,
                                              const ThoughtNode& node,
                                              const CancellationToken& cancellation) {
    auto response = caller_.complete({Message::user(score_prompt(tree, node))}, cancellation);
    if (response.is_err()) {
        return Result<double, Error>::err(std::move(response).error());
    }

    auto parsed = parser::parse_tree_of_thoughts(response.value().content);
    if (parsed.is_err() || !parsed.value().score) {
        spdlog::debug("No usable score for {}, assuming {}", node.node_id, kDefaultEstimatedScore);
        return Result<double, Error>::ok(kDefaultEstimatedScore);
    }
    return Result<double, Error>::ok(*parsed.value().score);
}

Result<std::vector<parser::CandidateThought>, Error> LLMThoughtOracle::expand(
    const ReasoningTree& tree,
    const ThoughtNode& node,
    const CancellationToken& cancellation) {
    using Candidates = std::vector<parser::CandidateThought>;

    auto response = caller_.complete({Message::user(expand_prompt(tree, node))}, cancellation);
    if (response.is_err()) {
        return Result<Candidates, Error>::err(std::move(response).error());
    }

    auto parsed = parser::parse_tree_of_thoughts(response.value().content);
    if (parsed.is_err()) {
        spdlog::debug("Unusable expansion for {}: {}", node.node_id, parsed.error().message);
        return Result<Candidates, Error>::ok(Candidates{});
    }
    return Result<Candidates, Error>::ok(std::move(parsed).value().thoughts);
}

// ---------------------------------------------------------------------------

TreeOfThoughtsEngine::TreeOfThoughtsEngine(llm::LLMCaller& caller, const ReasoningConfig& config)
    : caller_(caller)
    , config_(config)
    , llm_oracle_(caller)
    , oracle_(&llm_oracle_)
    , tree_("", config.max_tree_depth, config.max_tree_nodes)
{
}

void TreeOfThoughtsEngine::reset(std::string goal, ExplorationStrategy strategy) {
    tree_ = ReasoningTree(std::move(goal), config_.max_tree_depth, config_.max_tree_nodes, strategy);
}

Result<NodeId, Error> TreeOfThoughtsEngine::create_root(std::string thought, ThoughtType type) {
    return tree_.create_root(std::move(thought), type);
}

Result<NodeId, Error> TreeOfThoughtsEngine::add_child(const NodeId& parent_id, std::string thought,
                                                      ThoughtType type) {
    return tree_.add_child(parent_id, std::move(thought), type);
}

Result<void, Error> TreeOfThoughtsEngine::evaluate_node(const NodeId& node_id, double score) {
    return tree_.evaluate_node(node_id, score);
}

Result<void, Error> TreeOfThoughtsEngine::prune_node(const NodeId& node_id) {
    return tree_.prune_node(node_id);
}

std::vector<NodeId> TreeOfThoughtsEngine::get_descendants(const NodeId& node_id) const {
    return tree_.get_descendants(node_id);
}

std::vector<NodeId> TreeOfThoughtsEngine::get_path_to_node(const NodeId& node_id) const {
    return tree_.get_path_to_node(node_id);
}

void TreeOfThoughtsEngine::complete(const std::vector<NodeId>& path) {
    tree_.complete(path);
}

ExplorationResult TreeOfThoughtsEngine::explore(ExplorationStrategy strategy,
                                                const CancellationToken& cancellation) {
    ExplorerOptions options;
    options.beam_width = config_.beam_width;
    options.seed = config_.monte_carlo_seed;

    auto explorer = make_explorer(strategy, *oracle_, options);
    return explorer->explore(tree_, cancellation);
}

Result<std::string, Error> TreeOfThoughtsEngine::synthesize_conclusion(
    const ExplorationResult& exploration,
    const std::string& context,
    const std::vector<tools::ToolSpec>& tools,
    const CancellationToken& cancellation) {
    if (exploration.best_path.empty()) {
        return Result<std::string, Error>::ok(kNoViablePath);
    }

    auto prompt = conclusion_prompt(tree_, exploration.best_path, context, tools);
    auto response = caller_.complete({Message::user(std::move(prompt))}, cancellation);
    if (response.is_err()) {
        if (response.error().code == ErrorCode::Cancelled) {
            return Result<std::string, Error>::err(std::move(response).error());
        }
        spdlog::warn("Conclusion call failed: {}", response.error().full_message());
        return Result<std::string, Error>::ok(kConclusionFallback);
    }

    auto parsed = parser::parse_tree_of_thoughts(response.value().content);
    if (parsed.is_err() || !parsed.value().conclusion ||
        parsed.value().conclusion->find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<std::string, Error>::ok(kConclusionFallback);
    }
    return Result<std::string, Error>::ok(*parsed.value().conclusion);
}

ReasoningResult TreeOfThoughtsEngine::reason(const std::string& goal,
                                             const std::string& context,
                                             const std::vector<tools::ToolSpec>& tools,
                                             const CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();

    auto fail = [&](std::string message, bool with_tree) {
        ReasoningResult result = ReasoningResult::failure(std::move(message));
        result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
        if (with_tree) result.tree = tree_;
        spdlog::warn("Tree of thoughts failed: {}", *result.error);
        return result;
    };

    auto strategy = strategy_from_string(config_.exploration_strategy);
    if (strategy.is_err()) {
        return fail(strategy.error().message, false);
    }

    spdlog::info("Starting tree of thoughts ({}) for goal: {}", strategy_to_string(strategy.value()), goal);

    try {
        reset(goal, strategy.value());

        auto response = caller_.complete({Message::user(root_prompt(goal, context, tools))}, cancellation);
        if (response.is_err()) {
            return fail("Failed to generate root thought: " + response.error().message, false);
        }

        auto parsed = parser::parse_tree_of_thoughts(response.value().content);
        if (parsed.is_err() || parsed.value().thoughts.empty()) {
            return fail("Failed to generate root thought from model response", false);
        }

        auto& root = parsed.value().thoughts.front();
        auto root_id = create_root(std::move(root.thought), root.type);
        if (root_id.is_err()) {
            return fail(root_id.error().message, true);
        }

        auto exploration = explore(strategy.value(), cancellation);
        if (!exploration.success) {
            return fail(exploration.error.value_or("Exploration failed"), true);
        }

        auto conclusion = synthesize_conclusion(exploration, context, tools, cancellation);
        if (conclusion.is_err()) {
            return fail(conclusion.error().message, true);
        }

        complete(exploration.best_path);

        ReasoningResult result;
        result.success = true;
        result.conclusion = std::move(conclusion).value();
        result.confidence = exploration.best_path_score;
        result.metadata = Json{
            {"nodes_explored", exploration.nodes_explored},
            {"max_depth_reached", exploration.max_depth_reached},
            {"best_path_score", exploration.best_path_score},
            {"strategy", std::string(strategy_to_string(strategy.value()))},
            {"reasoning_type", "TreeOfThoughts"}
        };
        result.tree = tree_;
        result.elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);

        spdlog::info("Tree of thoughts completed in {}ms: {} nodes explored, best score {:.2f}",
                     result.elapsed.count(), exploration.nodes_explored, exploration.best_path_score);
        return result;
    } catch (const std::exception& e) {
        return fail(std::string("Tree of thoughts error: ") + e.what(), true);
    }
}

}  // namespace turnkit::reasoning
