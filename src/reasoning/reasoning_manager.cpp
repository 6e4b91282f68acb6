#include "turnkit/reasoning/reasoning_manager.hpp"

#include <spdlog/spdlog.h>

#include <future>

namespace turnkit::reasoning {

namespace {

constexpr double kChainWeight = 0.6;
constexpr double kTreeWeight = 0.4;

}  // namespace

ReasoningManager::ReasoningManager(llm::LLMCaller& caller, const ReasoningConfig& config)
    : chain_(std::make_unique<ChainOfThoughtEngine>(caller, config))
    , tree_(std::make_unique<TreeOfThoughtsEngine>(caller, config))
{
    auto mode = mode_from_string(config.mode);
    if (mode.is_err()) {
        spdlog::warn("Unknown reasoning mode '{}', reasoning disabled", config.mode);
    } else {
        mode_ = mode.value();
    }
}

ReasoningResult ReasoningManager::reason(const std::string& goal,
                                         const std::string& context,
                                         const std::vector<tools::ToolSpec>& tools,
                                         const CancellationToken& cancellation) {
    return reason(mode_, goal, context, tools, cancellation);
}

ReasoningResult ReasoningManager::reason(ReasoningMode mode,
                                         const std::string& goal,
                                         const std::string& context,
                                         const std::vector<tools::ToolSpec>& tools,
                                         const CancellationToken& cancellation) {
    switch (mode) {
        case ReasoningMode::None:
            return ReasoningResult::failure("Reasoning is disabled");
        case ReasoningMode::ChainOfThought:
            return chain_->reason(goal, context, tools, cancellation);
        case ReasoningMode::TreeOfThoughts:
            return tree_->reason(goal, context, tools, cancellation);
        case ReasoningMode::Hybrid:
            return reason_hybrid(goal, context, tools, cancellation);
    }
    return ReasoningResult::failure("Unsupported reasoning mode");
}

ReasoningResult ReasoningManager::reason_hybrid(const std::string& goal,
                                                const std::string& context,
                                                const std::vector<tools::ToolSpec>& tools,
                                                const CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Starting hybrid reasoning for goal: {}", goal);

    // Dedicated threads: both engines block on model calls run by the shared pool
    auto chain_future = std::async(std::launch::async, [&]() {
        return chain_->reason(goal, context, tools, cancellation);
    });
    auto tree_future = std::async(std::launch::async, [&]() {
        return tree_->reason(goal, context, tools, cancellation);
    });

    ReasoningResult chain_result = chain_future.get();
    ReasoningResult tree_result = tree_future.get();

    return combine(std::move(chain_result), std::move(tree_result),
                   std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start));
}

ReasoningResult ReasoningManager::combine(ReasoningResult chain, ReasoningResult tree, Duration elapsed) {
    ReasoningResult result;
    result.elapsed = elapsed;
    result.chain = std::move(chain.chain);
    result.tree = std::move(tree.tree);

    if (!chain.success && !tree.success) {
        result.error = "All reasoning approaches failed";
        result.metadata = Json{
            {"method", "hybrid"},
            {"reasoning_type", "Hybrid"},
            {"chain_error", chain.error.value_or("")},
            {"tree_error", tree.error.value_or("")}
        };
        spdlog::warn("Hybrid reasoning failed: chain: {}; tree: {}",
                     chain.error.value_or("?"), tree.error.value_or("?"));
        return result;
    }

    result.success = true;
    if (chain.success && tree.success) {
        result.conclusion = "Analysis: " + chain.conclusion + "\n\nExploration: " + tree.conclusion;
        result.confidence = kChainWeight * chain.confidence + kTreeWeight * tree.confidence;
    } else if (chain.success) {
        result.conclusion = chain.conclusion;
        result.confidence = chain.confidence;
    } else {
        result.conclusion = tree.conclusion;
        result.confidence = tree.confidence;
    }

    result.metadata = Json{
        {"method", "hybrid"},
        {"reasoning_type", "Hybrid"},
        {"chain_confidence", chain.confidence},
        {"tree_confidence", tree.confidence},
        {"combined_confidence", result.confidence},
        {"chain_success", chain.success},
        {"tree_success", tree.success}
    };

    spdlog::info("Hybrid reasoning completed in {}ms with confidence {:.2f}",
                 elapsed.count(), result.confidence);
    return result;
}

}  // namespace turnkit::reasoning
