#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "turnkit/reasoning/chain_of_thought.hpp"
#include "fakes.hpp"

using namespace turnkit::reasoning;
using turnkit::core::CancellationSource;
using turnkit::core::CancellationToken;
using turnkit::core::Duration;
using turnkit::core::Error;
using turnkit::core::ErrorCode;
using turnkit::core::ReasoningConfig;
using turnkit::core::Result;
using turnkit::core::ThreadPool;
using turnkit::llm::LLMCaller;
using turnkit::testing::RoutingLLMClient;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

Result<std::string, Error> reply(std::string text) {
    return Result<std::string, Error>::ok(std::move(text));
}

// Answers every phase with a well-formed reply and accepts the chain
Result<std::string, Error> well_formed(const std::string& prompt) {
    if (has(prompt, "Review the following reasoning chain")) {
        return reply(R"({"is_valid": true})");
    }
    if (has(prompt, "PHASE: analysis")) {
        return reply(R"({"reasoning": "Two numbers must be summed", "confidence": 0.6, "insights": ["needs add"]})");
    }
    if (has(prompt, "PHASE: planning")) {
        return reply(R"({"reasoning": "Call add once", "confidence": 0.7, "insights": []})");
    }
    if (has(prompt, "PHASE: strategy")) {
        return reply(R"({"reasoning": "Use add with both numbers", "confidence": 0.8, "insights": ["single call"]})");
    }
    if (has(prompt, "PHASE: evaluation")) {
        return reply(R"({"reasoning": "The plan is sound", "confidence": 0.9, "insights": [], "conclusion": "Use add"})");
    }
    return Result<std::string, Error>::err(ErrorCode::InvalidState, "Unexpected prompt");
}

struct Harness {
    explicit Harness(RoutingLLMClient::Router router, ReasoningConfig cfg = {})
        : client(std::make_shared<RoutingLLMClient>(std::move(router)))
        , caller(client, pool, Duration{2000})
        , config(cfg)
        , engine(caller, config)
    {
    }

    ReasoningResult run(const CancellationToken& token = CancellationToken::none()) {
        return engine.reason("add 2 and 3", "", {}, token);
    }

    ThreadPool pool{2};
    std::shared_ptr<RoutingLLMClient> client;
    LLMCaller caller;
    ReasoningConfig config;
    ChainOfThoughtEngine engine;
};

}  // namespace

TEST_CASE("All four phases run in order and the evaluation concludes", "[cot]") {
    Harness h(well_formed);
    auto result = h.run();

    REQUIRE(result.success);
    REQUIRE(result.conclusion == "Use add");
    REQUIRE_THAT(result.confidence, WithinAbs(0.9, 1e-9));
    REQUIRE(result.chain.has_value());
    REQUIRE(result.chain->is_complete());

    const auto& steps = result.chain->steps();
    REQUIRE(steps.size() == 4);
    REQUIRE(steps[0].type == ReasoningStepType::Analysis);
    REQUIRE(steps[1].type == ReasoningStepType::Planning);
    REQUIRE(steps[2].type == ReasoningStepType::Decision);
    REQUIRE(steps[3].type == ReasoningStepType::Evaluation);
    REQUIRE(steps[0].content == "Two numbers must be summed");

    REQUIRE(result.metadata["steps_completed"] == 4);
    REQUIRE(result.metadata["total_insights"] == 2);
    REQUIRE(result.metadata["reasoning_type"] == "ChainOfThought");
    // Four phases plus validation
    REQUIRE(h.client->calls() == 5);
}

TEST_CASE("Disabling validation skips the review call", "[cot]") {
    ReasoningConfig config;
    config.enable_validation = false;
    Harness h(well_formed, config);

    REQUIRE(h.run().success);
    REQUIRE(h.client->calls() == 4);
}

TEST_CASE("The step ceiling cuts the chain short", "[cot]") {
    ReasoningConfig config;
    config.max_reasoning_steps = 2;
    Harness h(well_formed, config);

    auto result = h.run();
    REQUIRE(result.success);
    REQUIRE(result.chain->steps().size() == 2);
    REQUIRE(result.conclusion == "Call add once");
    REQUIRE_THAT(result.confidence, WithinAbs(0.7, 1e-9));
}

TEST_CASE("Without an explicit conclusion the evaluation text is used", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "PHASE: evaluation")) {
            return reply(R"({"reasoning": "Adding is enough", "confidence": 0.85})");
        }
        return well_formed(prompt);
    });

    auto result = h.run();
    REQUIRE(result.success);
    REQUIRE(result.conclusion == "Adding is enough");
}

TEST_CASE("Later phases see the earlier steps", "[cot]") {
    ReasoningChain chain("goal");
    chain.add_step("first look", ReasoningStepType::Analysis, 0.5);

    const auto& planning = ChainOfThoughtEngine::phases()[1];
    auto prompt = ChainOfThoughtEngine::build_phase_prompt(planning, "goal", "", {}, chain);
    REQUIRE_THAT(prompt, ContainsSubstring("PREVIOUS STEPS:\n1. [analysis] first look"));
    REQUIRE_THAT(prompt, ContainsSubstring("PHASE: planning"));
    REQUIRE_THAT(prompt, ContainsSubstring("CONTEXT: (none)"));

    auto first = ChainOfThoughtEngine::build_phase_prompt(ChainOfThoughtEngine::phases()[0], "goal", "", {}, ReasoningChain("goal"));
    REQUIRE_FALSE(has(first, "PREVIOUS STEPS"));
    REQUIRE_FALSE(has(first, "\"conclusion\""));

    auto last = ChainOfThoughtEngine::build_phase_prompt(ChainOfThoughtEngine::phases()[3], "goal", "", {}, chain);
    REQUIRE(has(last, "\"conclusion\""));
}

TEST_CASE("A failed phase call names the phase", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "PHASE: planning")) {
            return Result<std::string, Error>::err(ErrorCode::LLMConnectionFailed, "boom");
        }
        return well_formed(prompt);
    });

    auto result = h.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == std::optional<std::string>("Reasoning phase 'planning' failed: boom"));
    REQUIRE(result.chain.has_value());
    REQUIRE(result.chain->steps().size() == 1);
}

TEST_CASE("A blank phase reply fails the chain", "[cot]") {
    Harness h([](const std::string&) { return reply("   \n"); });

    auto result = h.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == std::optional<std::string>("Empty model response in reasoning phase 'analysis'"));
}

TEST_CASE("Plain-text replies still become steps", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "Review the following reasoning chain")) {
            return reply(R"({"is_valid": true})");
        }
        return reply("I think we should add the numbers.");
    });

    auto result = h.run();
    REQUIRE(result.success);
    REQUIRE(result.chain->steps().size() == 4);
    REQUIRE(result.conclusion == "I think we should add the numbers.");
}

TEST_CASE("An invalid chain below the confidence floor fails", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "Review the following reasoning chain")) {
            return reply(R"({"is_valid": false, "error": "skips a step"})");
        }
        if (has(prompt, "PHASE: evaluation")) {
            return reply(R"({"reasoning": "Unsure", "confidence": 0.4, "conclusion": "Maybe add"})");
        }
        return well_formed(prompt);
    });

    auto result = h.run();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == std::optional<std::string>("Reasoning confidence 0.40 below threshold 0.70"));
}

TEST_CASE("An invalid chain with high confidence is kept", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "Review the following reasoning chain")) {
            return reply(R"({"is_valid": false, "error": "minor gap"})");
        }
        return well_formed(prompt);
    });

    auto result = h.run();
    REQUIRE(result.success);
    REQUIRE(result.conclusion == "Use add");
}

TEST_CASE("A failing validation call accepts the chain", "[cot]") {
    Harness h([](const std::string& prompt) {
        if (has(prompt, "Review the following reasoning chain")) {
            return Result<std::string, Error>::err(ErrorCode::LLMConnectionFailed, "validator offline");
        }
        return well_formed(prompt);
    });

    REQUIRE(h.run().success);
}

TEST_CASE("A cancelled token stops before any call", "[cot]") {
    Harness h(well_formed);
    CancellationSource source;
    source.cancel();

    auto result = h.run(source.token());
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == std::optional<std::string>("Reasoning cancelled"));
    REQUIRE(h.client->calls() == 0);
}
