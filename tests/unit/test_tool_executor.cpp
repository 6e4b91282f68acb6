#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "turnkit/tools/tool_executor.hpp"

#include <stdexcept>
#include <thread>

using namespace turnkit::tools;
using Catch::Matchers::ContainsSubstring;

namespace {

RegisteredTool make_tool(std::string name, ToolHandler handler, std::vector<ParamSpec> params = {}) {
    RegisteredTool tool;
    tool.spec.name = std::move(name);
    tool.spec.parameters = std::move(params);
    tool.handler = std::move(handler);
    return tool;
}

ToolCallRequest request(std::string tool, Json params = Json::object()) {
    return ToolCallRequest{std::move(tool), std::move(params), "turn_0_test"};
}

RegisteredTool adder() {
    return make_tool(
        "add",
        [](const Json& params, const ToolContext&) {
            return Result<Json, Error>::ok(Json{{"sum", params["a"].get<double>() + params["b"].get<double>()}});
        },
        {
            {"a", "", ParamType::Number, true, std::nullopt},
            {"b", "", ParamType::Number, true, std::nullopt}
        });
}

}  // namespace

TEST_CASE("Successful handlers produce a successful result", "[executor]") {
    ThreadPool pool(2);
    ToolExecutor executor(pool, Duration{1000});

    auto result = executor.execute(adder(), request("add", {{"a", 2}, {"b", 3}}), "agent", CancellationToken::none());

    REQUIRE(result.is_ok());
    const auto& r = result.value();
    REQUIRE(r.success);
    REQUIRE(r.output["sum"] == 5.0);
    REQUIRE(r.tool == "add");
    REQUIRE(r.turn_id == "turn_0_test");
    REQUIRE_FALSE(r.error.has_value());
}

TEST_CASE("Handlers see the agent and turn", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto tool = make_tool("whoami", [](const Json&, const ToolContext& ctx) {
        return Result<Json, Error>::ok(Json{{"agent", ctx.agent_id}, {"turn", ctx.turn_id}});
    });

    auto result = executor.execute(tool, request("whoami"), "agent-7", CancellationToken::none());
    REQUIRE(result.value().output["agent"] == "agent-7");
    REQUIRE(result.value().output["turn"] == "turn_0_test");
}

TEST_CASE("Invalid arguments never reach the handler", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto result = executor.execute(adder(), request("add", {{"a", 1}}), "agent", CancellationToken::none());

    REQUIRE(result.is_ok());
    const auto& r = result.value();
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output["type"] == "validation_error");
    REQUIRE(r.output["missing"] == Json::array({"b"}));
    REQUIRE_THAT(*r.error, ContainsSubstring("missing: b"));
}

TEST_CASE("Handler errors become failed results", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto tool = make_tool("flaky", [](const Json&, const ToolContext&) {
        return Result<Json, Error>::err(ErrorCode::InvalidArgument, "quota exhausted");
    });

    auto result = executor.execute(tool, request("flaky"), "agent", CancellationToken::none());
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value().success);
    REQUIRE(result.value().error == std::optional<std::string>("quota exhausted"));
    REQUIRE(result.value().output["type"] == "tool_error");
}

TEST_CASE("Exceptions thrown by a handler are contained", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto tool = make_tool("thrower", [](const Json&, const ToolContext&) -> Result<Json, Error> {
        throw std::runtime_error("disk on fire");
    });

    auto result = executor.execute(tool, request("thrower"), "agent", CancellationToken::none());
    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value().success);
    REQUIRE(result.value().error == std::optional<std::string>("disk on fire"));
    REQUIRE(result.value().output["type"] == "tool_error");
}

TEST_CASE("Slow handlers time out and are told to stop", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto stopped = std::make_shared<std::atomic<bool>>(false);
    auto tool = make_tool("sleepy", [stopped](const Json&, const ToolContext& ctx) {
        for (int i = 0; i < 200 && !ctx.cancellation.is_cancelled(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        stopped->store(ctx.cancellation.is_cancelled());
        return Result<Json, Error>::ok(Json::object());
    });
    tool.spec.timeout_ms = 50;

    auto result = executor.execute(tool, request("sleepy"), "agent", CancellationToken::none());

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.value().success);
    REQUIRE(result.value().output["type"] == "timeout");
    REQUIRE(result.value().output["timeout_ms"] == 50);
    REQUIRE(result.value().error == std::optional<std::string>("Tool 'sleepy' timed out after 50ms"));

    // Joining the pool waits for the handler to notice
    pool.shutdown();
    REQUIRE(stopped->load());
    REQUIRE(executor.get_stats().timeouts == 1);
}

TEST_CASE("Caller cancellation is an error, not a result", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});
    CancellationSource source;
    source.cancel();

    auto result = executor.execute(adder(), request("add", {{"a", 1}, {"b", 2}}), "agent", source.token());
    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::Cancelled);
}

TEST_CASE("Per-tool deadlines override the default", "[executor]") {
    ThreadPool pool(1);
    ToolExecutor executor(pool, Duration{1000});

    auto tool = adder();
    REQUIRE(executor.timeout_for(tool.spec) == Duration{1000});
    tool.spec.timeout_ms = 250;
    REQUIRE(executor.timeout_for(tool.spec) == Duration{250});
    tool.spec.timeout_ms = 0;
    REQUIRE(executor.timeout_for(tool.spec) == Duration{1000});
}

TEST_CASE("Stats count each outcome", "[executor]") {
    ThreadPool pool(2);
    ToolExecutor executor(pool, Duration{1000});

    REQUIRE(executor.execute(adder(), request("add", {{"a", 1}, {"b", 2}}), "agent", CancellationToken::none()).is_ok());
    REQUIRE(executor.execute(adder(), request("add", {{"a", 1}}), "agent", CancellationToken::none()).is_ok());

    auto stats = executor.get_stats();
    REQUIRE(stats.total_executions == 2);
    REQUIRE(stats.successful == 1);
    REQUIRE(stats.failed == 1);
    REQUIRE(stats.timeouts == 0);

    executor.reset_stats();
    REQUIRE(executor.get_stats().total_executions == 0);
}
