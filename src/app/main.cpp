#include "turnkit/agent/message_builder.hpp"
#include "turnkit/agent/orchestrator.hpp"
#include "turnkit/agent/status.hpp"
#include "turnkit/core/config.hpp"
#include "turnkit/core/logging.hpp"
#include "turnkit/core/thread_pool.hpp"
#include "turnkit/llm/llm_caller.hpp"
#include "turnkit/llm/llm_client.hpp"
#include "turnkit/memory/state_store.hpp"
#include "turnkit/tools/tool_executor.hpp"
#include "turnkit/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

using namespace turnkit;
using namespace turnkit::core;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitRunFailed = 1;
constexpr int kExitUsage = 2;

// Replays canned model replies in order; runs dry once they are used up
class ScriptedLLMClient : public llm::LLMClient {
public:
    explicit ScriptedLLMClient(std::deque<std::string> replies) : replies_(std::move(replies)) {}

    std::string name() const override { return "script"; }

    Result<LLMResponse, Error> complete(const std::vector<Message>& /*messages*/,
                                        const CancellationToken& cancellation) override {
        if (cancellation.is_cancelled()) {
            return Result<LLMResponse, Error>::err(ErrorCode::Cancelled, "Cancelled", name());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (replies_.empty()) {
            return Result<LLMResponse, Error>::err(
                ErrorCode::LLMConnectionFailed, "Script exhausted", name());
        }

        LLMResponse response;
        response.content = std::move(replies_.front());
        replies_.pop_front();
        return Result<LLMResponse, Error>::ok(std::move(response));
    }

private:
    std::mutex mutex_;
    std::deque<std::string> replies_;
};

// Replies are separated by lines holding only "---"
Result<std::deque<std::string>, Error> load_script(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<std::deque<std::string>, Error>::err(
            ErrorCode::FileReadFailed, "Cannot open script", path);
    }

    std::deque<std::string> replies;
    std::string current;
    std::string line;
    while (std::getline(file, line)) {
        if (line == "---") {
            if (!current.empty()) {
                replies.push_back(std::move(current));
            }
            current.clear();
            continue;
        }
        current += line;
        current += '\n';
    }
    if (!current.empty()) {
        replies.push_back(std::move(current));
    }

    if (replies.empty()) {
        return Result<std::deque<std::string>, Error>::err(
            ErrorCode::InvalidArgument, "Script holds no replies", path);
    }
    return Result<std::deque<std::string>, Error>::ok(std::move(replies));
}

Result<void, Error> register_demo_tools(tools::ToolRegistry& registry) {
    tools::ToolSpec add;
    add.name = "add";
    add.description = "Add two numbers";
    add.parameters = {
        {"a", "First addend", tools::ParamType::Number, true, std::nullopt},
        {"b", "Second addend", tools::ParamType::Number, true, std::nullopt},
    };

    auto added = registry.register_tool(add, [](const Json& params, const tools::ToolContext&) {
        return Result<Json, Error>::ok(Json{{"sum", params["a"].get<double>() + params["b"].get<double>()}});
    });
    if (added.is_err()) {
        return added;
    }

    tools::ToolSpec concat;
    concat.name = "concat";
    concat.description = "Join a list of strings with an optional separator";
    concat.parameters = {
        {"parts", "Strings to join", tools::ParamType::Array, true, std::nullopt},
        {"separator", "Inserted between parts", tools::ParamType::String, false, std::nullopt},
    };

    return registry.register_tool(concat, [](const Json& params, const tools::ToolContext&) {
        const std::string separator = params.value("separator", "");
        std::string joined;
        bool first = true;
        for (const auto& part : params["parts"]) {
            if (!part.is_string()) {
                return Result<Json, Error>::err(ErrorCode::InvalidArgument, "parts must be strings");
            }
            if (!first) joined += separator;
            joined += part.get<std::string>();
            first = false;
        }
        return Result<Json, Error>::ok(Json{{"text", joined}});
    });
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --script <file> --goal <text> [--config <file>] [--agent <id>]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string script_path;
    std::string goal;
    std::string agent_id = "replay";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitSuccess;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        }
        std::string value = argv[++i];
        if (arg == "--config") {
            config_path = value;
        } else if (arg == "--script") {
            script_path = value;
        } else if (arg == "--goal") {
            goal = value;
        } else if (arg == "--agent") {
            agent_id = value;
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    if (script_path.empty() || goal.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    Config config;
    if (!config_path.empty()) {
        auto loaded = Config::load(config_path);
        if (loaded.is_err()) {
            std::cerr << "Config error: " << loaded.error().full_message() << "\n";
            return kExitUsage;
        }
        config = std::move(loaded).value();
    } else {
        config.expand_paths();
    }

    init_logging(config.observability);

    auto script = load_script(script_path);
    if (script.is_err()) {
        spdlog::error("{}", script.error().full_message());
        return kExitUsage;
    }

    ThreadPool pool(static_cast<size_t>(config.concurrency.thread_pool_size));

    // Replayed replies carry no native function calls
    config.agent.use_function_calling = false;
    auto client = std::make_shared<ScriptedLLMClient>(std::move(script).value());
    llm::LLMCaller caller(client, pool, Duration{config.agent.llm_timeout_ms});

    tools::ToolRegistry registry;
    auto registered = register_demo_tools(registry);
    if (registered.is_err()) {
        spdlog::error("Tool registration failed: {}", registered.error().full_message());
        return kExitRunFailed;
    }
    tools::ToolExecutor executor(pool, Duration{config.agent.tool_timeout_ms});

    memory::FileStateStore store(config.storage.state_directory);

    agent::StatusBroadcaster status(config.agent.emit_public_status);
    status.subscribe([](const agent::StatusUpdate& update) {
        spdlog::info("[status] turn {}: {}", update.turn_index, update.status_title);
    });

    agent::DefaultMessageBuilder messages(config.agent.max_recent_turns, config.agent.emit_public_status);

    agent::Orchestrator orchestrator(config, caller, registry, executor, store, status, messages);
    orchestrator.events().subscribe([](const agent::AgentEvent& event) {
        spdlog::debug("[event] {}", event.to_json().dump());
    });

    auto result = orchestrator.run(agent_id, goal);

    pool.shutdown();
    spdlog::info("Run metrics: {}", orchestrator.metrics().snapshot().to_json().dump());

    if (!result.succeeded) {
        spdlog::error("Run failed after {} turns: {}", result.turns,
                      result.error ? result.error->full_message() : "unknown error");
        return kExitRunFailed;
    }

    std::cout << result.final_output.value_or("") << std::endl;
    return kExitSuccess;
}
