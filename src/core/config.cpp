#include "turnkit/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace turnkit::core {

namespace {

constexpr std::array<std::string_view, 4> kReasoningModes = {
    "none", "chain_of_thought", "tree_of_thoughts", "hybrid"
};

constexpr std::array<std::string_view, 5> kStrategies = {
    "best_first", "breadth_first", "depth_first", "beam_search", "monte_carlo"
};

template<size_t N>
bool one_of(const std::array<std::string_view, N>& names, const std::string& value) {
    return std::find(names.begin(), names.end(), value) != names.end();
}

Result<void, Error> invalid(const std::string& message) {
    return Result<void, Error>::err(ErrorCode::ConfigValidationFailed, message);
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    if (!result.empty() && result[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            result = std::string(home) + result.substr(1);
        }
    }

    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        result = match.prefix().str() + (var_value ? var_value : "") + match.suffix().str();
    }

    return result;
}

fs::path expand_path(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

fs::path Config::default_path() {
    return expand_path(fs::path("~/.turnkit/config.yaml"));
}

void Config::expand_paths() {
    storage.state_directory = expand_path(storage.state_directory);
}

Result<void, Error> Config::validate() const {
    if (agent.max_turns <= 0) {
        return invalid("agent.max_turns must be positive");
    }
    if (agent.llm_timeout_ms <= 0 || agent.tool_timeout_ms <= 0) {
        return invalid("agent deadlines must be positive");
    }
    if (agent.max_thoughts_length <= 0 || agent.max_summary_length <= 0 ||
        agent.max_final_length <= 0) {
        return invalid("agent field length caps must be positive");
    }
    if (agent.dedupe_ttl_ms < 0) {
        return invalid("agent.dedupe_ttl_ms must not be negative");
    }
    if (agent.max_tool_call_history <= 0 || agent.consecutive_failure_threshold <= 0) {
        return invalid("loop breaker window and threshold must be positive");
    }
    if (agent.loop_hard_stop_threshold < 0) {
        return invalid("agent.loop_hard_stop_threshold must not be negative");
    }

    if (!one_of(kReasoningModes, reasoning.mode)) {
        return invalid("unknown reasoning.mode: " + reasoning.mode);
    }
    if (!one_of(kStrategies, reasoning.exploration_strategy)) {
        return invalid("unknown reasoning.exploration_strategy: " + reasoning.exploration_strategy);
    }
    if (reasoning.max_reasoning_steps <= 0) {
        return invalid("reasoning.max_reasoning_steps must be positive");
    }
    if (reasoning.max_tree_depth <= 0 || reasoning.max_tree_nodes <= 0) {
        return invalid("reasoning tree limits must be positive");
    }
    if (reasoning.beam_width < 1) {
        return invalid("reasoning.beam_width must be at least 1");
    }
    if (reasoning.min_confidence < 0.0 || reasoning.min_confidence > 1.0) {
        return invalid("reasoning.min_confidence must be within [0, 1]");
    }

    if (concurrency.thread_pool_size < 1) {
        return invalid("concurrency.thread_pool_size must be at least 1");
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto node = root["agent"]) {
            auto& a = config.agent;
            a.max_turns = node["max_turns"].as<int>(a.max_turns);
            a.llm_timeout_ms = node["llm_timeout_ms"].as<int>(a.llm_timeout_ms);
            a.tool_timeout_ms = node["tool_timeout_ms"].as<int>(a.tool_timeout_ms);
            a.max_thoughts_length = node["max_thoughts_length"].as<int>(a.max_thoughts_length);
            a.max_summary_length = node["max_summary_length"].as<int>(a.max_summary_length);
            a.max_final_length = node["max_final_length"].as<int>(a.max_final_length);
            a.emit_public_status = node["emit_public_status"].as<bool>(a.emit_public_status);
            a.use_function_calling = node["use_function_calling"].as<bool>(a.use_function_calling);
            a.dedupe_ttl_ms = node["dedupe_ttl_ms"].as<int>(a.dedupe_ttl_ms);
            a.max_tool_call_history = node["max_tool_call_history"].as<int>(a.max_tool_call_history);
            a.consecutive_failure_threshold =
                node["consecutive_failure_threshold"].as<int>(a.consecutive_failure_threshold);
            a.loop_hard_stop_threshold =
                node["loop_hard_stop_threshold"].as<int>(a.loop_hard_stop_threshold);
            a.max_recent_turns = node["max_recent_turns"].as<int>(a.max_recent_turns);
        }

        if (auto node = root["reasoning"]) {
            auto& r = config.reasoning;
            r.mode = node["mode"].as<std::string>(r.mode);
            r.max_reasoning_steps = node["max_reasoning_steps"].as<int>(r.max_reasoning_steps);
            r.max_tree_depth = node["max_tree_depth"].as<int>(r.max_tree_depth);
            r.max_tree_nodes = node["max_tree_nodes"].as<int>(r.max_tree_nodes);
            r.exploration_strategy = node["exploration_strategy"].as<std::string>(r.exploration_strategy);
            r.beam_width = node["beam_width"].as<int>(r.beam_width);
            r.min_confidence = node["min_confidence"].as<double>(r.min_confidence);
            r.enable_validation = node["enable_validation"].as<bool>(r.enable_validation);
            r.monte_carlo_seed = node["monte_carlo_seed"].as<unsigned int>(r.monte_carlo_seed);
        }

        if (auto node = root["concurrency"]) {
            config.concurrency.thread_pool_size =
                node["thread_pool_size"].as<int>(config.concurrency.thread_pool_size);
        }

        if (auto node = root["storage"]) {
            config.storage.state_directory =
                node["state_directory"].as<std::string>(config.storage.state_directory.string());
        }

        if (auto node = root["observability"]) {
            config.observability.log_level =
                node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_pattern =
                node["log_pattern"].as<std::string>(config.observability.log_pattern);
        }

        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            Error error = validation.error();
            error.context = expanded.string();
            return Result<Config, Error>::err(std::move(error));
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    fs::path expanded = expand_path(path);

    try {
        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "agent" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_turns" << YAML::Value << agent.max_turns;
        out << YAML::Key << "llm_timeout_ms" << YAML::Value << agent.llm_timeout_ms;
        out << YAML::Key << "tool_timeout_ms" << YAML::Value << agent.tool_timeout_ms;
        out << YAML::Key << "max_thoughts_length" << YAML::Value << agent.max_thoughts_length;
        out << YAML::Key << "max_summary_length" << YAML::Value << agent.max_summary_length;
        out << YAML::Key << "max_final_length" << YAML::Value << agent.max_final_length;
        out << YAML::Key << "emit_public_status" << YAML::Value << agent.emit_public_status;
        out << YAML::Key << "use_function_calling" << YAML::Value << agent.use_function_calling;
        out << YAML::Key << "dedupe_ttl_ms" << YAML::Value << agent.dedupe_ttl_ms;
        out << YAML::Key << "max_tool_call_history" << YAML::Value << agent.max_tool_call_history;
        out << YAML::Key << "consecutive_failure_threshold" << YAML::Value << agent.consecutive_failure_threshold;
        out << YAML::Key << "loop_hard_stop_threshold" << YAML::Value << agent.loop_hard_stop_threshold;
        out << YAML::Key << "max_recent_turns" << YAML::Value << agent.max_recent_turns;
        out << YAML::EndMap;

        out << YAML::Key << "reasoning" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "mode" << YAML::Value << reasoning.mode;
        out << YAML::Key << "max_reasoning_steps" << YAML::Value << reasoning.max_reasoning_steps;
        out << YAML::Key << "max_tree_depth" << YAML::Value << reasoning.max_tree_depth;
        out << YAML::Key << "max_tree_nodes" << YAML::Value << reasoning.max_tree_nodes;
        out << YAML::Key << "exploration_strategy" << YAML::Value << reasoning.exploration_strategy;
        out << YAML::Key << "beam_width" << YAML::Value << reasoning.beam_width;
        out << YAML::Key << "min_confidence" << YAML::Value << reasoning.min_confidence;
        out << YAML::Key << "enable_validation" << YAML::Value << reasoning.enable_validation;
        out << YAML::Key << "monte_carlo_seed" << YAML::Value << reasoning.monte_carlo_seed;
        out << YAML::EndMap;

        out << YAML::Key << "concurrency" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "thread_pool_size" << YAML::Value << concurrency.thread_pool_size;
        out << YAML::EndMap;

        out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "state_directory" << YAML::Value << storage.state_directory.string();
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_pattern" << YAML::Value << observability.log_pattern;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            expanded.string()
        );
    }
}

}  // namespace turnkit::core
