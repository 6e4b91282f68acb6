#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>

namespace turnkit::core {

namespace fs = std::filesystem;

// Turn loop configuration
struct AgentConfig {
    int max_turns = 100;
    int llm_timeout_ms = 300000;
    int tool_timeout_ms = 120000;

    // Field length caps applied when parsing model output
    int max_thoughts_length = 20000;
    int max_summary_length = 40000;
    int max_final_length = 50000;

    bool emit_public_status = true;
    bool use_function_calling = true;

    // Idempotency cache
    int dedupe_ttl_ms = 300000;

    // Loop breaker
    int max_tool_call_history = 20;
    int consecutive_failure_threshold = 3;
    int loop_hard_stop_threshold = 0;  // 0 keeps the detector soft

    // History window handed to the message builder
    int max_recent_turns = 10;
};

// Deliberation configuration
struct ReasoningConfig {
    std::string mode = "none";  // none | chain_of_thought | tree_of_thoughts | hybrid
    int max_reasoning_steps = 10;
    int max_tree_depth = 5;
    int max_tree_nodes = 50;
    std::string exploration_strategy = "best_first";
    int beam_width = 3;
    double min_confidence = 0.7;
    bool enable_validation = true;
    unsigned int monte_carlo_seed = 0;  // 0 seeds from random_device
};

// Concurrency configuration
struct ConcurrencyConfig {
    int thread_pool_size = 4;
};

// State store configuration
struct StorageConfig {
    fs::path state_directory = "~/.turnkit/state";
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // trace, debug, info, warn, error
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

// Main configuration
struct Config {
    AgentConfig agent;
    ReasoningConfig reasoning;
    ConcurrencyConfig concurrency;
    StorageConfig storage;
    ObservabilityConfig observability;

    // Load configuration from a YAML file
    static Result<Config, Error> load(const fs::path& path);

    // Load, falling back to defaults if the file is missing or invalid
    static Config load_or_default(const fs::path& path);

    Result<void, Error> save(const fs::path& path) const;

    static fs::path default_path();

    void expand_paths();

    Result<void, Error> validate() const;
};

// Expand ~ and ${VAR} in paths
std::string expand_path(const std::string& path);
fs::path expand_path(const fs::path& path);

}  // namespace turnkit::core
