#pragma once

#include "turnkit/core/types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace turnkit::agent {

using namespace turnkit::core;

// Count and wall time of one kind of operation
struct TimingStats {
    int64_t count = 0;
    Duration total{0};
    Duration max{0};

    void add(Duration elapsed);
    double average_ms() const;
    Json to_json() const;
};

struct PerformanceMetrics {
    TimingStats runs;
    TimingStats steps;
    TimingStats llm_calls;
    TimingStats tool_calls;
    TimingStats reasoning;
};

struct ToolMetrics {
    int64_t calls = 0;
    int64_t failures = 0;
    int64_t timeouts = 0;
    Duration total_time{0};
};

struct OperationalMetrics {
    int64_t runs_succeeded = 0;
    int64_t runs_failed = 0;
    int64_t steps_failed = 0;
    int64_t llm_calls_failed = 0;
    int64_t tool_calls_failed = 0;
    int64_t dedupe_hits = 0;
    int64_t dedupe_misses = 0;
    int64_t loop_detections = 0;
    std::map<std::string, int64_t> error_counts;  // keyed by error kind
    std::map<std::string, ToolMetrics> tools;

    double run_success_rate() const;
    double dedupe_hit_rate() const;
};

struct QualityMetrics {
    int64_t responses = 0;
    int64_t responses_rejected = 0;  // replies that failed strict parsing
    int64_t final_outputs = 0;
    int64_t final_output_chars = 0;
    int64_t reasoning_runs = 0;
    int64_t reasoning_failures = 0;
    double confidence_sum = 0.0;  // over successful reasoning runs

    double validation_pass_rate() const;
    double average_confidence() const;
};

struct MetricsSnapshot {
    PerformanceMetrics performance;
    OperationalMetrics operational;
    QualityMetrics quality;

    Json to_json() const;
};

// Aggregates what an orchestrator does across every agent it serves.
// Thread-safe; readers take a snapshot.
class MetricsCollector {
public:
    void record_run(bool succeeded, Duration elapsed, std::optional<std::string> error_kind = std::nullopt);
    void record_step(bool failed, Duration elapsed);
    void record_llm_call(bool succeeded, Duration elapsed, std::optional<std::string> error_kind = std::nullopt);
    void record_tool_call(const std::string& tool,
                          bool succeeded,
                          Duration elapsed,
                          std::optional<std::string> error_kind = std::nullopt);
    void record_dedupe(bool hit);
    void record_loop_detection();
    void record_response(bool valid);
    void record_final_output(size_t length);
    void record_reasoning(bool succeeded, double confidence, Duration elapsed);

    MetricsSnapshot snapshot() const;
    void reset();

private:
    void count_error(const std::optional<std::string>& kind);

    mutable std::mutex mutex_;
    MetricsSnapshot data_;
};

}  // namespace turnkit::agent
