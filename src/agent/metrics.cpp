#include "turnkit/agent/metrics.hpp"

#include <algorithm>

namespace turnkit::agent {

namespace {

double ratio(int64_t part, int64_t whole) {
    return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

}  // namespace

void TimingStats::add(Duration elapsed) {
    count++;
    total += elapsed;
    max = std::max(max, elapsed);
}

double TimingStats::average_ms() const {
    return count > 0 ? static_cast<double>(total.count()) / static_cast<double>(count) : 0.0;
}

Json TimingStats::to_json() const {
    return Json{
        {"count", count},
        {"total_ms", total.count()},
        {"max_ms", max.count()},
        {"average_ms", average_ms()}
    };
}

double OperationalMetrics::run_success_rate() const {
    return ratio(runs_succeeded, runs_succeeded + runs_failed);
}

double OperationalMetrics::dedupe_hit_rate() const {
    return ratio(dedupe_hits, dedupe_hits + dedupe_misses);
}

double QualityMetrics::validation_pass_rate() const {
    return ratio(responses - responses_rejected, responses);
}

double QualityMetrics::average_confidence() const {
    const auto succeeded = reasoning_runs - reasoning_failures;
    return succeeded > 0 ? confidence_sum / static_cast<double>(succeeded) : 0.0;
}

Json MetricsSnapshot::to_json() const {
    Json tools = Json::object();
    for (const auto& [name, tool] : operational.tools) {
        tools[name] = Json{
            {"calls", tool.calls},
            {"failures", tool.failures},
            {"timeouts", tool.timeouts},
            {"total_ms", tool.total_time.count()}
        };
    }

    return Json{
        {"performance", {
            {"runs", performance.runs.to_json()},
            {"steps", performance.steps.to_json()},
            {"llm_calls", performance.llm_calls.to_json()},
            {"tool_calls", performance.tool_calls.to_json()},
            {"reasoning", performance.reasoning.to_json()}
        }},
        {"operational", {
            {"runs_succeeded", operational.runs_succeeded},
            {"runs_failed", operational.runs_failed},
            {"run_success_rate", operational.run_success_rate()},
            {"steps_failed", operational.steps_failed},
            {"llm_calls_failed", operational.llm_calls_failed},
            {"tool_calls_failed", operational.tool_calls_failed},
            {"dedupe_hits", operational.dedupe_hits},
            {"dedupe_misses", operational.dedupe_misses},
            {"dedupe_hit_rate", operational.dedupe_hit_rate()},
            {"loop_detections", operational.loop_detections},
            {"error_counts", operational.error_counts},
            {"tools", tools}
        }},
        {"quality", {
            {"responses", quality.responses},
            {"responses_rejected", quality.responses_rejected},
            {"validation_pass_rate", quality.validation_pass_rate()},
            {"final_outputs", quality.final_outputs},
            {"final_output_chars", quality.final_output_chars},
            {"reasoning_runs", quality.reasoning_runs},
            {"reasoning_failures", quality.reasoning_failures},
            {"average_confidence", quality.average_confidence()}
        }}
    };
}

void MetricsCollector::record_run(bool succeeded, Duration elapsed, std::optional<std::string> error_kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.performance.runs.add(elapsed);
    if (succeeded) {
        data_.operational.runs_succeeded++;
    } else {
        data_.operational.runs_failed++;
        count_error(error_kind);
    }
}

void MetricsCollector::record_step(bool failed, Duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.performance.steps.add(elapsed);
    if (failed) {
        data_.operational.steps_failed++;
    }
}

void MetricsCollector::record_llm_call(bool succeeded, Duration elapsed, std::optional<std::string> error_kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.performance.llm_calls.add(elapsed);
    if (!succeeded) {
        data_.operational.llm_calls_failed++;
        count_error(error_kind);
    }
}

void MetricsCollector::record_tool_call(const std::string& tool,
                                        bool succeeded,
                                        Duration elapsed,
                                        std::optional<std::string> error_kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.performance.tool_calls.add(elapsed);

    auto& per_tool = data_.operational.tools[tool];
    per_tool.calls++;
    per_tool.total_time += elapsed;

    if (!succeeded) {
        per_tool.failures++;
        if (error_kind == std::optional<std::string>("timeout")) {
            per_tool.timeouts++;
        }
        data_.operational.tool_calls_failed++;
        count_error(error_kind);
    }
}

void MetricsCollector::record_dedupe(bool hit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hit) {
        data_.operational.dedupe_hits++;
    } else {
        data_.operational.dedupe_misses++;
    }
}

void MetricsCollector::record_loop_detection() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.operational.loop_detections++;
}

void MetricsCollector::record_response(bool valid) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.quality.responses++;
    if (!valid) {
        data_.quality.responses_rejected++;
    }
}

void MetricsCollector::record_final_output(size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.quality.final_outputs++;
    data_.quality.final_output_chars += static_cast<int64_t>(length);
}

void MetricsCollector::record_reasoning(bool succeeded, double confidence, Duration elapsed) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.performance.reasoning.add(elapsed);
    data_.quality.reasoning_runs++;
    if (succeeded) {
        data_.quality.confidence_sum += confidence;
    } else {
        data_.quality.reasoning_failures++;
    }
}

MetricsSnapshot MetricsCollector::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = MetricsSnapshot{};
}

// Caller holds mutex_
void MetricsCollector::count_error(const std::optional<std::string>& kind) {
    data_.operational.error_counts[kind.value_or("unknown")]++;
}

}  // namespace turnkit::agent
