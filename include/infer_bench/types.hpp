#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace infer_bench {

// Raised for malformed configuration: empty matrix, non-positive concurrency or durations.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct TrialConfig {
    std::string workload_id;
    std::size_t concurrency = 1;
};

inline bool operator==(const TrialConfig& a, const TrialConfig& b) {
    return a.workload_id == b.workload_id && a.concurrency == b.concurrency;
}

enum class FailureKind {
    Timeout,
    Network,
    HttpStatus,
    MalformedResponse,
    Cancelled,
    Internal,
};

const char* ToString(FailureKind kind) noexcept;

struct RequestError {
    FailureKind kind = FailureKind::Internal;
    std::string message;
};

struct RequestOutcome {
    std::chrono::nanoseconds elapsed{0};
    bool succeeded = false;
    std::optional<RequestError> error;

    static RequestOutcome Success(std::chrono::nanoseconds elapsed) {
        return RequestOutcome{elapsed, true, std::nullopt};
    }
    static RequestOutcome Failure(std::chrono::nanoseconds elapsed, FailureKind kind, std::string message) {
        return RequestOutcome{elapsed, false, RequestError{kind, std::move(message)}};
    }

    bool Cancelled() const noexcept {
        return error.has_value() && error->kind == FailureKind::Cancelled;
    }
};

struct ResourceSample {
    double cpu_load = 0.0;                // percent
    double memory_used_pct = 0.0;         // percent
    double accelerator_load = 0.0;        // percent
    double accelerator_memory_used = 0.0; // MiB
};

// Probe output; an empty field means that dimension could not be measured.
struct ProbeReading {
    std::optional<double> cpu_load;
    std::optional<double> memory_used_pct;
    std::optional<double> accelerator_load;
    std::optional<double> accelerator_memory_used;
};

struct TrialResult {
    TrialConfig config;
    ResourceSample peak_resources;
    std::size_t sample_count = 0;

    double avg_latency_ms = 0.0;
    double max_latency_ms = 0.0;
    double min_latency_ms = 0.0;
    double success_rate_pct = 0.0;
    std::size_t total_requests = 0;
    std::size_t success_count = 0;
    std::size_t failure_count = 0;

    double elapsed_seconds = 0.0;
    double throughput_rps = 0.0;

    bool faulted = false;
    std::string fault_message;
};

}
