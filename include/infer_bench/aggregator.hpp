#pragma once

#include "infer_bench/types.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>

namespace infer_bench {

// Per-trial accumulator. Record() is safe from any number of producer threads;
// Reduce() must run only after every producer has been joined.
class Aggregator {
public:
    Aggregator() = default;
    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    void Record(const RequestOutcome& outcome);
    void Record(const ResourceSample& sample);

    TrialResult Reduce(const TrialConfig& config, std::chrono::nanoseconds elapsed) const;

    std::size_t TotalRequests() const;
    std::size_t SampleCount() const;

private:
    mutable std::mutex mu_;

    std::size_t total_requests_ = 0;
    std::size_t success_count_ = 0;
    std::chrono::nanoseconds latency_sum_{0};
    std::chrono::nanoseconds latency_max_{0};
    std::chrono::nanoseconds latency_min_{0};

    ResourceSample peak_{};
    std::size_t sample_count_ = 0;
};

}
