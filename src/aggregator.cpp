#include "infer_bench/aggregator.hpp"

#include <algorithm>

namespace infer_bench {

namespace {

double ToMillis(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

// Negative or NaN readings never lower the peak below zero.
void RaisePeak(double& peak, double value) {
    if (value > peak) peak = value;
}

}

void Aggregator::Record(const RequestOutcome& outcome) {
    std::lock_guard<std::mutex> lk(mu_);
    ++total_requests_;
    if (!outcome.succeeded) return;

    if (success_count_ == 0) {
        latency_max_ = outcome.elapsed;
        latency_min_ = outcome.elapsed;
    } else {
        latency_max_ = std::max(latency_max_, outcome.elapsed);
        latency_min_ = std::min(latency_min_, outcome.elapsed);
    }
    latency_sum_ += outcome.elapsed;
    ++success_count_;
}

void Aggregator::Record(const ResourceSample& sample) {
    std::lock_guard<std::mutex> lk(mu_);
    RaisePeak(peak_.cpu_load, sample.cpu_load);
    RaisePeak(peak_.memory_used_pct, sample.memory_used_pct);
    RaisePeak(peak_.accelerator_load, sample.accelerator_load);
    RaisePeak(peak_.accelerator_memory_used, sample.accelerator_memory_used);
    ++sample_count_;
}

TrialResult Aggregator::Reduce(const TrialConfig& config, std::chrono::nanoseconds elapsed) const {
    std::lock_guard<std::mutex> lk(mu_);
    TrialResult r;
    r.config = config;
    r.peak_resources = peak_;
    r.sample_count = sample_count_;
    r.total_requests = total_requests_;
    r.success_count = success_count_;
    r.failure_count = total_requests_ - success_count_;

    if (success_count_ > 0) {
        r.avg_latency_ms = ToMillis(latency_sum_) / static_cast<double>(success_count_);
        r.max_latency_ms = ToMillis(latency_max_);
        r.min_latency_ms = ToMillis(latency_min_);
    }
    if (total_requests_ > 0) {
        r.success_rate_pct = static_cast<double>(success_count_) / static_cast<double>(total_requests_) * 100.0;
    }

    r.elapsed_seconds = std::chrono::duration<double>(elapsed).count();
    r.throughput_rps = r.elapsed_seconds > 0 ? static_cast<double>(success_count_) / r.elapsed_seconds : 0.0;
    return r;
}

std::size_t Aggregator::TotalRequests() const {
    std::lock_guard<std::mutex> lk(mu_);
    return total_requests_;
}

std::size_t Aggregator::SampleCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sample_count_;
}

}
