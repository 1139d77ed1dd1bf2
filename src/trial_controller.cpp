#include "infer_bench/trial_controller.hpp"

#include "infer_bench/aggregator.hpp"
#include "infer_bench/cancel_token.hpp"
#include "infer_bench/resource_sampler.hpp"
#include "infer_bench/workload_generator.hpp"
#include "logger.hpp"

#include <string>
#include <thread>

namespace infer_bench {

TrialController::TrialController(TrialTiming timing, WorkloadGenerator& generator, ResourceProbe& probe)
    : timing_(timing), generator_(generator), probe_(probe) {
    if (timing_.trial_duration.count() <= 0) throw ConfigError("trial duration must be positive");
    if (timing_.sample_interval.count() <= 0) throw ConfigError("sample interval must be positive");
    if (timing_.cooldown.count() < 0) throw ConfigError("cool-down must not be negative");
    if (timing_.trial_duration > kMaxDuration || timing_.sample_interval > kMaxDuration ||
        timing_.cooldown > kMaxDuration) {
        throw ConfigError("trial timing exceeds " + std::to_string(kMaxDuration.count()) + " ms");
    }
}

std::vector<TrialConfig> TrialController::BuildMatrix(const std::vector<std::string>& workloads,
                                                      const std::vector<std::size_t>& concurrencies) {
    std::vector<TrialConfig> matrix;
    matrix.reserve(workloads.size() * concurrencies.size());
    for (const auto& w : workloads) {
        for (auto c : concurrencies) {
            if (c == 0) throw ConfigError("concurrency must be positive");
            matrix.push_back(TrialConfig{w, c});
        }
    }
    return matrix;
}

std::vector<TrialResult> TrialController::RunAll(const std::vector<TrialConfig>& configs) {
    if (configs.empty()) {
        throw ConfigError("configuration matrix is empty");
    }
    for (const auto& c : configs) {
        if (c.concurrency == 0) throw ConfigError("concurrency must be positive for " + c.workload_id);
    }

    std::vector<TrialResult> results;
    results.reserve(configs.size());

    for (std::size_t i = 0; i < configs.size(); ++i) {
        const auto& config = configs[i];
        IB_LOG_INFO("trial {}/{}: workload {}, concurrency {}", i + 1, configs.size(),
                    config.workload_id, config.concurrency);
        if (on_trial_start_) on_trial_start_(i, config);

        Aggregator agg;
        const auto start = std::chrono::steady_clock::now();
        TrialResult result;
        try {
            result = RunTrial(config, agg);
        } catch (const std::exception& e) {
            IB_LOG_ERROR("trial {} ({}, c={}) faulted: {}", i + 1, config.workload_id, config.concurrency, e.what());
            result = agg.Reduce(config, std::chrono::steady_clock::now() - start);
            result.faulted = true;
            result.fault_message = e.what();
        }

        IB_LOG_INFO("trial {}/{} done: {} requests, {:.1f}% success, avg {:.1f} ms",
                    i + 1, configs.size(), result.total_requests, result.success_rate_pct, result.avg_latency_ms);
        results.push_back(result);
        if (on_trial_done_) on_trial_done_(i, results.back());

        if (i + 1 < configs.size() && timing_.cooldown.count() > 0) {
            IB_LOG_DEBUG("cooling down for {} ms", timing_.cooldown.count());
            std::this_thread::sleep_for(timing_.cooldown);
        }
    }
    return results;
}

TrialResult TrialController::RunTrial(const TrialConfig& config, Aggregator& agg) {
    IB_PERF_SCOPE("trial " + config.workload_id + " c=" + std::to_string(config.concurrency));

    const auto start = std::chrono::steady_clock::now();
    CancelToken token(start + timing_.trial_duration);
    ResourceSampler sampler(probe_, timing_.sample_interval);

    std::thread sampler_thread([&] {
        try {
            sampler.Run(token, agg);
        } catch (const std::exception& e) {
            IB_LOG_ERROR("resource sampler stopped: {}", e.what());
        }
    });

    try {
        generator_.Run(config, token, agg);
    } catch (...) {
        token.Cancel();
        sampler_thread.join();
        throw;
    }

    // Workers exit at the deadline; the sampler may still be waiting for its next tick.
    token.Cancel();
    sampler_thread.join();

    return agg.Reduce(config, std::chrono::steady_clock::now() - start);
}

}
