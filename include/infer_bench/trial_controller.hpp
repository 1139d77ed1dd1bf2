#pragma once

#include "infer_bench/config.hpp"
#include "infer_bench/fwd.hpp"
#include "infer_bench/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace infer_bench {

/**
 * Runs a matrix of trials one at a time.
 *
 * For each trial a fresh Aggregator and CancelToken are created, the resource
 * sampler runs on its own thread while the workload generator drives the target
 * until the trial deadline, and the result is reduced only after both have been
 * joined. A cool-down separates consecutive trials.
 */
class TrialController {
public:
    using StartCallback = std::function<void(std::size_t index, const TrialConfig&)>;
    using DoneCallback = std::function<void(std::size_t index, const TrialResult&)>;

    TrialController(TrialTiming timing, WorkloadGenerator& generator, ResourceProbe& probe);

    // Cross product in workload-outer, concurrency-inner order.
    static std::vector<TrialConfig> BuildMatrix(const std::vector<std::string>& workloads,
                                                const std::vector<std::size_t>& concurrencies);

    // Throws ConfigError for an empty matrix before any trial starts. Otherwise returns
    // exactly one result per config, in input order, even if trials fault.
    std::vector<TrialResult> RunAll(const std::vector<TrialConfig>& configs);

    void SetOnTrialStart(StartCallback cb) { on_trial_start_ = std::move(cb); }
    void SetOnTrialDone(DoneCallback cb) { on_trial_done_ = std::move(cb); }

    const TrialTiming& Timing() const noexcept { return timing_; }

private:
    TrialResult RunTrial(const TrialConfig& config, Aggregator& agg);

    TrialTiming timing_;
    WorkloadGenerator& generator_;
    ResourceProbe& probe_;
    StartCallback on_trial_start_;
    DoneCallback on_trial_done_;
};

}
