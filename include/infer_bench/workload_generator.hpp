#pragma once

#include "infer_bench/fwd.hpp"
#include "infer_bench/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace infer_bench {

// Immutable set of workload units (prompts) a worker picks from uniformly.
class WorkloadSet {
public:
    explicit WorkloadSet(std::vector<std::string> units);

    const std::string& Pick(std::mt19937& gen) const;
    std::size_t Size() const noexcept { return units_->size(); }
    const std::vector<std::string>& Units() const noexcept { return *units_; }

private:
    std::shared_ptr<const std::vector<std::string>> units_;
};

class WorkloadGenerator {
public:
    // `seed` makes prompt selection reproducible; worker i uses seed + i.
    WorkloadGenerator(WorkloadSet workloads,
                      std::unique_ptr<RequestIssuer> prototype,
                      std::optional<std::uint32_t> seed = std::nullopt);
    ~WorkloadGenerator();

    WorkloadGenerator(const WorkloadGenerator&) = delete;
    WorkloadGenerator& operator=(const WorkloadGenerator&) = delete;

    // Spawns `trial.concurrency` workers that issue requests until `token` fires,
    // then joins them all. Returns the number of workers joined.
    std::size_t Run(const TrialConfig& trial, CancelToken& token, Aggregator& sink);

    const WorkloadSet& Workloads() const noexcept { return workloads_; }

private:
    void WorkerLoop(std::size_t index,
                    const std::string& workload_id,
                    std::unique_ptr<RequestIssuer> issuer,
                    const CancelToken& token,
                    Aggregator& sink) const;

    WorkloadSet workloads_;
    std::unique_ptr<RequestIssuer> prototype_;
    std::optional<std::uint32_t> seed_;
};

}
