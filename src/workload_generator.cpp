#include "infer_bench/workload_generator.hpp"

#include "infer_bench/aggregator.hpp"
#include "infer_bench/cancel_token.hpp"
#include "infer_bench/request_issuer.hpp"
#include "logger.hpp"

#include <chrono>
#include <functional>
#include <system_error>
#include <thread>

namespace infer_bench {

WorkloadSet::WorkloadSet(std::vector<std::string> units)
    : units_(std::make_shared<const std::vector<std::string>>(std::move(units))) {
    if (units_->empty()) {
        throw ConfigError("workload set must contain at least one prompt");
    }
}

const std::string& WorkloadSet::Pick(std::mt19937& gen) const {
    std::uniform_int_distribution<std::size_t> dist(0, units_->size() - 1);
    return (*units_)[dist(gen)];
}

WorkloadGenerator::WorkloadGenerator(WorkloadSet workloads,
                                     std::unique_ptr<RequestIssuer> prototype,
                                     std::optional<std::uint32_t> seed)
    : workloads_(std::move(workloads)), prototype_(std::move(prototype)), seed_(seed) {
    if (!prototype_) {
        throw ConfigError("workload generator requires a request issuer");
    }
}

WorkloadGenerator::~WorkloadGenerator() = default;

std::size_t WorkloadGenerator::Run(const TrialConfig& trial, CancelToken& token, Aggregator& sink) {
    if (trial.concurrency == 0) {
        throw ConfigError("concurrency must be positive");
    }

    std::vector<std::thread> workers;
    workers.reserve(trial.concurrency);
    try {
        for (std::size_t i = 0; i < trial.concurrency; ++i) {
            workers.emplace_back(&WorkloadGenerator::WorkerLoop, this, i,
                                 std::cref(trial.workload_id), prototype_->Clone(),
                                 std::cref(token), std::ref(sink));
        }
    } catch (...) {
        // Release the workers that did start before propagating.
        token.Cancel();
        for (auto& w : workers) w.join();
        throw;
    }

    for (auto& w : workers) w.join();
    IB_LOG_DEBUG("[{}] all {} workers exited", trial.workload_id, workers.size());
    return workers.size();
}

void WorkloadGenerator::WorkerLoop(std::size_t index,
                                   const std::string& workload_id,
                                   std::unique_ptr<RequestIssuer> issuer,
                                   const CancelToken& token,
                                   Aggregator& sink) const {
    std::mt19937 gen;
    if (seed_) {
        gen.seed(*seed_ + static_cast<std::uint32_t>(index));
    } else {
        gen.seed(std::random_device{}());
    }

    std::size_t issued = 0;
    while (!token.IsCancelled()) {
        const std::string& prompt = workloads_.Pick(gen);

        RequestOutcome outcome;
        const auto start = std::chrono::steady_clock::now();
        try {
            outcome = issuer->Send(workload_id, prompt, token);
        } catch (const std::exception& e) {
            outcome = RequestOutcome::Failure(std::chrono::steady_clock::now() - start,
                                              FailureKind::Internal, e.what());
        }

        // The trial ended while this request was in flight: nothing to record.
        if (outcome.Cancelled()) break;

        if (!outcome.succeeded && outcome.error) {
            IB_LOG_DEBUG("[C-{}] [{}] {}: {}", index, workload_id,
                         ToString(outcome.error->kind), outcome.error->message);
        }
        sink.Record(outcome);
        ++issued;
    }
    IB_LOG_TRACE("[C-{}] [{}] exiting after {} requests", index, workload_id, issued);
}

}
