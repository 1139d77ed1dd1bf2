#include "infer_bench/aggregator.hpp"
#include "infer_bench/cancel_token.hpp"
#include "infer_bench/resource_sampler.hpp"

#include "fakes.hpp"
#include "log_capture.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using infer_bench::Aggregator;
using infer_bench::CancelToken;
using infer_bench::ProbeReading;
using infer_bench::ResourceSampler;
using infer_bench::TrialConfig;

namespace {

class FlakyProbe final : public infer_bench::ResourceProbe {
public:
    ProbeReading Sample() override {
        if (calls++ % 2 == 0) throw std::runtime_error("probe offline");
        return fakes::Reading(40.0, 50.0, 0.0, 0.0);
    }
    std::size_t calls = 0;
};

}

TEST(ResourceSampler, ConstantProbeGivesExactPeak) {
    fakes::ConstantProbe probe(fakes::Reading(50.0, 60.0, 0.0, 0.0));
    ResourceSampler sampler(probe, 20ms);
    Aggregator agg;
    CancelToken token(CancelToken::Clock::now() + 150ms);

    const auto delivered = sampler.Run(token, agg);

    const auto r = agg.Reduce(TrialConfig{"w", 1}, 150ms);
    EXPECT_GT(delivered, 0u);
    EXPECT_EQ(r.sample_count, delivered);
    EXPECT_DOUBLE_EQ(r.peak_resources.cpu_load, 50.0);
    EXPECT_DOUBLE_EQ(r.peak_resources.memory_used_pct, 60.0);
    EXPECT_DOUBLE_EQ(r.peak_resources.accelerator_load, 0.0);
    EXPECT_DOUBLE_EQ(r.peak_resources.accelerator_memory_used, 0.0);
}

TEST(ResourceSampler, MissingDimensionRecordedAsZero) {
    ProbeReading partial;
    partial.cpu_load = 75.0;
    partial.memory_used_pct = 30.0;
    fakes::ConstantProbe probe(partial);
    ResourceSampler sampler(probe, 10ms);
    Aggregator agg;
    CancelToken token(CancelToken::Clock::now() + 60ms);

    sampler.Run(token, agg);

    const auto r = agg.Reduce(TrialConfig{"w", 1}, 60ms);
    EXPECT_GT(r.sample_count, 0u);
    EXPECT_DOUBLE_EQ(r.peak_resources.cpu_load, 75.0);
    EXPECT_DOUBLE_EQ(r.peak_resources.accelerator_load, 0.0);
    EXPECT_DOUBLE_EQ(r.peak_resources.accelerator_memory_used, 0.0);
}

TEST(ResourceSampler, ThrowingProbeDoesNotStopSampling) {
    FlakyProbe probe;
    ResourceSampler sampler(probe, 10ms);
    Aggregator agg;
    CancelToken token(CancelToken::Clock::now() + 100ms);

    sampler.Run(token, agg);

    EXPECT_GE(probe.calls, 2u);
    const auto r = agg.Reduce(TrialConfig{"w", 1}, 100ms);
    EXPECT_EQ(r.sample_count, probe.calls);
    EXPECT_DOUBLE_EQ(r.peak_resources.cpu_load, 40.0);
}

TEST(ResourceSampler, StopsPromptlyOnCancel) {
    fakes::ConstantProbe probe(fakes::Reading(1.0, 1.0, 1.0, 1.0));
    ResourceSampler sampler(probe, 10s);
    Aggregator agg;
    CancelToken token;

    std::thread th([&] { sampler.Run(token, agg); });
    std::this_thread::sleep_for(30ms);
    const auto t0 = std::chrono::steady_clock::now();
    token.Cancel();
    th.join();

    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    // The first tick had not arrived yet, but the baseline was already re-taken.
    EXPECT_EQ(probe.calls.load(), 0u);
    EXPECT_EQ(probe.resets.load(), 1u);
    EXPECT_EQ(agg.SampleCount(), 0u);
}

TEST(ResourceSampler, ResetsProbeOncePerRun) {
    fakes::ConstantProbe probe(fakes::Reading(1.0, 1.0, 1.0, 1.0));
    ResourceSampler sampler(probe, 10ms);
    for (int trial = 0; trial < 3; ++trial) {
        Aggregator agg;
        CancelToken token(CancelToken::Clock::now() + 30ms);
        sampler.Run(token, agg);
    }
    EXPECT_EQ(probe.resets.load(), 3u);
}

TEST(ResourceSampler, DisabledAcceleratorIsNotWarnedAbout) {
    auto sink = std::make_shared<log_capture::MemorySink>();
    log_capture::ScopedLogger guard(log_capture::MakeLogger(sink));

    ProbeReading host_only;
    host_only.cpu_load = 10.0;
    host_only.memory_used_pct = 20.0;
    fakes::ConstantProbe probe(host_only, /*accelerator_enabled=*/false);
    ResourceSampler sampler(probe, 10ms);
    Aggregator agg;
    CancelToken token(CancelToken::Clock::now() + 60ms);

    sampler.Run(token, agg);

    EXPECT_GT(agg.SampleCount(), 0u);
    EXPECT_EQ(sink->CountContaining("probe unavailable", spdlog::level::warn), 0u);
}

TEST(ResourceSampler, UnavailableAcceleratorWarnsOncePerDimension) {
    auto sink = std::make_shared<log_capture::MemorySink>();
    log_capture::ScopedLogger guard(log_capture::MakeLogger(sink));

    ProbeReading host_only;
    host_only.cpu_load = 10.0;
    host_only.memory_used_pct = 20.0;
    fakes::ConstantProbe probe(host_only);
    ResourceSampler sampler(probe, 10ms);
    Aggregator agg;
    CancelToken token(CancelToken::Clock::now() + 60ms);

    sampler.Run(token, agg);

    ASSERT_GT(agg.SampleCount(), 1u);
    EXPECT_EQ(sink->CountContaining("accelerator probe unavailable", spdlog::level::warn), 1u);
    EXPECT_EQ(sink->CountContaining("accelerator memory probe unavailable", spdlog::level::warn), 1u);
    EXPECT_EQ(sink->CountContaining("cpu probe unavailable"), 0u);
}

TEST(ResourceSampler, FlattenClampsInvalidValues) {
    ProbeReading r;
    r.cpu_load = -5.0;
    r.memory_used_pct = std::numeric_limits<double>::quiet_NaN();
    r.accelerator_load = 12.5;
    const auto s = ResourceSampler::Flatten(r);
    EXPECT_DOUBLE_EQ(s.cpu_load, 0.0);
    EXPECT_DOUBLE_EQ(s.memory_used_pct, 0.0);
    EXPECT_DOUBLE_EQ(s.accelerator_load, 12.5);
    EXPECT_DOUBLE_EQ(s.accelerator_memory_used, 0.0);
}
