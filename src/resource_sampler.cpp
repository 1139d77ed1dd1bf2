#include "infer_bench/resource_sampler.hpp"

#include "infer_bench/aggregator.hpp"
#include "infer_bench/cancel_token.hpp"
#include "infer_bench/resource_probe.hpp"
#include "logger.hpp"

#include <array>
#include <cmath>

namespace infer_bench {

namespace {

double OrZero(const std::optional<double>& v) noexcept {
    if (!v || !std::isfinite(*v) || *v < 0.0) return 0.0;
    return *v;
}

}

ResourceSampler::ResourceSampler(ResourceProbe& probe, std::chrono::milliseconds interval)
    : probe_(probe), interval_(interval) {}

ResourceSample ResourceSampler::Flatten(const ProbeReading& reading) noexcept {
    ResourceSample s;
    s.cpu_load = OrZero(reading.cpu_load);
    s.memory_used_pct = OrZero(reading.memory_used_pct);
    s.accelerator_load = OrZero(reading.accelerator_load);
    s.accelerator_memory_used = OrZero(reading.accelerator_memory_used);
    return s;
}

std::size_t ResourceSampler::Run(const CancelToken& token, Aggregator& sink) {
    static constexpr std::array<const char*, 4> kDimensions{
        "cpu", "memory", "accelerator", "accelerator memory"};
    std::array<bool, 4> warned{};
    if (!probe_.AcceleratorEnabled()) {
        // Switched off on purpose: zeros are expected, not worth a warning.
        warned[2] = warned[3] = true;
        IB_LOG_DEBUG("accelerator probing disabled, recording 0");
    }
    std::size_t delivered = 0;

    try {
        probe_.Reset();
    } catch (const std::exception& e) {
        IB_LOG_WARN("resource probe reset failed: {}", e.what());
    }

    while (!token.WaitFor(interval_)) {
        ProbeReading reading;
        try {
            reading = probe_.Sample();
        } catch (const std::exception& e) {
            IB_LOG_WARN("resource probe failed: {}", e.what());
        }

        const std::array<bool, 4> missing{
            !reading.cpu_load.has_value(),
            !reading.memory_used_pct.has_value(),
            !reading.accelerator_load.has_value(),
            !reading.accelerator_memory_used.has_value()};
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (missing[i] && !warned[i]) {
                IB_LOG_WARN("{} probe unavailable, recording 0", kDimensions[i]);
                warned[i] = true;
            }
        }

        // A sample taken before cancellation is delivered even if the token fired meanwhile.
        sink.Record(Flatten(reading));
        ++delivered;
    }
    IB_LOG_DEBUG("resource sampler stopped after {} samples", delivered);
    return delivered;
}

}
