#pragma once

#include "infer_bench/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace infer_bench {

class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;

    // Point-in-time reading. Implementations report an unmeasurable dimension
    // as an empty optional instead of throwing.
    virtual ProbeReading Sample() = 0;

    // Called once at the start of every trial, before the first Sample().
    virtual void Reset() {}

    // False when accelerator readings were switched off, so their absence is expected.
    virtual bool AcceleratorEnabled() const noexcept { return true; }
};

struct CpuTimes {
    std::uint64_t total = 0;
    std::uint64_t idle = 0;
};

// Linux host probe: /proc/stat, /proc/meminfo and nvidia-smi.
class HostResourceProbe final : public ResourceProbe {
public:
    explicit HostResourceProbe(bool probe_accelerator = true,
                               std::string proc_root = "/proc");

    ProbeReading Sample() override;

    // Re-takes the CPU baseline so the first delta of a trial excludes the preceding cool-down.
    void Reset() override;

    bool AcceleratorEnabled() const noexcept override { return probe_accelerator_; }

private:
    std::optional<double> SampleCpu();
    std::optional<double> SampleMemory() const;

    bool probe_accelerator_;
    std::string proc_root_;
    std::optional<CpuTimes> last_cpu_;
};

namespace probe_detail {

// Parses the aggregate "cpu" line of /proc/stat.
std::optional<CpuTimes> ParseProcStatCpu(const std::string& content);

// Busy percentage between two snapshots; empty when no time has elapsed.
std::optional<double> CpuBusyPercent(const CpuTimes& prev, const CpuTimes& cur);

// Used percentage from /proc/meminfo (MemTotal and MemAvailable).
std::optional<double> ParseMemInfoUsedPercent(const std::string& content);

struct AcceleratorUsage {
    double load_pct = 0.0;
    double memory_used_mib = 0.0;
};

// Parses `nvidia-smi --query-gpu=utilization.gpu,memory.used --format=csv,noheader,nounits`.
// With several GPUs the busiest value of each column is kept.
std::optional<AcceleratorUsage> ParseNvidiaSmi(const std::string& output);

}
}
