#include "infer_bench/resource_probe.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

namespace infer_bench {

namespace {

constexpr const char* kNvidiaSmiCmd =
    "nvidia-smi --query-gpu=utilization.gpu,memory.used --format=csv,noheader,nounits 2>/dev/null";

std::optional<std::string> ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// Runs a shell command and returns stdout, or nothing if it could not run or exited non-zero.
std::optional<std::string> RunCommand(const char* cmd) {
    std::unique_ptr<FILE, int (*)(FILE*)> pipe(popen(cmd, "r"), pclose);
    if (!pipe) return std::nullopt;

    std::array<char, 256> buffer{};
    std::string out;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        out += buffer.data();
    }
    const int status = pclose(pipe.release());
    if (status != 0) return std::nullopt;
    return out;
}

std::string Trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}

namespace probe_detail {

std::optional<CpuTimes> ParseProcStatCpu(const std::string& content) {
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("cpu ", 0) != 0) continue;
        std::istringstream iss(line.substr(4));
        std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
        if (!(iss >> user >> nice >> system >> idle)) return std::nullopt;
        // Older kernels stop after idle.
        iss >> iowait >> irq >> softirq >> steal;
        CpuTimes t;
        t.idle = idle + iowait;
        t.total = user + nice + system + idle + iowait + irq + softirq + steal;
        return t;
    }
    return std::nullopt;
}

std::optional<double> CpuBusyPercent(const CpuTimes& prev, const CpuTimes& cur) {
    if (cur.total <= prev.total || cur.idle < prev.idle) return std::nullopt;
    const double total = static_cast<double>(cur.total - prev.total);
    const double idle = static_cast<double>(cur.idle - prev.idle);
    return std::clamp((total - idle) / total * 100.0, 0.0, 100.0);
}

std::optional<double> ParseMemInfoUsedPercent(const std::string& content) {
    std::istringstream lines(content);
    std::string line;
    std::optional<double> total_kb;
    std::optional<double> avail_kb;
    while (std::getline(lines, line)) {
        std::istringstream iss(line);
        std::string key;
        double value = 0.0;
        if (!(iss >> key >> value)) continue;
        if (key == "MemTotal:") total_kb = value;
        else if (key == "MemAvailable:") avail_kb = value;
    }
    if (!total_kb || !avail_kb || *total_kb <= 0.0) return std::nullopt;
    return std::clamp((*total_kb - *avail_kb) / *total_kb * 100.0, 0.0, 100.0);
}

std::optional<AcceleratorUsage> ParseNvidiaSmi(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    std::optional<AcceleratorUsage> usage;
    while (std::getline(lines, line)) {
        line = Trim(line);
        if (line.empty()) continue;
        const auto comma = line.find(',');
        if (comma == std::string::npos) return std::nullopt;
        double util = 0.0;
        double mem = 0.0;
        try {
            util = std::stod(Trim(line.substr(0, comma)));
            mem = std::stod(Trim(line.substr(comma + 1)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (!usage) usage = AcceleratorUsage{};
        usage->load_pct = std::max(usage->load_pct, util);
        usage->memory_used_mib = std::max(usage->memory_used_mib, mem);
    }
    return usage;
}

}

HostResourceProbe::HostResourceProbe(bool probe_accelerator, std::string proc_root)
    : probe_accelerator_(probe_accelerator), proc_root_(std::move(proc_root)) {
    Reset();
}

void HostResourceProbe::Reset() {
    last_cpu_.reset();
    if (auto stat = ReadFile(proc_root_ + "/stat")) {
        last_cpu_ = probe_detail::ParseProcStatCpu(*stat);
    }
}

std::optional<double> HostResourceProbe::SampleCpu() {
    auto stat = ReadFile(proc_root_ + "/stat");
    if (!stat) return std::nullopt;
    auto cur = probe_detail::ParseProcStatCpu(*stat);
    if (!cur) return std::nullopt;

    std::optional<double> busy;
    if (last_cpu_) busy = probe_detail::CpuBusyPercent(*last_cpu_, *cur);
    last_cpu_ = cur;
    // No tick elapsed since the last snapshot: the host was not measurably busy.
    if (!busy) return 0.0;
    return busy;
}

std::optional<double> HostResourceProbe::SampleMemory() const {
    auto meminfo = ReadFile(proc_root_ + "/meminfo");
    if (!meminfo) return std::nullopt;
    return probe_detail::ParseMemInfoUsedPercent(*meminfo);
}

ProbeReading HostResourceProbe::Sample() {
    ProbeReading reading;
    reading.cpu_load = SampleCpu();
    reading.memory_used_pct = SampleMemory();
    if (probe_accelerator_) {
        if (auto out = RunCommand(kNvidiaSmiCmd)) {
            if (auto usage = probe_detail::ParseNvidiaSmi(*out)) {
                reading.accelerator_load = usage->load_pct;
                reading.accelerator_memory_used = usage->memory_used_mib;
            }
        }
    }
    return reading;
}

}
