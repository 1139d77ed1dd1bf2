#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace infer_bench {

// Upper bound for every configured duration; keeps deadline arithmetic on steady_clock in range.
constexpr std::chrono::milliseconds kMaxDuration = std::chrono::hours(24 * 7);

struct TrialTiming {
    std::chrono::milliseconds trial_duration{30000};
    std::chrono::milliseconds cooldown{10000};
    std::chrono::milliseconds sample_interval{1000};
};

struct BenchConfig {
    // Matrix: every workload runs at every concurrency level, workload outer.
    std::vector<std::string> workloads{
        "deepseek-r1:1.5b",
        "deepseek-r1:7b",
        "deepseek-r1:8b",
        "deepseek-r1:14b",
        "deepseek-r1:32b",
    };
    std::vector<std::size_t> concurrencies{1, 2, 3, 4, 5, 6};
    std::vector<std::string> prompts{
        "你好",
        "三角函数是什么",
        "用HTML写一个简单的webgl 三角型 3D 程序",
    };

    std::string endpoint = "http://localhost:11434/api/generate";
    std::chrono::milliseconds request_timeout{60000};
    TrialTiming timing{};

    bool probe_accelerator = true;
    std::optional<std::uint32_t> seed;
    std::string report_path; // empty: no JSON report
};

class BenchConfigLoader {
public:
    static std::optional<BenchConfigLoader> FromString(const std::string& text);
    static std::optional<BenchConfigLoader> FromJson(const nlohmann::json& j);
    static std::optional<BenchConfigLoader> FromFile(const std::string& path);

    // Loads `path` if it exists, otherwise returns the built-in defaults.
    static BenchConfig LoadOrDefault(const std::string& path);

    bool Ready() const noexcept { return ready_; }
    const BenchConfig& GetConfig() const noexcept { return cfg_; }
    std::string Dump(int indent = 2) const;

    static nlohmann::json ToJson(const BenchConfig& cfg);

private:
    BenchConfigLoader() = default;

    BenchConfig cfg_{};
    bool ready_ = false;
};

}
