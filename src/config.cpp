#include "infer_bench/config.hpp"

#include "infer_bench/types.hpp"

#include "logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <initializer_list>

namespace infer_bench {

namespace {

bool Validate(const BenchConfig& cfg, std::string& why) {
    for (auto c : cfg.concurrencies) {
        if (c == 0) { why = "concurrency levels must be positive"; return false; }
    }
    if (cfg.prompts.empty()) { why = "prompts must not be empty"; return false; }
    if (cfg.timing.trial_duration.count() <= 0) { why = "trial_duration_ms must be positive"; return false; }
    if (cfg.timing.sample_interval.count() <= 0) { why = "sample_interval_ms must be positive"; return false; }
    if (cfg.timing.cooldown.count() < 0) { why = "cooldown_ms must not be negative"; return false; }
    if (cfg.request_timeout.count() <= 0) { why = "request_timeout_ms must be positive"; return false; }
    for (auto d : {cfg.timing.trial_duration, cfg.timing.cooldown, cfg.timing.sample_interval, cfg.request_timeout}) {
        if (d > kMaxDuration) {
            why = fmt::format("durations must not exceed {} ms", kMaxDuration.count());
            return false;
        }
    }
    return true;
}

std::chrono::milliseconds Millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(j.at(key).get<std::int64_t>());
}

}

std::optional<BenchConfigLoader> BenchConfigLoader::FromJson(const nlohmann::json& j) {
    BenchConfigLoader loader;
    auto& cfg = loader.cfg_;
    try {
        if (!j.is_object()) {
            IB_LOG_ERROR("bench config must be a JSON object");
            return std::nullopt;
        }
        if (j.contains("workloads")) cfg.workloads = j.at("workloads").get<std::vector<std::string>>();
        if (j.contains("concurrencies")) {
            cfg.concurrencies.clear();
            for (const auto& c : j.at("concurrencies")) {
                const auto v = c.get<std::int64_t>();
                if (v <= 0) {
                    IB_LOG_ERROR("invalid concurrency level {}", v);
                    return std::nullopt;
                }
                cfg.concurrencies.push_back(static_cast<std::size_t>(v));
            }
        }
        if (j.contains("prompts")) cfg.prompts = j.at("prompts").get<std::vector<std::string>>();
        if (j.contains("endpoint")) cfg.endpoint = j.at("endpoint").get<std::string>();
        cfg.request_timeout = Millis(j, "request_timeout_ms", cfg.request_timeout);
        cfg.timing.trial_duration = Millis(j, "trial_duration_ms", cfg.timing.trial_duration);
        cfg.timing.cooldown = Millis(j, "cooldown_ms", cfg.timing.cooldown);
        cfg.timing.sample_interval = Millis(j, "sample_interval_ms", cfg.timing.sample_interval);
        if (j.contains("probe_accelerator")) cfg.probe_accelerator = j.at("probe_accelerator").get<bool>();
        if (j.contains("seed") && !j.at("seed").is_null()) cfg.seed = j.at("seed").get<std::uint32_t>();
        if (j.contains("report_path")) cfg.report_path = j.at("report_path").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        IB_LOG_ERROR("invalid bench config: {}", e.what());
        return std::nullopt;
    }

    std::string why;
    if (!Validate(cfg, why)) {
        IB_LOG_ERROR("invalid bench config: {}", why);
        return std::nullopt;
    }
    loader.ready_ = true;
    return loader;
}

std::optional<BenchConfigLoader> BenchConfigLoader::FromString(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        IB_LOG_ERROR("bench config is not valid JSON");
        return std::nullopt;
    }
    return FromJson(j);
}

std::optional<BenchConfigLoader> BenchConfigLoader::FromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        IB_LOG_ERROR("cannot open bench config {}", path);
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(ifs, nullptr, false);
    if (j.is_discarded()) {
        IB_LOG_ERROR("bench config {} is not valid JSON", path);
        return std::nullopt;
    }
    // Allow the settings to live under a "bench" key next to other sections.
    if (j.is_object() && j.contains("bench")) return FromJson(j.at("bench"));
    return FromJson(j);
}

BenchConfig BenchConfigLoader::LoadOrDefault(const std::string& path) {
    std::ifstream probe(path);
    if (!probe.is_open()) {
        IB_LOG_WARN("bench config {} not found, using defaults", path);
        return BenchConfig{};
    }
    probe.close();
    auto loader = FromFile(path);
    if (!loader) {
        throw ConfigError("failed to load bench config " + path);
    }
    return loader->GetConfig();
}

nlohmann::json BenchConfigLoader::ToJson(const BenchConfig& cfg) {
    nlohmann::json j = {
        {"workloads", cfg.workloads},
        {"concurrencies", cfg.concurrencies},
        {"prompts", cfg.prompts},
        {"endpoint", cfg.endpoint},
        {"request_timeout_ms", cfg.request_timeout.count()},
        {"trial_duration_ms", cfg.timing.trial_duration.count()},
        {"cooldown_ms", cfg.timing.cooldown.count()},
        {"sample_interval_ms", cfg.timing.sample_interval.count()},
        {"probe_accelerator", cfg.probe_accelerator},
        {"report_path", cfg.report_path},
    };
    j["seed"] = cfg.seed ? nlohmann::json(*cfg.seed) : nlohmann::json(nullptr);
    return j;
}

std::string BenchConfigLoader::Dump(int indent) const {
    return ToJson(cfg_).dump(indent);
}

}
