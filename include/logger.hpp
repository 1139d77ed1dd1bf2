#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace infer_bench {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

namespace log {

// Loads level/pattern/sinks from a JSON file. Falls back to a colored console
// logger at info level when the file is missing or invalid.
void InitializeLogger(const std::string& config_path);

LoggerPtr LoadLogger() noexcept;
void SetLogger(LoggerPtr logger) noexcept;

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void SetLevel(const std::string& level);

template <typename... Args>
void Log(spdlog::level::level_enum lvl, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto logger = LoadLogger();
    if (logger && logger->should_log(lvl)) {
        logger->log(lvl, fmt, std::forward<Args>(args)...);
    }
}

class PerfScope {
public:
    using Hook = std::function<void(std::chrono::nanoseconds)>;

    explicit PerfScope(std::string name, Hook hook = {})
        : name_(std::move(name)),
          hook_(std::move(hook)),
          start_(std::chrono::steady_clock::now()) {}

    ~PerfScope() {
        const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_);
        Log(spdlog::level::debug, "[perf] {} took {:.3f} ms", name_,
            static_cast<double>(elapsed.count()) / 1e6);
        if (hook_) {
            hook_(elapsed);
        }
    }

    PerfScope(const PerfScope&) = delete;
    PerfScope& operator=(const PerfScope&) = delete;

private:
    std::string name_;
    Hook hook_;
    std::chrono::steady_clock::time_point start_;
};

}
}

#define IB_LOG_TRACE(...)    ::infer_bench::log::Log(spdlog::level::trace, __VA_ARGS__)
#define IB_LOG_DEBUG(...)    ::infer_bench::log::Log(spdlog::level::debug, __VA_ARGS__)
#define IB_LOG_INFO(...)     ::infer_bench::log::Log(spdlog::level::info, __VA_ARGS__)
#define IB_LOG_WARN(...)     ::infer_bench::log::Log(spdlog::level::warn, __VA_ARGS__)
#define IB_LOG_ERROR(...)    ::infer_bench::log::Log(spdlog::level::err, __VA_ARGS__)
#define IB_LOG_CRITICAL(...) ::infer_bench::log::Log(spdlog::level::critical, __VA_ARGS__)

#define IB_PERF_CONCAT_INNER(a, b) a##b
#define IB_PERF_CONCAT(a, b) IB_PERF_CONCAT_INNER(a, b)
#define IB_PERF_SCOPE(name) \
    ::infer_bench::log::PerfScope IB_PERF_CONCAT(ib_perf_scope_, __LINE__)(name)
#define IB_PERF_SCOPE_HOOK(name, hook) \
    ::infer_bench::log::PerfScope IB_PERF_CONCAT(ib_perf_scope_, __LINE__)(name, hook)
