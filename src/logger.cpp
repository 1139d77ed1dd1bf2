#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <fstream>
#include <iostream>
#include <vector>

namespace infer_bench {
namespace log {

namespace {

constexpr const char* kLoggerName = "infer_bench";
constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

LoggerPtr MakeDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(kDefaultPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

LoggerPtr& Slot() {
    static LoggerPtr slot = MakeDefaultLogger();
    return slot;
}

}

LoggerPtr LoadLogger() noexcept {
    return std::atomic_load(&Slot());
}

void SetLogger(LoggerPtr logger) noexcept {
    if (!logger) return;
    std::atomic_store(&Slot(), std::move(logger));
}

void SetLevel(const std::string& level) {
    auto logger = LoadLogger();
    if (!logger) return;
    logger->set_level(spdlog::level::from_str(level));
}

void InitializeLogger(const std::string& config_path) {
    std::string level = "info";
    std::string pattern = kDefaultPattern;
    std::string file_path;
    bool console = true;

    std::ifstream ifs(config_path);
    if (ifs.is_open()) {
        try {
            nlohmann::json j;
            ifs >> j;
            const auto& cfg = j.contains("logger") ? j["logger"] : j;
            level = cfg.value("level", level);
            pattern = cfg.value("pattern", pattern);
            file_path = cfg.value("file", file_path);
            console = cfg.value("console", console);
        } catch (const std::exception& e) {
            std::cerr << "Warning: failed to parse logger config " << config_path
                      << ": " << e.what() << ", using defaults" << std::endl;
        }
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Warning: cannot open log file " << file_path << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    SetLogger(std::move(logger));
}

}
}
