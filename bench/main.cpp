#include "infer_bench/config.hpp"
#include "infer_bench/request_issuer.hpp"
#include "infer_bench/resource_probe.hpp"
#include "infer_bench/result_sink.hpp"
#include "infer_bench/trial_controller.hpp"
#include "infer_bench/workload_generator.hpp"

#include "logger.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct Cli {
    std::string config_path{"config/bench_config.json"};
    std::string log_config_path{"config/logger_config.json"};
    std::optional<std::size_t> trial_seconds;
    std::optional<std::size_t> cooldown_seconds;
};

static Cli parse_cli(int argc, char** argv) {
    Cli cli{};
    int idx = 1;
    while (idx < argc) {
        const std::string arg = argv[idx];
        if (arg == "--config" && idx + 1 < argc) {
            cli.config_path = argv[idx + 1];
            idx += 2;
        } else if (arg == "--log-config" && idx + 1 < argc) {
            cli.log_config_path = argv[idx + 1];
            idx += 2;
        } else {
            break;
        }
    }
    if (idx < argc) { cli.trial_seconds = static_cast<std::size_t>(std::stoul(argv[idx++])); }
    if (idx < argc) { cli.cooldown_seconds = static_cast<std::size_t>(std::stoul(argv[idx++])); }
    return cli;
}

int main(int argc, char** argv) {
    Cli cli;
    try {
        cli = parse_cli(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config path] [--log-config path] [trial_seconds] [cooldown_seconds]\n"
                  << "Error parsing arguments: " << e.what() << std::endl;
        return 1;
    }

    infer_bench::log::InitializeLogger(cli.log_config_path);

    try {
        auto cfg = infer_bench::BenchConfigLoader::LoadOrDefault(cli.config_path);
        const auto max_seconds = static_cast<std::size_t>(
            std::chrono::duration_cast<std::chrono::seconds>(infer_bench::kMaxDuration).count());
        if (cli.trial_seconds) {
            if (*cli.trial_seconds > max_seconds) throw infer_bench::ConfigError("trial_seconds is too large");
            cfg.timing.trial_duration = std::chrono::seconds(*cli.trial_seconds);
        }
        if (cli.cooldown_seconds) {
            if (*cli.cooldown_seconds > max_seconds) throw infer_bench::ConfigError("cooldown_seconds is too large");
            cfg.timing.cooldown = std::chrono::seconds(*cli.cooldown_seconds);
        }

        const auto matrix = infer_bench::TrialController::BuildMatrix(cfg.workloads, cfg.concurrencies);
        IB_LOG_INFO("running {} trials against {}", matrix.size(), cfg.endpoint);

        infer_bench::CurlGlobalGuard curl_guard;
        infer_bench::HttpIssuerOptions http;
        http.endpoint = cfg.endpoint;
        http.request_timeout = cfg.request_timeout;

        infer_bench::WorkloadGenerator generator(
            infer_bench::WorkloadSet(cfg.prompts),
            std::make_unique<infer_bench::CurlRequestIssuer>(http),
            cfg.seed);
        infer_bench::HostResourceProbe probe(cfg.probe_accelerator);

        infer_bench::TrialController controller(cfg.timing, generator, probe);
        controller.SetOnTrialStart([](std::size_t, const infer_bench::TrialConfig& t) {
            std::cout << "Testing model: " << t.workload_id << ", concurrency: " << t.concurrency << std::endl;
        });

        const auto results = controller.RunAll(matrix);

        std::vector<std::unique_ptr<infer_bench::ResultSink>> sinks;
        sinks.push_back(std::make_unique<infer_bench::TableReportSink>(std::cout));
        if (!cfg.report_path.empty()) {
            sinks.push_back(std::make_unique<infer_bench::JsonReportSink>(cfg.report_path));
        }
        int rc = 0;
        for (auto& sink : sinks) {
            try {
                sink->Consume(results);
            } catch (const std::exception& e) {
                IB_LOG_ERROR("report failed: {}", e.what());
                rc = 2;
            }
        }
        return rc;
    } catch (const infer_bench::ConfigError& e) {
        IB_LOG_CRITICAL("configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        IB_LOG_CRITICAL("benchmark aborted: {}", e.what());
        return 1;
    }
}
