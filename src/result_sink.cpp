#include "infer_bench/result_sink.hpp"

#include "logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace infer_bench {

namespace {

constexpr std::size_t kColumns = 11;
constexpr std::size_t kColumnGap = 2;

const std::array<const char*, kColumns> kHeader{
    "Model", "Concurrency", "CPU(%)", "GPU(%)", "GPU mem(MB)", "Mem(%)",
    "Avg(ms)", "Max(ms)", "Min(ms)", "Success(%)", "Requests"};

std::array<std::string, kColumns> Row(const TrialResult& r) {
    std::string model = r.config.workload_id;
    if (r.faulted) model += " (faulted)";
    return {
        model,
        fmt::format("{}", r.config.concurrency),
        fmt::format("{:.1f}", r.peak_resources.cpu_load),
        fmt::format("{:.1f}", r.peak_resources.accelerator_load),
        fmt::format("{:.0f}", r.peak_resources.accelerator_memory_used),
        fmt::format("{:.1f}", r.peak_resources.memory_used_pct),
        fmt::format("{:.1f}", r.avg_latency_ms),
        fmt::format("{:.1f}", r.max_latency_ms),
        fmt::format("{:.1f}", r.min_latency_ms),
        fmt::format("{:.1f}", r.success_rate_pct),
        fmt::format("{}", r.total_requests),
    };
}

// Display width with multi-byte UTF-8 sequences counted once.
std::size_t DisplayWidth(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

}

TableReportSink::TableReportSink(std::ostream& out) : out_(out) {}

std::string TableReportSink::Render(const std::vector<TrialResult>& results) {
    std::vector<std::array<std::string, kColumns>> rows;
    rows.reserve(results.size() + 1);
    std::array<std::string, kColumns> header;
    std::copy(kHeader.begin(), kHeader.end(), header.begin());
    rows.push_back(header);
    for (const auto& r : results) rows.push_back(Row(r));

    std::array<std::size_t, kColumns> widths{};
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            widths[c] = std::max(widths[c], DisplayWidth(row[c]));
        }
    }

    std::string out;
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < kColumns; ++c) {
            out += row[c];
            if (c + 1 < kColumns) {
                out.append(widths[c] - DisplayWidth(row[c]) + kColumnGap, ' ');
            }
        }
        out += '\n';
    }
    return out;
}

void TableReportSink::Consume(const std::vector<TrialResult>& results) {
    out_ << Render(results) << std::flush;
}

JsonReportSink::JsonReportSink(std::string path) : path_(std::move(path)) {}

nlohmann::json JsonReportSink::ToJson(const TrialResult& r) {
    nlohmann::json j = {
        {"model", r.config.workload_id},
        {"concurrency", r.config.concurrency},
        {"cpu_load_pct", r.peak_resources.cpu_load},
        {"memory_used_pct", r.peak_resources.memory_used_pct},
        {"gpu_load_pct", r.peak_resources.accelerator_load},
        {"gpu_memory_used_mb", r.peak_resources.accelerator_memory_used},
        {"sample_count", r.sample_count},
        {"avg_latency_ms", r.avg_latency_ms},
        {"max_latency_ms", r.max_latency_ms},
        {"min_latency_ms", r.min_latency_ms},
        {"success_rate_pct", r.success_rate_pct},
        {"total_requests", r.total_requests},
        {"success_count", r.success_count},
        {"failure_count", r.failure_count},
        {"elapsed_seconds", r.elapsed_seconds},
        {"throughput_rps", r.throughput_rps},
        {"faulted", r.faulted},
    };
    if (r.faulted) j["fault_message"] = r.fault_message;
    return j;
}

void JsonReportSink::Consume(const std::vector<TrialResult>& results) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) arr.push_back(ToJson(r));

    std::ofstream out(path_, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open report file " + path_);
    }
    out << arr.dump(2) << '\n';
    IB_LOG_INFO("wrote {} results to {}", results.size(), path_);
}

}
