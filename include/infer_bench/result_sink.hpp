#pragma once

#include "infer_bench/types.hpp"

#include <nlohmann/json.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace infer_bench {

class ResultSink {
public:
    virtual ~ResultSink() = default;
    // Receives every result of a run, in matrix order.
    virtual void Consume(const std::vector<TrialResult>& results) = 0;
};

// Aligned text table, one row per trial.
class TableReportSink final : public ResultSink {
public:
    explicit TableReportSink(std::ostream& out);
    void Consume(const std::vector<TrialResult>& results) override;

    static std::string Render(const std::vector<TrialResult>& results);

private:
    std::ostream& out_;
};

// Writes results as a JSON array, replacing the file.
class JsonReportSink final : public ResultSink {
public:
    explicit JsonReportSink(std::string path);
    void Consume(const std::vector<TrialResult>& results) override;

    static nlohmann::json ToJson(const TrialResult& r);

private:
    std::string path_;
};

}
