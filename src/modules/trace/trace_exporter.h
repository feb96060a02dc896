// modules/trace/trace_exporter.h
#ifndef CANVASFLOW_MODULES_TRACE_TRACE_EXPORTER_H
#define CANVASFLOW_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/execution.h"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <optional>
#include <chrono>

namespace canvasflow {

struct TraceRecord {
    std::string trace_id;        // execution id
    BlockId block_id;
    BlockNumber block_number;
    std::string kind;            // BlockKind as string
    size_t wave = 0;             // index of the scheduling wave
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status;          // "running", "completed", "failed", "skipped"
    std::optional<std::string> error;
    int retry_count = 0;
    std::vector<BlockNumber> inputs; // upstream blocks visible to the prompt
    std::optional<std::string> resolved_prompt;
};

void to_json(nlohmann::json& j, const TraceRecord& record);

// Not synchronized; driven by the session thread only
class TraceExporter {
public:
    explicit TraceExporter(std::string trace_id = "t-default");

    void on_block_start(const Block& block, size_t wave);

    void on_block_end(
        const BlockId& block_id,
        const BlockResult& result,
        const std::vector<BlockNumber>& inputs,
        const std::optional<std::string>& resolved_prompt
    );

    // Blocks never started because the run was cancelled
    void on_block_skipped(const Block& block, const std::string& reason);

    std::vector<TraceRecord> get_traces() const;
    nlohmann::json export_json() const;
    void clear_traces();

private:
    std::vector<TraceRecord> traces_;
    std::string trace_id_;
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_TRACE_TRACE_EXPORTER_H
