// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace canvasflow {

void to_json(nlohmann::json& j, const TraceRecord& record) {
    j = nlohmann::json{
        {"trace_id", record.trace_id},
        {"block_id", record.block_id},
        {"block_number", record.block_number},
        {"kind", record.kind},
        {"wave", record.wave},
        {"start_time", to_unix_ms(record.start_time)},
        {"end_time", to_unix_ms(record.end_time)},
        {"status", record.status},
        {"retry_count", record.retry_count},
        {"inputs", record.inputs}
    };
    if (record.error) {
        j["error"] = *record.error;
    }
    if (record.resolved_prompt) {
        j["resolved_prompt"] = *record.resolved_prompt;
    }
}

TraceExporter::TraceExporter(std::string trace_id)
    : trace_id_(std::move(trace_id)) {}

void TraceExporter::on_block_start(const Block& block, size_t wave) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.block_id = block.id;
    record.block_number = block.number;
    record.kind = to_string(block.kind);
    record.wave = wave;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // Updated in on_block_end

    traces_.push_back(std::move(record));
}

void TraceExporter::on_block_end(
    const BlockId& block_id,
    const BlockResult& result,
    const std::vector<BlockNumber>& inputs,
    const std::optional<std::string>& resolved_prompt) {

    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&block_id](const TraceRecord& r) { return r.block_id == block_id && r.status == "running"; });

    if (it != traces_.rend()) {
        TraceRecord& record = *it;
        record.end_time = std::chrono::system_clock::now();
        record.status = to_string(result.status);
        record.error = result.error;
        record.retry_count = result.retry_count;
        record.inputs = inputs;
        record.resolved_prompt = resolved_prompt;
    }
}

void TraceExporter::on_block_skipped(const Block& block, const std::string& reason) {
    TraceRecord record;
    record.trace_id = trace_id_;
    record.block_id = block.id;
    record.block_number = block.number;
    record.kind = to_string(block.kind);
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = to_string(BlockStatus::SKIPPED);
    record.error = reason;

    traces_.push_back(std::move(record));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return traces_;
}

nlohmann::json TraceExporter::export_json() const {
    return nlohmann::json(traces_);
}

void TraceExporter::clear_traces() {
    traces_.clear();
}

} // namespace canvasflow
