// core/types/execution.cpp
#include "core/types/execution.h"
#include <algorithm>
#include <cmath>

namespace canvasflow {

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::RUNNING: return "running";
        case ExecutionStatus::PAUSED: return "paused";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::COMPLETED: return "completed";
        case BlockStatus::FAILED: return "failed";
        case BlockStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

std::chrono::milliseconds RetryPolicy::delay_for(int retry) const {
    double delay = static_cast<double>(std::max<int64_t>(retry_delay_ms, 0));
    if (retry > 1 && backoff_multiplier > 0.0) {
        delay *= std::pow(backoff_multiplier, retry - 1);
    }
    if (max_delay_ms > 0) {
        delay = std::min(delay, static_cast<double>(max_delay_ms));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

int64_t to_unix_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const ExecutionProgress& progress) {
    j = nlohmann::json{
        {"total", progress.total},
        {"completed", progress.completed},
        {"failed", progress.failed}
    };
    if (progress.current) j["current"] = *progress.current;
}

void to_json(nlohmann::json& j, const BlockResult& result) {
    j = nlohmann::json{
        {"blockId", result.block_id},
        {"blockNumber", result.block_number},
        {"status", to_string(result.status)},
        {"executionTime", result.execution_time_ms},
        {"retryCount", result.retry_count}
    };
    if (result.output) j["output"] = *result.output;
    if (result.error) j["error"] = *result.error;
}

void to_json(nlohmann::json& j, const ExecutionError& error) {
    j = nlohmann::json{
        {"blockId", error.block_id},
        {"blockNumber", error.block_number},
        {"error", error.error},
        {"timestamp", to_unix_ms(error.timestamp)},
        {"retryCount", error.retry_count}
    };
}

void to_json(nlohmann::json& j, const ExecutionStatistics& statistics) {
    j = nlohmann::json{
        {"totalBlocks", statistics.total_blocks},
        {"completedBlocks", statistics.completed_blocks},
        {"failedBlocks", statistics.failed_blocks},
        {"skippedBlocks", statistics.skipped_blocks},
        {"totalExecutionTime", statistics.total_execution_time_ms},
        {"averageBlockTime", statistics.average_block_time_ms}
    };
}

void to_json(nlohmann::json& j, const ExecutionResult& result) {
    j = nlohmann::json{
        {"executionId", result.execution_id},
        {"status", to_string(result.status)},
        {"results", result.results},
        {"statistics", result.statistics}
    };
    if (result.errors) j["errors"] = *result.errors;
}

void to_json(nlohmann::json& j, const ExecutionStatusSnapshot& snapshot) {
    j = nlohmann::json{
        {"executionId", snapshot.execution_id},
        {"status", to_string(snapshot.status)},
        {"progress", snapshot.progress},
        {"startTime", to_unix_ms(snapshot.start_time)}
    };
    if (snapshot.estimated_completion) {
        j["estimatedCompletion"] = to_unix_ms(*snapshot.estimated_completion);
    }
}

} // namespace canvasflow
