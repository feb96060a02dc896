#ifndef CANVASFLOW_TYPES_EXECUTION_H
#define CANVASFLOW_TYPES_EXECUTION_H

#include "graph.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canvasflow {

using ExecutionId = std::string; // "exec_<unix ms>_<counter>"
using TimePoint = std::chrono::system_clock::time_point;

enum class ExecutionStatus : uint8_t {
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class BlockStatus : uint8_t {
    COMPLETED,
    FAILED,
    SKIPPED
};

std::string to_string(ExecutionStatus status);
std::string to_string(BlockStatus status);

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED
        || status == ExecutionStatus::FAILED
        || status == ExecutionStatus::CANCELLED;
}

struct RetryPolicy {
    int max_retries = 0;            // additional attempts after the first
    int64_t retry_delay_ms = 1000;  // delay before the first retry
    double backoff_multiplier = 1.0;
    int64_t max_delay_ms = 0;       // 0 = uncapped

    // Delay before retry number `retry` (1-based)
    std::chrono::milliseconds delay_for(int retry) const;
};

struct NotificationSettings {
    bool on_progress = false;
    bool on_completion = false;
    bool on_error = false;
};

enum class BatchSourceType : uint8_t {
    FOLDER,
    FILES
};

enum class BatchFileType : uint8_t {
    TEXT,
    IMAGE
};

struct FileInput {
    std::string name;
    std::string path;
    BatchFileType type = BatchFileType::TEXT;
    std::string content; // empty means "read from path"
    size_t size = 0;
};

struct BatchInputSource {
    BatchSourceType type = BatchSourceType::FILES;
    std::string path;
    std::vector<FileInput> files;
    std::string delimiter = "******"; // separates items inside one text file
};

struct ExecutionProgress {
    size_t total = 0;
    size_t completed = 0;
    size_t failed = 0;
    std::optional<BlockNumber> current;
};

struct BlockResult {
    BlockId block_id;
    BlockNumber block_number;
    BlockStatus status = BlockStatus::COMPLETED;
    std::optional<std::string> output;
    std::optional<std::string> error;
    int64_t execution_time_ms = 0;
    int retry_count = 0;
};

struct ExecutionError {
    BlockId block_id;
    BlockNumber block_number;
    std::string error;
    TimePoint timestamp;
    int retry_count = 0;
};

struct ExecutionStatistics {
    size_t total_blocks = 0;
    size_t completed_blocks = 0;
    size_t failed_blocks = 0;
    size_t skipped_blocks = 0;
    int64_t total_execution_time_ms = 0;
    double average_block_time_ms = 0.0;
};

struct ExecutionResult {
    ExecutionId execution_id;
    ExecutionStatus status = ExecutionStatus::COMPLETED; // never RUNNING or PAUSED
    std::vector<BlockResult> results;
    ExecutionStatistics statistics;
    std::optional<std::vector<ExecutionError>> errors; // set only when non-empty
};

struct ExecutionStatusSnapshot {
    ExecutionId execution_id;
    ExecutionStatus status = ExecutionStatus::RUNNING;
    ExecutionProgress progress;
    TimePoint start_time;
    std::optional<TimePoint> estimated_completion;
};

// Receives the notifications enabled in NotificationSettings.
// Callbacks run on the thread driving the execution.
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;
    virtual void on_started(const ExecutionId&) {}
    virtual void on_progress(const ExecutionStatusSnapshot&) {}
    virtual void on_block_failed(const ExecutionId&, const ExecutionError&) {}
    virtual void on_completed(const ExecutionResult&) {}
};

struct ExecutionOptions {
    std::optional<BatchInputSource> batch_input;
    size_t max_concurrency = 1;
    std::optional<RetryPolicy> retry_policy;
    NotificationSettings notification_settings;
    int64_t dispatch_timeout_ms = 0; // 0 = no deadline
    std::shared_ptr<ExecutionObserver> observer;
};

void to_json(nlohmann::json& j, const ExecutionProgress& progress);
void to_json(nlohmann::json& j, const BlockResult& result);
void to_json(nlohmann::json& j, const ExecutionError& error);
void to_json(nlohmann::json& j, const ExecutionStatistics& statistics);
void to_json(nlohmann::json& j, const ExecutionResult& result);
void to_json(nlohmann::json& j, const ExecutionStatusSnapshot& snapshot);

int64_t to_unix_ms(TimePoint tp);

} // namespace canvasflow

#endif // CANVASFLOW_TYPES_EXECUTION_H
