// modules/scheduler/execution_context.cpp
#include "modules/scheduler/execution_context.h"
#include <stdexcept>

namespace canvasflow {

ExecutionContext::ExecutionContext(ExecutionId execution_id, size_t total_blocks)
    : execution_id_(std::move(execution_id)),
      start_time_(std::chrono::system_clock::now()),
      start_steady_(std::chrono::steady_clock::now()) {
    progress_.total = total_blocks;
}

bool ExecutionContext::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ExecutionStatus::RUNNING) {
        return false;
    }
    status_ = ExecutionStatus::PAUSED;
    status_changed_.notify_all();
    return true;
}

bool ExecutionContext::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ExecutionStatus::PAUSED) {
        return false;
    }
    status_ = ExecutionStatus::RUNNING;
    status_changed_.notify_all();
    return true;
}

bool ExecutionContext::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(status_)) {
        return false;
    }
    status_ = ExecutionStatus::CANCELLED;
    status_changed_.notify_all();
    return true;
}

ExecutionStatus ExecutionContext::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool ExecutionContext::is_cancelled() const {
    return status() == ExecutionStatus::CANCELLED;
}

bool ExecutionContext::wait_until_runnable() {
    std::unique_lock<std::mutex> lock(mutex_);
    status_changed_.wait(lock, [this] { return status_ != ExecutionStatus::PAUSED; });
    return status_ == ExecutionStatus::RUNNING;
}

bool ExecutionContext::wait_for_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    status_changed_.wait_for(lock, delay, [this] { return status_ == ExecutionStatus::CANCELLED; });
    return status_ != ExecutionStatus::CANCELLED;
}

void ExecutionContext::set_current(const BlockNumber& current) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_.current = current;
}

void ExecutionContext::add_result(BlockResult result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.status == BlockStatus::COMPLETED) {
        progress_.completed++;
    } else if (result.status == BlockStatus::FAILED) {
        progress_.failed++;
    }
    results_.push_back(std::move(result));
}

void ExecutionContext::add_error(ExecutionError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(std::move(error));
}

void ExecutionContext::finish(ExecutionStatus terminal_status) {
    if (!is_terminal(terminal_status)) {
        throw std::logic_error("finish() needs a terminal status, got " + to_string(terminal_status));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = terminal_status;
    status_changed_.notify_all();
}

ExecutionProgress ExecutionContext::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::vector<BlockResult> ExecutionContext::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::vector<ExecutionError> ExecutionContext::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

ExecutionStatusSnapshot ExecutionContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ExecutionStatusSnapshot snap;
    snap.execution_id = execution_id_;
    snap.status = status_;
    snap.progress = progress_;
    snap.start_time = start_time_;

    if (progress_.completed > 0) {
        auto elapsed = std::chrono::steady_clock::now() - start_steady_;
        auto per_block = elapsed / static_cast<int64_t>(progress_.completed);
        size_t remaining = progress_.total > progress_.completed ? progress_.total - progress_.completed : 0;
        auto remaining_time = per_block * static_cast<int64_t>(remaining);
        snap.estimated_completion = std::chrono::system_clock::now()
            + std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining_time);
    }
    return snap;
}

} // namespace canvasflow
