// modules/scheduler/execution_context.h
#ifndef CANVASFLOW_MODULES_SCHEDULER_EXECUTION_CONTEXT_H
#define CANVASFLOW_MODULES_SCHEDULER_EXECUTION_CONTEXT_H

#include "core/types/execution.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace canvasflow {

// Live state of one run. The driving session is the only writer of progress,
// results and errors; control calls from other threads only move `status`.
// All fields sit behind one mutex whose condition variable wakes the session
// on pause / resume / cancel.
class ExecutionContext {
public:
    ExecutionContext(ExecutionId execution_id, size_t total_blocks);

    const ExecutionId& execution_id() const { return execution_id_; }
    TimePoint start_time() const { return start_time_; }

    // --- control, any thread; each returns whether the transition happened ---
    bool pause();   // running -> paused
    bool resume();  // paused -> running
    bool cancel();  // running | paused -> cancelled

    ExecutionStatus status() const;
    bool is_cancelled() const;

    // --- session side ---
    // Blocks while paused. Returns false once the run is cancelled.
    bool wait_until_runnable();
    // Waits out a retry delay. Returns false if the run is cancelled meanwhile.
    bool wait_for_backoff(std::chrono::milliseconds delay);

    void set_current(const BlockNumber& current);
    void add_result(BlockResult result);
    void add_error(ExecutionError error);
    // Moves the run into its terminal status and wakes any waiter
    void finish(ExecutionStatus terminal_status);

    ExecutionProgress progress() const;
    std::vector<BlockResult> results() const;
    std::vector<ExecutionError> errors() const;

    // Fresh read; the ETA is a linear extrapolation recomputed on every call
    ExecutionStatusSnapshot snapshot() const;

private:
    const ExecutionId execution_id_;
    const TimePoint start_time_;
    const std::chrono::steady_clock::time_point start_steady_;

    mutable std::mutex mutex_;
    std::condition_variable status_changed_;
    ExecutionStatus status_ = ExecutionStatus::RUNNING;
    ExecutionProgress progress_;
    std::vector<BlockResult> results_;
    std::vector<ExecutionError> errors_;
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_SCHEDULER_EXECUTION_CONTEXT_H
