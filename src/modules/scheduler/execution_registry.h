// modules/scheduler/execution_registry.h
#ifndef CANVASFLOW_MODULES_SCHEDULER_EXECUTION_REGISTRY_H
#define CANVASFLOW_MODULES_SCHEDULER_EXECUTION_REGISTRY_H

#include "modules/scheduler/execution_context.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace canvasflow {

// In-process map from execution id to live context. Contexts leave the
// registry the moment their run reaches a terminal status.
class ExecutionRegistry {
public:
    // "exec_<unix ms>_<counter>", unique for the lifetime of the registry
    ExecutionId generate_id();

    std::shared_ptr<ExecutionContext> create(size_t total_blocks);
    std::shared_ptr<ExecutionContext> find(const ExecutionId& execution_id) const;
    void remove(const ExecutionId& execution_id);

    std::vector<ExecutionId> list() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, std::shared_ptr<ExecutionContext>> contexts_;
    std::atomic<uint64_t> counter_{0};
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_SCHEDULER_EXECUTION_REGISTRY_H
