// modules/scheduler/execution_registry.cpp
#include "modules/scheduler/execution_registry.h"
#include <algorithm>
#include <chrono>

namespace canvasflow {

ExecutionId ExecutionRegistry::generate_id() {
    return "exec_" + std::to_string(to_unix_ms(std::chrono::system_clock::now()))
        + "_" + std::to_string(++counter_);
}

std::shared_ptr<ExecutionContext> ExecutionRegistry::create(size_t total_blocks) {
    auto context = std::make_shared<ExecutionContext>(generate_id(), total_blocks);
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_[context->execution_id()] = context;
    return context;
}

std::shared_ptr<ExecutionContext> ExecutionRegistry::find(const ExecutionId& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(execution_id);
    return it == contexts_.end() ? nullptr : it->second;
}

void ExecutionRegistry::remove(const ExecutionId& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_.erase(execution_id);
}

std::vector<ExecutionId> ExecutionRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExecutionId> ids;
    ids.reserve(contexts_.size());
    for (const auto& [id, context] : contexts_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t ExecutionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

} // namespace canvasflow
