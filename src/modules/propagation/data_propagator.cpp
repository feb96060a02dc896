// modules/propagation/data_propagator.cpp
#include "modules/propagation/data_propagator.h"
#include <algorithm>
#include <chrono>
#include <queue>
#include <unordered_set>

namespace canvasflow {

InMemoryDataPropagator::InMemoryDataPropagator(const std::vector<Connection>& connections) {
    update_connections(connections);
}

void InMemoryDataPropagator::update_connections(const std::vector<Connection>& connections) {
    std::lock_guard<std::mutex> lock(mutex_);
    predecessors_.clear();
    for (const auto& conn : connections) {
        predecessors_[conn.to_id].push_back(conn.from_id);
    }
}

std::vector<BlockId> InMemoryDataPropagator::collect_ancestors(const BlockId& block_id) const {
    std::vector<BlockId> ancestors;
    std::unordered_set<BlockId> seen{block_id};
    std::queue<BlockId> pending;
    pending.push(block_id);

    while (!pending.empty()) {
        BlockId current = pending.front();
        pending.pop();
        auto it = predecessors_.find(current);
        if (it == predecessors_.end()) continue;
        for (const auto& pred : it->second) {
            if (seen.insert(pred).second) {
                ancestors.push_back(pred);
                pending.push(pred);
            }
        }
    }
    return ancestors;
}

UpstreamData InMemoryDataPropagator::get_upstream_data(const BlockId& block_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const BlockData*> visible;
    for (const auto& ancestor : collect_ancestors(block_id)) {
        auto it = published_.find(ancestor);
        if (it != published_.end()) {
            visible.push_back(&it->second);
        }
    }
    // Oldest first, so a later publish under a repeated number wins
    std::stable_sort(visible.begin(), visible.end(),
                     [](const BlockData* a, const BlockData* b) { return a->timestamp < b->timestamp; });

    UpstreamData upstream;
    for (const BlockData* data : visible) {
        upstream[data->block_number] = data->content;
    }
    return upstream;
}

void InMemoryDataPropagator::propagate(const BlockId& block_id, const std::string& output,
                                       BlockKind kind, const BlockNumber& block_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    published_[block_id] = BlockData{block_id, block_number, kind, output, std::chrono::system_clock::now()};
}

std::optional<BlockData> InMemoryDataPropagator::get_block_data(const BlockId& block_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = published_.find(block_id);
    if (it == published_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BlockId> InMemoryDataPropagator::get_upstream_block_ids(const BlockId& block_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = predecessors_.find(block_id);
    if (it == predecessors_.end()) {
        return {};
    }
    return it->second;
}

void InMemoryDataPropagator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    published_.clear();
}

PropagatorFactory InMemoryDataPropagator::factory() {
    return [](const Graph& graph) -> std::shared_ptr<DataPropagator> {
        return std::make_shared<InMemoryDataPropagator>(graph.connections);
    };
}

} // namespace canvasflow
