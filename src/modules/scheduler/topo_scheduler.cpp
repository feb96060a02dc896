// modules/scheduler/topo_scheduler.cpp
#include "modules/scheduler/topo_scheduler.h"
#include <algorithm>
#include <deque>
#include <stdexcept>

namespace canvasflow {

TopoScheduler::TopoScheduler(const std::vector<Block>& blocks, const std::vector<Connection>& connections) {
    // 1. Nodes in block order, in-degree zero
    for (const auto& block : blocks) {
        if (in_degree_.count(block.id)) continue;
        nodes_.push_back(block.id);
        in_degree_[block.id] = 0;
        successors_[block.id] = {};
    }

    // 2. Edges between known blocks
    for (const auto& conn : connections) {
        if (!in_degree_.count(conn.from_id) || !in_degree_.count(conn.to_id)) {
            continue;
        }
        successors_[conn.from_id].push_back(conn.to_id);
        in_degree_[conn.to_id]++;
    }
}

const std::vector<BlockId>& TopoScheduler::successors(const BlockId& block_id) const {
    static const std::vector<BlockId> empty;
    auto it = successors_.find(block_id);
    return it == successors_.end() ? empty : it->second;
}

std::vector<std::vector<BlockId>> TopoScheduler::waves(size_t max_width) const {
    max_width = std::max<size_t>(max_width, 1);

    std::unordered_map<BlockId, int> in_degree = in_degree_;
    std::deque<BlockId> ready;
    for (const auto& node : nodes_) {
        if (in_degree[node] == 0) {
            ready.push_back(node);
        }
    }

    std::vector<std::vector<BlockId>> plan;
    size_t emitted = 0;
    while (!ready.empty()) {
        // Everything taken here was queued before any of its successors can be,
        // so the concatenated plan matches the one-at-a-time FIFO order
        std::vector<BlockId> wave;
        while (!ready.empty() && wave.size() < max_width) {
            wave.push_back(ready.front());
            ready.pop_front();
        }
        for (const auto& node : wave) {
            for (const auto& next : successors(node)) {
                if (--in_degree[next] == 0) {
                    ready.push_back(next);
                }
            }
        }
        emitted += wave.size();
        plan.push_back(std::move(wave));
    }

    if (emitted != nodes_.size()) {
        throw std::logic_error("Topological sort emitted " + std::to_string(emitted) + " of "
                               + std::to_string(nodes_.size()) + " blocks; the graph contains a cycle");
    }
    return plan;
}

std::vector<BlockId> TopoScheduler::order() const {
    std::vector<BlockId> result;
    result.reserve(nodes_.size());
    for (auto& wave : waves(1)) {
        result.push_back(std::move(wave.front()));
    }
    return result;
}

} // namespace canvasflow
