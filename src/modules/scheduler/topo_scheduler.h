// modules/scheduler/topo_scheduler.h
#ifndef CANVASFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
#define CANVASFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H

#include "core/types/graph.h"
#include <unordered_map>
#include <vector>

namespace canvasflow {

// Kahn's algorithm with a FIFO ready queue seeded in block order.
// Readiness is structural only: a failed predecessor does not remove its successors.
class TopoScheduler {
public:
    // Connections with an unknown endpoint are ignored
    TopoScheduler(const std::vector<Block>& blocks, const std::vector<Connection>& connections);

    // Total execution order. Throws std::logic_error if the graph is cyclic.
    std::vector<BlockId> order() const;

    // The same order cut into waves of at most `max_width` nodes that are ready together.
    // Concatenating the waves yields order() for any width.
    std::vector<std::vector<BlockId>> waves(size_t max_width) const;

    const std::vector<BlockId>& successors(const BlockId& block_id) const;
    size_t node_count() const { return nodes_.size(); }

private:
    std::vector<BlockId> nodes_;
    std::unordered_map<BlockId, std::vector<BlockId>> successors_;
    std::unordered_map<BlockId, int> in_degree_;
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_SCHEDULER_TOPO_SCHEDULER_H
