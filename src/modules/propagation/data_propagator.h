// modules/propagation/data_propagator.h
#ifndef CANVASFLOW_MODULES_PROPAGATION_DATA_PROPAGATOR_H
#define CANVASFLOW_MODULES_PROPAGATION_DATA_PROPAGATOR_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace canvasflow {

// Keyed store of each block's latest output
class DataPropagator {
public:
    virtual ~DataPropagator() = default;

    // Published outputs visible to `block_id`, keyed by producer number
    virtual UpstreamData get_upstream_data(const BlockId& block_id) const = 0;

    // Publishes one block's output; publishing the same block again replaces it
    virtual void propagate(const BlockId& block_id, const std::string& output,
                           BlockKind kind, const BlockNumber& block_number) = 0;
};

// One propagator per run, built from the run's graph
using PropagatorFactory = std::function<std::shared_ptr<DataPropagator>(const Graph&)>;

struct BlockData {
    BlockId block_id;
    BlockNumber block_number;
    BlockKind kind = BlockKind::TEXT;
    std::string content;
    TimePoint timestamp;
};

// Default propagator. A block sees the outputs of every ancestor reachable by
// following connections backward, which matches what validation accepts.
class InMemoryDataPropagator : public DataPropagator {
public:
    InMemoryDataPropagator() = default;
    explicit InMemoryDataPropagator(const std::vector<Connection>& connections);

    UpstreamData get_upstream_data(const BlockId& block_id) const override;
    void propagate(const BlockId& block_id, const std::string& output,
                   BlockKind kind, const BlockNumber& block_number) override;

    // Replaces the edge set; published data is kept
    void update_connections(const std::vector<Connection>& connections);
    std::optional<BlockData> get_block_data(const BlockId& block_id) const;
    std::vector<BlockId> get_upstream_block_ids(const BlockId& block_id) const;
    void clear();

    static PropagatorFactory factory();

private:
    mutable std::mutex mutex_;
    std::unordered_map<BlockId, std::vector<BlockId>> predecessors_;
    std::unordered_map<BlockId, BlockData> published_;

    std::vector<BlockId> collect_ancestors(const BlockId& block_id) const; // caller holds mutex_
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_PROPAGATION_DATA_PROPAGATOR_H
