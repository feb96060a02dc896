// modules/scheduler/execution_session.h
#ifndef CANVASFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define CANVASFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include "modules/batch/batch_input.h"
#include "modules/executor/node_executor.h"
#include "modules/propagation/data_propagator.h"
#include "modules/scheduler/execution_context.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace canvasflow {

using ExecutionPlan = std::vector<std::vector<BlockId>>;

// Drives one run of a validated graph along a precomputed plan.
//
// Waves run one after another; blocks inside a wave run concurrently and
// their outputs are published in plan order once the whole wave has joined.
// Pause and cancel are honoured between waves; a cancelled run reports every
// block it never started as skipped.
class ExecutionSession {
public:
    ExecutionSession(
        std::shared_ptr<ExecutionContext> context,
        const Graph& graph,
        ExecutionOptions options,
        const VariableResolver& resolver,
        std::shared_ptr<GenerationDispatcher> dispatcher,
        std::shared_ptr<DataPropagator> propagator,
        std::optional<BatchItem> batch_item = std::nullopt
    );

    ExecutionResult run(const ExecutionPlan& plan);

    const TraceExporter& get_trace_exporter() const;

    static ExecutionStatistics calculate_statistics(
        const std::vector<BlockResult>& results,
        int64_t total_execution_time_ms
    );

private:
    std::shared_ptr<ExecutionContext> context_;
    const Graph& graph_;
    ExecutionOptions options_;
    std::shared_ptr<DataPropagator> propagator_;
    std::optional<BatchItem> batch_item_;
    NodeExecutor node_executor_;
    TraceExporter trace_exporter_;
    std::unordered_set<BlockId> has_incoming_;

    void run_wave(const std::vector<const Block*>& wave, size_t wave_index);
    void record(const Block& block, BlockExecution execution);
    void skip_unattempted(const ExecutionPlan& plan, const std::unordered_set<BlockId>& attempted);
    ExecutionResult finalize();
    void notify_progress();
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_SCHEDULER_EXECUTION_SESSION_H
