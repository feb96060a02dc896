// core/engine.h
#ifndef CANVASFLOW_CORE_ENGINE_H
#define CANVASFLOW_CORE_ENGINE_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include "core/types/validation.h"
#include "common/config/engine_config.h"
#include "modules/batch/batch_input.h"
#include "modules/dispatch/generation_dispatcher.h"
#include "modules/propagation/data_propagator.h"
#include "modules/resolver/variable_resolver.h"
#include "modules/scheduler/execution_registry.h"
#include "modules/scheduler/execution_session.h"
#include "modules/trace/trace_exporter.h"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace canvasflow {

// Thrown before anything is registered when a graph fails validation
class WorkflowValidationError : public std::runtime_error {
public:
    explicit WorkflowValidationError(ValidationResult result);
    const ValidationResult& result() const { return result_; }

private:
    ValidationResult result_;
};

struct ExecutionHandle {
    ExecutionId execution_id;
    // Destroying an unfetched future waits for the run to finish
    std::future<ExecutionResult> result;
};

class WorkflowEngine {
public:
    explicit WorkflowEngine(
        std::shared_ptr<GenerationDispatcher> dispatcher,
        std::shared_ptr<VariableResolver> resolver = nullptr,   // PatternVariableResolver when null
        PropagatorFactory propagator_factory = nullptr          // InMemoryDataPropagator when null
    );

    // Applies log_level and uses the config's run defaults for the
    // option-less overloads.
    static std::unique_ptr<WorkflowEngine> from_config(
        const EngineConfig& config,
        std::shared_ptr<GenerationDispatcher> dispatcher
    );

    ValidationResult validate_workflow(const Graph& graph) const;

    // Blocking run. Throws WorkflowValidationError for an invalid graph.
    ExecutionResult execute_workflow(const Graph& graph);
    ExecutionResult execute_workflow(const Graph& graph, const ExecutionOptions& options);

    // Validates and registers on the calling thread, then runs on a worker.
    // The engine must outlive the returned future.
    ExecutionHandle start_workflow(const Graph& graph);
    ExecutionHandle start_workflow(const Graph& graph, const ExecutionOptions& options);

    // One full run per item of options.batch_input, in item order.
    // Throws std::invalid_argument when no batch input is set.
    std::vector<ExecutionResult> execute_batch(const Graph& graph, const ExecutionOptions& options);

    // Unknown or finished ids are ignored
    void pause_execution(const ExecutionId& execution_id);
    void resume_execution(const ExecutionId& execution_id);
    void cancel_execution(const ExecutionId& execution_id);

    std::optional<ExecutionStatusSnapshot> get_execution_status(const ExecutionId& execution_id) const;
    std::vector<ExecutionId> active_executions() const;

    std::vector<TraceRecord> get_last_traces() const;

    const ExecutionOptions& default_options() const { return default_options_; }
    void set_default_options(ExecutionOptions options) { default_options_ = std::move(options); }

private:
    std::shared_ptr<GenerationDispatcher> dispatcher_;
    std::shared_ptr<VariableResolver> resolver_;
    PropagatorFactory propagator_factory_;
    ExecutionOptions default_options_;
    ExecutionRegistry registry_;

    mutable std::mutex traces_mutex_;
    std::vector<TraceRecord> last_traces_;

    // Validates and builds the wave plan; throws WorkflowValidationError
    ExecutionPlan prepare(const Graph& graph, const ExecutionOptions& options) const;
    std::shared_ptr<ExecutionContext> register_run(const Graph& graph, const ExecutionOptions& options);
    ExecutionResult run(
        const Graph& graph,
        const ExecutionPlan& plan,
        const ExecutionOptions& options,
        std::shared_ptr<ExecutionContext> context,
        std::optional<BatchItem> batch_item = std::nullopt
    );
};

} // namespace canvasflow

#endif // CANVASFLOW_CORE_ENGINE_H
