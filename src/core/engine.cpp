// core/engine.cpp
#include "core/engine.h"
#include "common/utils/logger.h"
#include "modules/scheduler/topo_scheduler.h"
#include "modules/validator/graph_validator.h"
#include <algorithm>

namespace canvasflow {

WorkflowValidationError::WorkflowValidationError(ValidationResult result)
    : std::runtime_error("Workflow validation failed: " + result.summary()),
      result_(std::move(result)) {}

WorkflowEngine::WorkflowEngine(
    std::shared_ptr<GenerationDispatcher> dispatcher,
    std::shared_ptr<VariableResolver> resolver,
    PropagatorFactory propagator_factory)
    : dispatcher_(std::move(dispatcher)),
      resolver_(resolver ? std::move(resolver) : std::make_shared<PatternVariableResolver>()),
      propagator_factory_(propagator_factory ? std::move(propagator_factory) : InMemoryDataPropagator::factory()) {
    if (!dispatcher_) {
        throw std::invalid_argument("WorkflowEngine requires a GenerationDispatcher");
    }
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config(
    const EngineConfig& config,
    std::shared_ptr<GenerationDispatcher> dispatcher) {
    Logger::set_level(config.log_level);
    auto engine = std::make_unique<WorkflowEngine>(std::move(dispatcher));
    engine->set_default_options(config.make_options());
    return engine;
}

ValidationResult WorkflowEngine::validate_workflow(const Graph& graph) const {
    GraphValidator validator(*resolver_);
    return validator.validate(graph);
}

ExecutionPlan WorkflowEngine::prepare(const Graph& graph, const ExecutionOptions& options) const {
    ValidationResult validation = validate_workflow(graph);
    for (const auto& warning : validation.warnings) {
        Logger::warn("WorkflowEngine", warning.message);
    }
    if (!validation.is_valid) {
        Logger::error("WorkflowEngine", "Rejected workflow: " + validation.summary());
        throw WorkflowValidationError(std::move(validation));
    }

    TopoScheduler scheduler(graph.blocks, graph.connections);
    return scheduler.waves(std::max<size_t>(options.max_concurrency, 1));
}

std::shared_ptr<ExecutionContext> WorkflowEngine::register_run(const Graph& graph, const ExecutionOptions& options) {
    auto context = registry_.create(graph.blocks.size());
    if (options.observer) {
        options.observer->on_started(context->execution_id());
    }
    return context;
}

ExecutionResult WorkflowEngine::run(
    const Graph& graph,
    const ExecutionPlan& plan,
    const ExecutionOptions& options,
    std::shared_ptr<ExecutionContext> context,
    std::optional<BatchItem> batch_item) {

    const ExecutionId id = context->execution_id();
    try {
        ExecutionSession session(context, graph, options, *resolver_, dispatcher_,
                                 propagator_factory_(graph), std::move(batch_item));
        ExecutionResult result = session.run(plan);
        {
            std::lock_guard<std::mutex> lock(traces_mutex_);
            last_traces_ = session.get_trace_exporter().get_traces();
        }
        registry_.remove(id);
        return result;
    } catch (...) {
        context->finish(ExecutionStatus::FAILED);
        registry_.remove(id);
        throw;
    }
}

ExecutionResult WorkflowEngine::execute_workflow(const Graph& graph) {
    return execute_workflow(graph, default_options_);
}

ExecutionResult WorkflowEngine::execute_workflow(const Graph& graph, const ExecutionOptions& options) {
    ExecutionPlan plan = prepare(graph, options);
    auto context = register_run(graph, options);
    return run(graph, plan, options, std::move(context));
}

ExecutionHandle WorkflowEngine::start_workflow(const Graph& graph) {
    return start_workflow(graph, default_options_);
}

ExecutionHandle WorkflowEngine::start_workflow(const Graph& graph, const ExecutionOptions& options) {
    ExecutionPlan plan = prepare(graph, options);
    auto context = register_run(graph, options);

    ExecutionHandle handle;
    handle.execution_id = context->execution_id();
    handle.result = std::async(std::launch::async,
        [this, graph, plan = std::move(plan), options, context]() {
            return run(graph, plan, options, context);
        });
    return handle;
}

std::vector<ExecutionResult> WorkflowEngine::execute_batch(const Graph& graph, const ExecutionOptions& options) {
    if (!options.batch_input) {
        throw std::invalid_argument("execute_batch requires options.batch_input");
    }
    ExecutionPlan plan = prepare(graph, options);

    BatchInputLoader loader;
    std::vector<BatchItem> items = loader.load(*options.batch_input);

    std::vector<ExecutionResult> results;
    results.reserve(items.size());
    for (auto& item : items) {
        log_fmt(LogLevel::INFO, "WorkflowEngine", "Batch item ", item.index + 1, "/", item.total,
                " from ", item.source);
        auto context = register_run(graph, options);
        results.push_back(run(graph, plan, options, std::move(context), std::move(item)));
    }
    return results;
}

void WorkflowEngine::pause_execution(const ExecutionId& execution_id) {
    if (auto context = registry_.find(execution_id); context && context->pause()) {
        Logger::info("WorkflowEngine", execution_id + ": paused");
    }
}

void WorkflowEngine::resume_execution(const ExecutionId& execution_id) {
    if (auto context = registry_.find(execution_id); context && context->resume()) {
        Logger::info("WorkflowEngine", execution_id + ": resumed");
    }
}

void WorkflowEngine::cancel_execution(const ExecutionId& execution_id) {
    if (auto context = registry_.find(execution_id); context && context->cancel()) {
        Logger::info("WorkflowEngine", execution_id + ": cancel requested");
    }
}

std::optional<ExecutionStatusSnapshot> WorkflowEngine::get_execution_status(const ExecutionId& execution_id) const {
    auto context = registry_.find(execution_id);
    if (!context) {
        return std::nullopt;
    }
    return context->snapshot();
}

std::vector<ExecutionId> WorkflowEngine::active_executions() const {
    return registry_.list();
}

std::vector<TraceRecord> WorkflowEngine::get_last_traces() const {
    std::lock_guard<std::mutex> lock(traces_mutex_);
    return last_traces_;
}

} // namespace canvasflow
