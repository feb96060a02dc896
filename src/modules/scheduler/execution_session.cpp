// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"
#include "common/utils/logger.h"
#include <chrono>
#include <future>
#include <stdexcept>

namespace canvasflow {

namespace {
const char* const COMPONENT = "ExecutionSession";
const char* const SKIPPED_REASON = "Execution cancelled before block started";
}

ExecutionSession::ExecutionSession(
    std::shared_ptr<ExecutionContext> context,
    const Graph& graph,
    ExecutionOptions options,
    const VariableResolver& resolver,
    std::shared_ptr<GenerationDispatcher> dispatcher,
    std::shared_ptr<DataPropagator> propagator,
    std::optional<BatchItem> batch_item)
    : context_(std::move(context)),
      graph_(graph),
      options_(std::move(options)),
      propagator_(std::move(propagator)),
      batch_item_(std::move(batch_item)),
      node_executor_(resolver, std::move(dispatcher)),
      trace_exporter_(context_->execution_id()) {

    if (!propagator_) {
        throw std::invalid_argument("ExecutionSession requires a DataPropagator");
    }
    if (options_.max_concurrency == 0) {
        options_.max_concurrency = 1;
    }
    for (const auto& conn : graph_.connections) {
        has_incoming_.insert(conn.to_id);
    }
}

const TraceExporter& ExecutionSession::get_trace_exporter() const {
    return trace_exporter_;
}

ExecutionResult ExecutionSession::run(const ExecutionPlan& plan) {
    const ExecutionId& id = context_->execution_id();
    log_fmt(LogLevel::INFO, COMPONENT, id, ": starting ", graph_.blocks.size(), " blocks in ",
            plan.size(), " waves (max_concurrency=", options_.max_concurrency, ")");

    std::unordered_set<BlockId> attempted;
    for (size_t wave_index = 0; wave_index < plan.size(); ++wave_index) {
        if (!context_->wait_until_runnable()) {
            Logger::info(COMPONENT, id + ": cancelled before wave " + std::to_string(wave_index));
            break;
        }

        std::vector<const Block*> wave;
        for (const auto& block_id : plan[wave_index]) {
            const Block* block = graph_.find_block(block_id);
            if (!block) {
                throw std::logic_error("Execution plan references unknown block " + block_id);
            }
            wave.push_back(block);
            attempted.insert(block_id);
        }
        run_wave(wave, wave_index);
    }

    skip_unattempted(plan, attempted);
    return finalize();
}

void ExecutionSession::run_wave(const std::vector<const Block*>& wave, size_t wave_index) {
    std::string current;
    for (const Block* block : wave) {
        if (!current.empty()) current += ",";
        current += block->number;
        trace_exporter_.on_block_start(*block, wave_index);
    }
    context_->set_current(current);

    std::vector<BlockExecution> executions;
    executions.reserve(wave.size());

    const BatchItem* item = batch_item_ ? &*batch_item_ : nullptr;
    if (wave.size() == 1) {
        const Block* block = wave.front();
        executions.push_back(node_executor_.execute(
            *block, *propagator_, *context_, options_, item, !has_incoming_.count(block->id)));
    } else {
        std::vector<std::future<BlockExecution>> futures;
        futures.reserve(wave.size());
        for (const Block* block : wave) {
            bool is_source = !has_incoming_.count(block->id);
            futures.push_back(std::async(std::launch::async, [this, block, item, is_source]() {
                return node_executor_.execute(*block, *propagator_, *context_, options_, item, is_source);
            }));
        }
        for (auto& future : futures) {
            executions.push_back(future.get());
        }
    }

    for (size_t i = 0; i < wave.size(); ++i) {
        record(*wave[i], std::move(executions[i]));
    }
}

void ExecutionSession::record(const Block& block, BlockExecution execution) {
    const BlockResult& result = execution.result;
    trace_exporter_.on_block_end(block.id, result, execution.inputs, execution.resolved_prompt);

    if (result.status == BlockStatus::COMPLETED) {
        propagator_->propagate(block.id, result.output.value_or(""), block.kind, block.number);
        log_fmt(LogLevel::DEBUG, COMPONENT, context_->execution_id(), ": block ", block.number,
                " completed in ", result.execution_time_ms, "ms");
    } else {
        ExecutionError error;
        error.block_id = block.id;
        error.block_number = block.number;
        error.error = result.error.value_or("Unknown error");
        error.timestamp = std::chrono::system_clock::now();
        error.retry_count = result.retry_count;

        log_fmt(LogLevel::WARN, COMPONENT, context_->execution_id(), ": block ", block.number,
                " failed: ", error.error);
        context_->add_error(error);
        if (options_.observer && options_.notification_settings.on_error) {
            options_.observer->on_block_failed(context_->execution_id(), error);
        }
    }

    context_->add_result(std::move(execution.result));
    notify_progress();
}

void ExecutionSession::skip_unattempted(const ExecutionPlan& plan, const std::unordered_set<BlockId>& attempted) {
    for (const auto& wave : plan) {
        for (const auto& block_id : wave) {
            if (attempted.count(block_id)) continue;
            const Block* block = graph_.find_block(block_id);
            if (!block) continue;

            BlockResult skipped;
            skipped.block_id = block->id;
            skipped.block_number = block->number;
            skipped.status = BlockStatus::SKIPPED;
            skipped.error = SKIPPED_REASON;
            trace_exporter_.on_block_skipped(*block, SKIPPED_REASON);
            context_->add_result(std::move(skipped));
        }
    }
}

ExecutionResult ExecutionSession::finalize() {
    ExecutionResult result;
    result.execution_id = context_->execution_id();
    result.results = context_->results();

    const int64_t wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - context_->start_time()).count();
    result.statistics = calculate_statistics(result.results, wall_ms);

    if (context_->is_cancelled()) {
        result.status = ExecutionStatus::CANCELLED;
    } else if (result.statistics.failed_blocks > 0) {
        result.status = ExecutionStatus::FAILED;
    } else {
        result.status = ExecutionStatus::COMPLETED;
    }

    auto errors = context_->errors();
    if (!errors.empty()) {
        result.errors = std::move(errors);
    }

    context_->finish(result.status);
    log_fmt(LogLevel::INFO, COMPONENT, result.execution_id, ": ", to_string(result.status),
            " (completed=", result.statistics.completed_blocks,
            ", failed=", result.statistics.failed_blocks,
            ", skipped=", result.statistics.skipped_blocks,
            ", ", result.statistics.total_execution_time_ms, "ms)");

    if (options_.observer && options_.notification_settings.on_completion) {
        options_.observer->on_completed(result);
    }
    return result;
}

void ExecutionSession::notify_progress() {
    if (options_.observer && options_.notification_settings.on_progress) {
        options_.observer->on_progress(context_->snapshot());
    }
}

ExecutionStatistics ExecutionSession::calculate_statistics(
    const std::vector<BlockResult>& results,
    int64_t total_execution_time_ms) {

    ExecutionStatistics stats;
    stats.total_blocks = results.size();
    stats.total_execution_time_ms = total_execution_time_ms;

    int64_t block_time_sum = 0;
    for (const auto& r : results) {
        switch (r.status) {
            case BlockStatus::COMPLETED: stats.completed_blocks++; break;
            case BlockStatus::FAILED: stats.failed_blocks++; break;
            case BlockStatus::SKIPPED: stats.skipped_blocks++; break;
        }
        block_time_sum += r.execution_time_ms;
    }
    if (!results.empty()) {
        stats.average_block_time_ms = static_cast<double>(block_time_sum) / static_cast<double>(results.size());
    }
    return stats;
}

} // namespace canvasflow
