// modules/executor/node_executor.cpp
#include "modules/executor/node_executor.h"
#include "common/utils/logger.h"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace canvasflow {

NodeExecutor::NodeExecutor(const VariableResolver& resolver, std::shared_ptr<GenerationDispatcher> dispatcher)
    : resolver_(resolver), dispatcher_(std::move(dispatcher)) {
    if (!dispatcher_) {
        throw std::invalid_argument("NodeExecutor requires a GenerationDispatcher");
    }
}

std::string NodeExecutor::dispatch(const GenerationRequest& request, const ExecutionOptions& options) {
    if (options.dispatch_timeout_ms <= 0) {
        return dispatcher_->generate(request, options);
    }

    // The worker owns copies of everything it touches, so an abandoned call
    // can finish after this block has already been marked failed.
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();
    std::thread([dispatcher = dispatcher_, request, options, promise]() {
        try {
            promise->set_value(dispatcher->generate(request, options));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(options.dispatch_timeout_ms)) == std::future_status::timeout) {
        throw DispatchTimeoutError("Dispatch timed out after " + std::to_string(options.dispatch_timeout_ms) + "ms");
    }
    return future.get();
}

BlockExecution NodeExecutor::execute(
    const Block& block,
    const DataPropagator& propagator,
    ExecutionContext& context,
    const ExecutionOptions& options,
    const BatchItem* batch_item,
    bool is_source) {

    BlockExecution execution;
    BlockResult& result = execution.result;
    result.block_id = block.id;
    result.block_number = block.number;

    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    GenerationRequest request;
    try {
        UpstreamData upstream = propagator.get_upstream_data(block.id);
        for (const auto& [number, output] : upstream) {
            execution.inputs.push_back(number);
        }
        std::sort(execution.inputs.begin(), execution.inputs.end());

        // Batch placeholders go into the template, so upstream outputs are
        // passed through untouched.
        const std::string prompt_template = batch_item
            ? apply_batch_placeholders(block.prompt_template, *batch_item, is_source)
            : block.prompt_template;
        std::string prompt = resolver_.resolve(prompt_template, upstream);
        execution.resolved_prompt = prompt;

        request.block_id = block.id;
        request.block_number = block.number;
        request.kind = block.kind;
        request.prompt = std::move(prompt);
        request.parameters = block.parameters;
    } catch (const std::exception& e) {
        result.status = BlockStatus::FAILED;
        result.error = std::string("Prompt preparation failed: ") + e.what();
        result.execution_time_ms = elapsed_ms();
        return execution;
    }

    const RetryPolicy policy = options.retry_policy.value_or(RetryPolicy{});
    std::string last_error;
    for (int attempt = 0;; ++attempt) {
        try {
            result.output = dispatch(request, options);
            result.status = BlockStatus::COMPLETED;
            result.error.reset();
            result.execution_time_ms = elapsed_ms();
            return execution;
        } catch (const std::exception& e) {
            last_error = e.what();
        } catch (...) {
            last_error = "Unknown dispatch failure";
        }

        if (attempt >= policy.max_retries) {
            break;
        }
        auto delay = policy.delay_for(attempt + 1);
        log_fmt(LogLevel::WARN, "NodeExecutor", "Block ", block.number, " failed (", last_error,
                "), retry ", attempt + 1, "/", policy.max_retries, " in ", delay.count(), "ms");
        if (!context.wait_for_backoff(delay)) {
            Logger::info("NodeExecutor", "Retry of block " + block.number + " abandoned: execution cancelled");
            break;
        }
        result.retry_count = attempt + 1;
    }

    result.status = BlockStatus::FAILED;
    result.output.reset();
    result.error = last_error;
    result.execution_time_ms = elapsed_ms();
    return execution;
}

} // namespace canvasflow
