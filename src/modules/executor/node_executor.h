// modules/executor/node_executor.h
#ifndef CANVASFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
#define CANVASFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include "modules/batch/batch_input.h"
#include "modules/dispatch/generation_dispatcher.h"
#include "modules/propagation/data_propagator.h"
#include "modules/resolver/variable_resolver.h"
#include "modules/scheduler/execution_context.h"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace canvasflow {

class DispatchTimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything one block attempt produced, for the result list and the trace
struct BlockExecution {
    BlockResult result;
    std::vector<BlockNumber> inputs;
    std::optional<std::string> resolved_prompt;
};

// Runs a single block: upstream fetch, variable resolution, batch
// substitution, dispatch with retries. Never throws; every failure ends up
// in the returned BlockResult.
class NodeExecutor {
public:
    NodeExecutor(const VariableResolver& resolver, std::shared_ptr<GenerationDispatcher> dispatcher);

    BlockExecution execute(
        const Block& block,
        const DataPropagator& propagator,
        ExecutionContext& context,
        const ExecutionOptions& options,
        const BatchItem* batch_item = nullptr,
        bool is_source = false
    );

private:
    const VariableResolver& resolver_;
    std::shared_ptr<GenerationDispatcher> dispatcher_;

    // Applies options.dispatch_timeout_ms when positive
    std::string dispatch(const GenerationRequest& request, const ExecutionOptions& options);
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_EXECUTOR_NODE_EXECUTOR_H
