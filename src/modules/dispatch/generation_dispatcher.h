// modules/dispatch/generation_dispatcher.h
#ifndef CANVASFLOW_MODULES_DISPATCH_GENERATION_DISPATCHER_H
#define CANVASFLOW_MODULES_DISPATCH_GENERATION_DISPATCHER_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace canvasflow {

struct GenerationRequest {
    BlockId block_id;
    BlockNumber block_number;
    BlockKind kind = BlockKind::TEXT;
    std::string prompt;       // fully resolved
    Value parameters;         // Block::parameters
};

// Performs the actual content generation for one block.
// Failure is reported by throwing, never by returning an empty output.
class GenerationDispatcher {
public:
    virtual ~GenerationDispatcher() = default;
    virtual std::string generate(const GenerationRequest& request, const ExecutionOptions& options) = 0;
};

using GenerationBackend = std::function<std::string(const GenerationRequest&, const ExecutionOptions&)>;

// Routes each request to the backend registered for its block kind.
// Register backends before any run starts; lookups are not synchronized with registration.
class RoutingDispatcher : public GenerationDispatcher {
public:
    template <typename Func>
    void register_backend(BlockKind kind, Func&& func) {
        backends_[kind] = std::forward<Func>(func);
    }

    bool has_backend(BlockKind kind) const;
    std::vector<BlockKind> list_backends() const;

    std::string generate(const GenerationRequest& request, const ExecutionOptions& options) override;

private:
    std::unordered_map<BlockKind, GenerationBackend> backends_;
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_DISPATCH_GENERATION_DISPATCHER_H
