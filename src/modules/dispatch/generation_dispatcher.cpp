// modules/dispatch/generation_dispatcher.cpp
#include "modules/dispatch/generation_dispatcher.h"
#include <algorithm>
#include <stdexcept>

namespace canvasflow {

namespace {

std::string kind_label(BlockKind kind) {
    switch (kind) {
        case BlockKind::TEXT: return "Text";
        case BlockKind::IMAGE: return "Image";
        case BlockKind::VIDEO: return "Video";
    }
    return "Unknown";
}

} // namespace

bool RoutingDispatcher::has_backend(BlockKind kind) const {
    return backends_.count(kind) > 0;
}

std::vector<BlockKind> RoutingDispatcher::list_backends() const {
    std::vector<BlockKind> kinds;
    for (const auto& [kind, backend] : backends_) {
        kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

std::string RoutingDispatcher::generate(const GenerationRequest& request, const ExecutionOptions& options) {
    auto it = backends_.find(request.kind);
    if (it == backends_.end()) {
        throw std::runtime_error("Unsupported block type: " + to_string(request.kind));
    }
    try {
        return it->second(request, options);
    } catch (const std::exception& e) {
        throw std::runtime_error(kind_label(request.kind) + " generation failed: " + e.what());
    }
}

} // namespace canvasflow
