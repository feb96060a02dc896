// modules/validator/graph_validator.cpp
#include "modules/validator/graph_validator.h"
#include <queue>

namespace canvasflow {

GraphValidator::GraphValidator(const VariableResolver& resolver) : resolver_(resolver) {}

ValidationResult GraphValidator::validate(const Graph& graph) const {
    ValidationResult result;

    check_duplicate_ids(graph, result);
    check_cycles(graph, result);
    check_dangling_connections(graph, result);
    check_variables(graph, result);
    check_warnings(graph, result);

    result.is_valid = result.errors.empty();
    return result;
}

void GraphValidator::check_duplicate_ids(const Graph& graph, ValidationResult& result) const {
    std::unordered_set<BlockId> seen;
    for (const auto& block : graph.blocks) {
        if (!seen.insert(block.id).second) {
            result.errors.push_back({
                ValidationErrorType::DUPLICATE_BLOCK,
                "Duplicate block id: " + block.id,
                block.id,
                std::nullopt
            });
        }
    }
}

void GraphValidator::check_cycles(const Graph& graph, ValidationResult& result) const {
    Adjacency adjacency;
    std::unordered_set<BlockId> known;
    for (const auto& block : graph.blocks) {
        adjacency[block.id];
        known.insert(block.id);
    }
    // Dangling endpoints are reported by check_dangling_connections
    for (const auto& conn : graph.connections) {
        if (known.count(conn.from_id) && known.count(conn.to_id)) {
            adjacency[conn.from_id].emplace_back(conn.to_id, conn.id);
        }
    }

    std::unordered_set<BlockId> visited;
    std::unordered_set<BlockId> on_stack;
    for (const auto& block : graph.blocks) {
        if (visited.count(block.id) == 0) {
            visit(block.id, adjacency, visited, on_stack, result);
        }
    }
}

void GraphValidator::visit(const BlockId& node,
                           const Adjacency& adjacency,
                           std::unordered_set<BlockId>& visited,
                           std::unordered_set<BlockId>& on_stack,
                           ValidationResult& result) const {
    visited.insert(node);
    on_stack.insert(node);

    auto it = adjacency.find(node);
    if (it != adjacency.end()) {
        for (const auto& [next, connection_id] : it->second) {
            if (on_stack.count(next)) {
                // Back-edge: `next` is still on the DFS stack
                result.errors.push_back({
                    ValidationErrorType::CIRCULAR_DEPENDENCY,
                    "Circular dependency detected: connection " + connection_id
                        + " (" + node + " -> " + next + ") closes a cycle",
                    node,
                    connection_id
                });
            } else if (visited.count(next) == 0) {
                visit(next, adjacency, visited, on_stack, result);
            }
        }
    }

    on_stack.erase(node);
}

void GraphValidator::check_dangling_connections(const Graph& graph, ValidationResult& result) const {
    std::unordered_set<BlockId> known;
    for (const auto& block : graph.blocks) {
        known.insert(block.id);
    }

    for (const auto& conn : graph.connections) {
        if (known.count(conn.from_id) == 0) {
            result.errors.push_back({
                ValidationErrorType::MISSING_BLOCK,
                "Connection " + conn.id + " references missing source block: " + conn.from_id,
                std::nullopt,
                conn.id
            });
        }
        if (known.count(conn.to_id) == 0) {
            result.errors.push_back({
                ValidationErrorType::MISSING_BLOCK,
                "Connection " + conn.id + " references missing target block: " + conn.to_id,
                std::nullopt,
                conn.id
            });
        }
    }
}

std::vector<BlockId> GraphValidator::upstream_blocks(const BlockId& block_id, const std::vector<Connection>& connections) {
    std::unordered_map<BlockId, std::vector<BlockId>> predecessors;
    for (const auto& conn : connections) {
        predecessors[conn.to_id].push_back(conn.from_id);
    }

    std::vector<BlockId> upstream;
    std::unordered_set<BlockId> seen{block_id};
    std::queue<BlockId> pending;
    pending.push(block_id);
    while (!pending.empty()) {
        BlockId current = pending.front();
        pending.pop();
        auto it = predecessors.find(current);
        if (it == predecessors.end()) continue;
        for (const auto& pred : it->second) {
            if (seen.insert(pred).second) {
                upstream.push_back(pred);
                pending.push(pred);
            }
        }
    }
    return upstream;
}

void GraphValidator::check_variables(const Graph& graph, ValidationResult& result) const {
    std::unordered_map<BlockId, const Block*> by_id;
    for (const auto& block : graph.blocks) {
        by_id.emplace(block.id, &block);
    }

    for (const auto& block : graph.blocks) {
        if (block.prompt_template.empty()) continue;

        std::vector<BlockNumber> available;
        for (const auto& upstream_id : upstream_blocks(block.id, graph.connections)) {
            auto it = by_id.find(upstream_id);
            if (it != by_id.end()) {
                available.push_back(it->second->number);
            }
        }

        for (auto& error : resolver_.validate(block.prompt_template, available)) {
            error.block_id = block.id;
            error.message = "Block " + block.number + ": " + error.message;
            result.errors.push_back(std::move(error));
        }
    }
}

void GraphValidator::check_warnings(const Graph& graph, ValidationResult& result) const {
    if (graph.connections.size() > PERFORMANCE_WARNING_CONNECTIONS) {
        result.warnings.push_back({
            "performance",
            "High number of connections (" + std::to_string(graph.connections.size()) + ") may impact performance"
        });
    }
}

} // namespace canvasflow
