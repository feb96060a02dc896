// modules/validator/graph_validator.h
#ifndef CANVASFLOW_MODULES_VALIDATOR_GRAPH_VALIDATOR_H
#define CANVASFLOW_MODULES_VALIDATOR_GRAPH_VALIDATOR_H

#include "core/types/graph.h"
#include "core/types/validation.h"
#include "modules/resolver/variable_resolver.h"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace canvasflow {

// Runs every structural check and unions the findings; nothing short-circuits
class GraphValidator {
public:
    static constexpr size_t PERFORMANCE_WARNING_CONNECTIONS = 20;

    explicit GraphValidator(const VariableResolver& resolver);

    ValidationResult validate(const Graph& graph) const;

    // All blocks reachable from `block_id` by following connections backward
    static std::vector<BlockId> upstream_blocks(const BlockId& block_id, const std::vector<Connection>& connections);

private:
    const VariableResolver& resolver_;

    // successor id, connection id
    using Adjacency = std::unordered_map<BlockId, std::vector<std::pair<BlockId, std::string>>>;

    void check_duplicate_ids(const Graph& graph, ValidationResult& result) const;
    void check_cycles(const Graph& graph, ValidationResult& result) const;
    void check_dangling_connections(const Graph& graph, ValidationResult& result) const;
    void check_variables(const Graph& graph, ValidationResult& result) const;
    void check_warnings(const Graph& graph, ValidationResult& result) const;

    void visit(const BlockId& node,
               const Adjacency& adjacency,
               std::unordered_set<BlockId>& visited,
               std::unordered_set<BlockId>& on_stack,
               ValidationResult& result) const;
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_VALIDATOR_GRAPH_VALIDATOR_H
