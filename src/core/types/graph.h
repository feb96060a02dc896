#ifndef CANVASFLOW_TYPES_GRAPH_H
#define CANVASFLOW_TYPES_GRAPH_H

#include "context.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace canvasflow {

using BlockId = std::string;      // opaque, unique within a graph
using BlockNumber = std::string;  // display label, e.g. "A01"; the variable-reference key

// Already-produced outputs visible to one block, keyed by producer number
using UpstreamData = std::unordered_map<BlockNumber, std::string>;

enum class BlockKind : uint8_t {
    TEXT,
    IMAGE,
    VIDEO
};

std::string to_string(BlockKind kind);
// Throws std::runtime_error on an unknown kind name
BlockKind parse_block_kind(std::string_view name);

struct Block {
    BlockId id;
    BlockNumber number;
    BlockKind kind = BlockKind::TEXT;
    std::string prompt_template;
    Value parameters = Value::object(); // passed through to the dispatcher untouched
};

// Directed edge: to_id may consume from_id's output
struct Connection {
    std::string id;
    BlockId from_id;
    BlockId to_id;
};

struct Graph {
    std::vector<Block> blocks;
    std::vector<Connection> connections;

    const Block* find_block(const BlockId& id) const;
};

void to_json(nlohmann::json& j, const Block& block);
void from_json(const nlohmann::json& j, Block& block);
void to_json(nlohmann::json& j, const Connection& connection);
void from_json(const nlohmann::json& j, Connection& connection);
void to_json(nlohmann::json& j, const Graph& graph);
void from_json(const nlohmann::json& j, Graph& graph);

} // namespace canvasflow

#endif // CANVASFLOW_TYPES_GRAPH_H
