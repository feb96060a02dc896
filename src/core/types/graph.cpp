// core/types/graph.cpp
#include "core/types/graph.h"
#include <stdexcept>

namespace canvasflow {

std::string to_string(BlockKind kind) {
    switch (kind) {
        case BlockKind::TEXT: return "text";
        case BlockKind::IMAGE: return "image";
        case BlockKind::VIDEO: return "video";
    }
    return "unknown";
}

BlockKind parse_block_kind(std::string_view name) {
    if (name == "text") return BlockKind::TEXT;
    if (name == "image") return BlockKind::IMAGE;
    if (name == "video") return BlockKind::VIDEO;
    throw std::runtime_error("Unknown block kind '" + std::string(name) + "'");
}

const Block* Graph::find_block(const BlockId& id) const {
    for (const auto& block : blocks) {
        if (block.id == id) {
            return &block;
        }
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const Block& block) {
    j = nlohmann::json{
        {"id", block.id},
        {"number", block.number},
        {"kind", to_string(block.kind)},
        {"prompt", block.prompt_template}
    };
    if (!block.parameters.empty()) {
        j["parameters"] = block.parameters;
    }
}

void from_json(const nlohmann::json& j, Block& block) {
    if (!j.is_object()) {
        throw std::runtime_error("Block entry must be an object");
    }
    if (!j.contains("id") || !j["id"].is_string()) {
        throw std::runtime_error("Block is missing string field 'id'");
    }
    block.id = j["id"].get<std::string>();
    if (!j.contains("number") || !j["number"].is_string()) {
        throw std::runtime_error("Missing 'number' in block: " + block.id);
    }
    block.number = j["number"].get<std::string>();
    block.kind = parse_block_kind(j.value("kind", std::string("text")));
    // "prompt" is the file-format name, "prompt_template" is accepted as well
    if (j.contains("prompt")) {
        block.prompt_template = j["prompt"].get<std::string>();
    } else {
        block.prompt_template = j.value("prompt_template", std::string());
    }
    if (j.contains("parameters")) {
        if (!j["parameters"].is_object()) {
            throw std::runtime_error("'parameters' must be a map in block: " + block.id);
        }
        block.parameters = j["parameters"];
    } else {
        block.parameters = nlohmann::json::object();
    }
}

void to_json(nlohmann::json& j, const Connection& connection) {
    j = nlohmann::json{
        {"id", connection.id},
        {"from", connection.from_id},
        {"to", connection.to_id}
    };
}

void from_json(const nlohmann::json& j, Connection& connection) {
    if (!j.is_object()) {
        throw std::runtime_error("Connection entry must be an object");
    }
    connection.from_id = j.at("from").get<std::string>();
    connection.to_id = j.at("to").get<std::string>();
    // Connections written by hand often omit the id
    connection.id = j.value("id", connection.from_id + "->" + connection.to_id);
}

void to_json(nlohmann::json& j, const Graph& graph) {
    j = nlohmann::json{
        {"blocks", graph.blocks},
        {"connections", graph.connections}
    };
}

void from_json(const nlohmann::json& j, Graph& graph) {
    if (!j.is_object() || !j.contains("blocks") || !j["blocks"].is_array()) {
        throw std::runtime_error("Graph must contain a 'blocks' sequence");
    }
    graph.blocks = j["blocks"].get<std::vector<Block>>();
    graph.connections.clear();
    if (j.contains("connections")) {
        if (!j["connections"].is_array()) {
            throw std::runtime_error("'connections' must be a sequence");
        }
        graph.connections = j["connections"].get<std::vector<Connection>>();
    }
}

} // namespace canvasflow
