// modules/parser/graph_loader.cpp
#include "modules/parser/graph_loader.h"
#include "common/utils/logger.h"
#include "common/utils/yaml_json.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace canvasflow {

Graph GraphLoader::parse_from_json(const nlohmann::json& document) const {
    try {
        Graph graph = document.get<Graph>();
        log_fmt(LogLevel::DEBUG, "GraphLoader", "Parsed graph with ", graph.blocks.size(),
                " blocks and ", graph.connections.size(), " connections");
        return graph;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed graph document: ") + e.what());
    }
}

Graph GraphLoader::parse_from_string(const std::string& content, GraphFormat format) const {
    if (format == GraphFormat::MARKDOWN) {
        GraphFormat inner = GraphFormat::YAML;
        std::string fenced = extract_fenced_graph(content, inner);
        return parse_from_string(fenced, inner);
    }

    nlohmann::json document;
    if (format == GraphFormat::JSON) {
        try {
            document = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(std::string("Invalid graph JSON: ") + e.what());
        }
    } else {
        try {
            document = yaml_to_json(YAML::Load(content));
        } catch (const YAML::Exception& e) {
            throw std::runtime_error(std::string("Invalid graph YAML: ") + e.what());
        }
    }
    return parse_from_json(document);
}

Graph GraphLoader::parse_from_file(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return parse_from_string(buffer.str(), format_for_path(file_path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(file_path + ": " + e.what());
    }
}

GraphFormat GraphLoader::format_for_path(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json") return GraphFormat::JSON;
    if (ext == ".md" || ext == ".markdown") return GraphFormat::MARKDOWN;
    return GraphFormat::YAML;
}

std::string GraphLoader::extract_fenced_graph(const std::string& markdown, GraphFormat& inner_format) {
    static const std::regex fence(R"(```(yaml|yml|json)[^\n]*\n([\s\S]*?)```)");
    std::smatch match;
    if (!std::regex_search(markdown, match, fence)) {
        throw std::runtime_error("No ```yaml or ```json block found in markdown");
    }
    inner_format = match[1].str() == "json" ? GraphFormat::JSON : GraphFormat::YAML;
    return match[2].str();
}

} // namespace canvasflow
