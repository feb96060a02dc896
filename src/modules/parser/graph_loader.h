// modules/parser/graph_loader.h
#ifndef CANVASFLOW_MODULES_PARSER_GRAPH_LOADER_H
#define CANVASFLOW_MODULES_PARSER_GRAPH_LOADER_H

#include "core/types/graph.h"
#include <nlohmann/json.hpp>
#include <string>

namespace canvasflow {

enum class GraphFormat : uint8_t {
    YAML,
    JSON,
    MARKDOWN // graph in the first ```yaml or ```json fence
};

// Reads graph documents. Only the document shape is checked here;
// structural validity is GraphValidator's job.
class GraphLoader {
public:
    Graph parse_from_json(const nlohmann::json& document) const;
    Graph parse_from_string(const std::string& content, GraphFormat format = GraphFormat::YAML) const;
    // Format chosen by extension: .json, .md / .markdown, anything else YAML
    Graph parse_from_file(const std::string& file_path) const;

    static GraphFormat format_for_path(const std::string& file_path);

private:
    static std::string extract_fenced_graph(const std::string& markdown, GraphFormat& inner_format);
};

} // namespace canvasflow

#endif // CANVASFLOW_MODULES_PARSER_GRAPH_LOADER_H
