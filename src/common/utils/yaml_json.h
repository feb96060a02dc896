#ifndef CANVASFLOW_COMMON_UTILS_YAML_JSON_H
#define CANVASFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace canvasflow {

// Converts a YAML::Node to nlohmann::json. Plain scalars are typed
// (bool / null / integer / float), quoted scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Loads a structured document by extension: ".json" through nlohmann::json,
// anything else through yaml-cpp (YAML is a superset of JSON).
// Throws std::runtime_error if the file cannot be read or parsed.
nlohmann::json load_structured_file(const std::string& path);

} // namespace canvasflow

#endif // CANVASFLOW_COMMON_UTILS_YAML_JSON_H
