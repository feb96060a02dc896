// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace canvasflow {

namespace {

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Accepts integers, floats and scientific notation
bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof();
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // Quoted scalars carry the non-specific tag "!"
            if (node.Tag() == "!") return s;

            if (s == "true")  return true;
            if (s == "false") return false;
            if (s == "~" || s == "null" || s.empty()) return nullptr;

            if (is_numeric(s)) {
                try {
                    if (is_integer(s)) {
                        return std::stoll(s);
                    }
                    return std::stod(s);
                } catch (const std::out_of_range&) {
                    // too large for a number, keep the text
                } catch (const std::invalid_argument&) {
                }
            }
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

nlohmann::json load_structured_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }

    if (std::filesystem::path(path).extension() == ".json") {
        try {
            nlohmann::json j;
            file >> j;
            return j;
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
        }
    }

    try {
        return yaml_to_json(YAML::Load(file));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid YAML in " + path + ": " + e.what());
    }
}

} // namespace canvasflow
