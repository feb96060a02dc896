// core/types/validation.cpp
#include "core/types/validation.h"

namespace canvasflow {

std::string to_string(ValidationErrorType type) {
    switch (type) {
        case ValidationErrorType::CIRCULAR_DEPENDENCY: return "circular_dependency";
        case ValidationErrorType::MISSING_BLOCK: return "missing_block";
        case ValidationErrorType::INVALID_VARIABLE: return "invalid_variable";
        case ValidationErrorType::DUPLICATE_BLOCK: return "duplicate_block";
    }
    return "unknown";
}

std::string ValidationResult::summary() const {
    std::string out;
    for (const auto& error : errors) {
        if (!out.empty()) out += ", ";
        out += error.message;
    }
    return out;
}

void to_json(nlohmann::json& j, const ValidationError& error) {
    j = nlohmann::json{
        {"type", to_string(error.type)},
        {"message", error.message}
    };
    if (error.block_id) j["blockId"] = *error.block_id;
    if (error.connection_id) j["connectionId"] = *error.connection_id;
}

void to_json(nlohmann::json& j, const ValidationResult& result) {
    j = nlohmann::json{
        {"isValid", result.is_valid},
        {"errors", result.errors},
        {"warnings", nlohmann::json::array()}
    };
    for (const auto& warning : result.warnings) {
        j["warnings"].push_back({{"type", warning.type}, {"message", warning.message}});
    }
}

} // namespace canvasflow
