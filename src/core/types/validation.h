#ifndef CANVASFLOW_TYPES_VALIDATION_H
#define CANVASFLOW_TYPES_VALIDATION_H

#include "graph.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canvasflow {

enum class ValidationErrorType : uint8_t {
    CIRCULAR_DEPENDENCY,
    MISSING_BLOCK,
    INVALID_VARIABLE,
    DUPLICATE_BLOCK
};

std::string to_string(ValidationErrorType type);

struct ValidationError {
    ValidationErrorType type;
    std::string message;
    std::optional<BlockId> block_id;
    std::optional<std::string> connection_id;
};

struct ValidationWarning {
    std::string type; // e.g. "performance"
    std::string message;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;

    // Joins every error message with ", "
    std::string summary() const;
};

void to_json(nlohmann::json& j, const ValidationError& error);
void to_json(nlohmann::json& j, const ValidationResult& result);

} // namespace canvasflow

#endif // CANVASFLOW_TYPES_VALIDATION_H
