#ifndef CANVASFLOW_TYPES_CONTEXT_H
#define CANVASFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace canvasflow {

// nlohmann::json is the engine's dynamic value type (block parameters, config, exports)
using Value = nlohmann::json;

} // namespace canvasflow

#endif // CANVASFLOW_TYPES_CONTEXT_H
