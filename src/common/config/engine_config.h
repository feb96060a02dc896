// common/config/engine_config.h
#ifndef CANVASFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
#define CANVASFLOW_COMMON_CONFIG_ENGINE_CONFIG_H

#include "core/types/graph.h"
#include "core/types/execution.h"
#include "common/utils/logger.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace canvasflow {

struct LlmConfig {
    std::string model_path;   // empty: no local text backend
    int n_ctx = 2048;
    int n_threads = 4;
    float temperature = 0.7f;
    float min_p = 0.05f;
    int n_predict = 512;
};

struct EngineConfig {
    LogLevel log_level = LogLevel::INFO;
    size_t max_concurrency = 1;
    int64_t dispatch_timeout_ms = 0;
    std::optional<RetryPolicy> retry_policy;
    LlmConfig llm;
    // inja templates per block kind; variables: prompt, block
    std::unordered_map<BlockKind, std::string> prompt_templates;

    // Options every run starts from before per-call overrides
    ExecutionOptions make_options() const;
};

// Every key is optional. Relative llm.model_path values are resolved against
// `base_dir`. Throws std::runtime_error naming the key on a type mismatch.
EngineConfig parse_engine_config(const nlohmann::json& j, const std::string& base_dir = ".");

// JSON or YAML by extension. Throws std::runtime_error if the file is
// missing or malformed.
EngineConfig load_engine_config(const std::string& path);

} // namespace canvasflow

#endif // CANVASFLOW_COMMON_CONFIG_ENGINE_CONFIG_H
