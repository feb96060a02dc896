// common/config/engine_config.cpp
#include "common/config/engine_config.h"
#include "common/utils/yaml_json.h"
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace canvasflow {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void bad_key(const std::string& key, const char* expected) {
    throw std::runtime_error("Config key '" + key + "' must be " + expected);
}

const nlohmann::json* find_key(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return (it == j.end() || it->is_null()) ? nullptr : &*it;
}

template <typename T>
void read_integer(const nlohmann::json& j, const char* key, const std::string& path, T& out) {
    if (auto* v = find_key(j, key)) {
        if (!v->is_number_integer()) bad_key(path + key, "an integer");
        out = v->get<T>();
    }
}

template <typename T>
void read_number(const nlohmann::json& j, const char* key, const std::string& path, T& out) {
    if (auto* v = find_key(j, key)) {
        if (!v->is_number()) bad_key(path + key, "a number");
        out = static_cast<T>(v->get<double>());
    }
}

LlmConfig parse_llm(const nlohmann::json& j, const std::string& base_dir) {
    LlmConfig config;
    config.n_threads = static_cast<int>(std::thread::hardware_concurrency());
    if (config.n_threads <= 0) config.n_threads = 4;

    if (auto* v = find_key(j, "model_path")) {
        if (!v->is_string()) bad_key("llm.model_path", "a string");
        fs::path model = v->get<std::string>();
        if (!model.empty() && model.is_relative()) {
            model = fs::absolute(fs::path(base_dir) / model);
        }
        config.model_path = model.string();
    }
    read_integer(j, "n_ctx", "llm.", config.n_ctx);
    int threads = 0;
    read_integer(j, "n_threads", "llm.", threads);
    if (threads > 0) config.n_threads = threads;
    read_number(j, "temperature", "llm.", config.temperature);
    read_number(j, "min_p", "llm.", config.min_p);
    read_integer(j, "n_predict", "llm.", config.n_predict);
    return config;
}

RetryPolicy parse_retry(const nlohmann::json& j) {
    RetryPolicy policy;
    read_integer(j, "max_retries", "retry.", policy.max_retries);
    read_integer(j, "retry_delay_ms", "retry.", policy.retry_delay_ms);
    read_number(j, "backoff_multiplier", "retry.", policy.backoff_multiplier);
    read_integer(j, "max_delay_ms", "retry.", policy.max_delay_ms);
    if (policy.max_retries < 0) bad_key("retry.max_retries", "non-negative");
    return policy;
}

} // namespace

ExecutionOptions EngineConfig::make_options() const {
    ExecutionOptions options;
    options.max_concurrency = max_concurrency;
    options.dispatch_timeout_ms = dispatch_timeout_ms;
    options.retry_policy = retry_policy;
    return options;
}

EngineConfig parse_engine_config(const nlohmann::json& j, const std::string& base_dir) {
    if (!j.is_object()) {
        throw std::runtime_error("Engine config must be an object");
    }

    EngineConfig config;
    if (auto* v = find_key(j, "log_level")) {
        if (!v->is_string()) bad_key("log_level", "a string");
        config.log_level = parse_log_level(v->get<std::string>());
    }
    int64_t concurrency = 1;
    read_integer(j, "max_concurrency", "", concurrency);
    if (concurrency < 1) bad_key("max_concurrency", "at least 1");
    config.max_concurrency = static_cast<size_t>(concurrency);

    read_integer(j, "dispatch_timeout_ms", "", config.dispatch_timeout_ms);
    if (config.dispatch_timeout_ms < 0) bad_key("dispatch_timeout_ms", "non-negative");

    if (auto* v = find_key(j, "retry")) {
        if (!v->is_object()) bad_key("retry", "an object");
        config.retry_policy = parse_retry(*v);
    }

    if (auto* v = find_key(j, "llm")) {
        if (!v->is_object()) bad_key("llm", "an object");
        config.llm = parse_llm(*v, base_dir);
    } else {
        config.llm = parse_llm(nlohmann::json::object(), base_dir);
    }

    if (auto* v = find_key(j, "prompt_templates")) {
        if (!v->is_object()) bad_key("prompt_templates", "an object");
        for (auto it = v->begin(); it != v->end(); ++it) {
            if (!it.value().is_string()) bad_key("prompt_templates." + it.key(), "a string");
            config.prompt_templates[parse_block_kind(it.key())] = it.value().get<std::string>();
        }
    }
    return config;
}

EngineConfig load_engine_config(const std::string& path) {
    if (!fs::exists(path)) {
        throw std::runtime_error("Config file not found: " + path);
    }
    fs::path base_dir = fs::path(path).parent_path();
    if (base_dir.empty()) base_dir = ".";
    return parse_engine_config(load_structured_file(path), base_dir.string());
}

} // namespace canvasflow
