#ifndef CANVASFLOW_LLM_LLAMA_ADAPTER_H
#define CANVASFLOW_LLM_LLAMA_ADAPTER_H

#include "common/config/engine_config.h"
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <llama.h>

namespace canvasflow {

// One loaded model with one context. generate() calls are serialized; every
// call starts from an empty KV cache so blocks never see each other's prompts.
class LlamaAdapter {
public:
    using Config = LlmConfig;

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter();

    std::string generate(const std::string& prompt, std::optional<int> n_predict = std::nullopt);
    bool is_loaded() const;

private:
    Config config_;
    std::mutex mutex_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace canvasflow

#endif // CANVASFLOW_LLM_LLAMA_ADAPTER_H
