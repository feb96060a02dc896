// common/llm/llama_backend.cpp
#include "common/llm/llama_backend.h"
#include <stdexcept>

namespace canvasflow {

GenerationBackend make_llama_text_backend(std::shared_ptr<LlamaAdapter> adapter, PromptBuilder prompt_builder) {
    if (!adapter) {
        throw std::invalid_argument("make_llama_text_backend requires an adapter");
    }
    return [adapter = std::move(adapter), builder = std::move(prompt_builder)](
               const GenerationRequest& request, const ExecutionOptions&) {
        std::optional<int> n_predict;
        if (request.parameters.is_object() && request.parameters.contains("n_predict")
            && request.parameters["n_predict"].is_number_integer()) {
            n_predict = request.parameters["n_predict"].get<int>();
        }
        return adapter->generate(builder.build(request), n_predict);
    };
}

} // namespace canvasflow
