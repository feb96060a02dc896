// common/llm/llama_backend.h
#ifndef CANVASFLOW_LLM_LLAMA_BACKEND_H
#define CANVASFLOW_LLM_LLAMA_BACKEND_H

#include "common/llm/llama_adapter.h"
#include "common/llm/prompt_builder.h"
#include "modules/dispatch/generation_dispatcher.h"
#include <memory>

namespace canvasflow {

// Text backend over a local model. Honors the block parameter
// "n_predict" (integer) as a per-block token limit.
GenerationBackend make_llama_text_backend(std::shared_ptr<LlamaAdapter> adapter, PromptBuilder prompt_builder = {});

} // namespace canvasflow

#endif // CANVASFLOW_LLM_LLAMA_BACKEND_H
