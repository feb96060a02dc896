// common/llm/prompt_builder.h
#ifndef CANVASFLOW_LLM_PROMPT_BUILDER_H
#define CANVASFLOW_LLM_PROMPT_BUILDER_H

#include "core/types/context.h"
#include "modules/dispatch/generation_dispatcher.h"
#include <string>
#include <unordered_map>

namespace canvasflow {

// Wraps a resolved block prompt into the model-facing prompt of its kind.
// Templates are inja; they see `prompt` (the resolved text) and `block`
// (id, number, kind, parameters). Kinds without a template pass through.
class PromptBuilder {
public:
    PromptBuilder() = default;
    explicit PromptBuilder(std::unordered_map<BlockKind, std::string> templates);

    std::string build(const GenerationRequest& request) const;
    bool has_template(BlockKind kind) const;

    static Value build_block_context(const GenerationRequest& request);

private:
    std::unordered_map<BlockKind, std::string> templates_;
};

} // namespace canvasflow

#endif // CANVASFLOW_LLM_PROMPT_BUILDER_H
