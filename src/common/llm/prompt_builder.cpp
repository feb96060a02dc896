// common/llm/prompt_builder.cpp
#include "common/llm/prompt_builder.h"
#include "common/utils/template_renderer.h"

namespace canvasflow {

PromptBuilder::PromptBuilder(std::unordered_map<BlockKind, std::string> templates)
    : templates_(std::move(templates)) {}

bool PromptBuilder::has_template(BlockKind kind) const {
    return templates_.count(kind) > 0;
}

Value PromptBuilder::build_block_context(const GenerationRequest& request) {
    Value ctx = Value::object();
    ctx["prompt"] = request.prompt;
    ctx["block"] = {
        {"id", request.block_id},
        {"number", request.block_number},
        {"kind", to_string(request.kind)},
        {"parameters", request.parameters.is_null() ? Value::object() : request.parameters}
    };
    return ctx;
}

std::string PromptBuilder::build(const GenerationRequest& request) const {
    auto it = templates_.find(request.kind);
    if (it == templates_.end()) {
        return request.prompt;
    }
    return InjaTemplateRenderer::render(it->second, build_block_context(request));
}

} // namespace canvasflow
