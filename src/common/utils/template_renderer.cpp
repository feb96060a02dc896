// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <inja/inja.hpp>
#include <mutex>
#include <stdexcept>

namespace canvasflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_search_included_templates_in_files(false);
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    // inja::Environment is not thread-safe
    static InjaTemplateRenderer renderer;
    static std::mutex renderer_mutex;
    std::lock_guard<std::mutex> lock(renderer_mutex);
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace canvasflow
