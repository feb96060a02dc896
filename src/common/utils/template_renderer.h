#ifndef CANVASFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define CANVASFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace canvasflow {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders with a shared default environment
    static std::string render(std::string_view template_str, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    void configure_security(); // templates may not pull in files
};

} // namespace canvasflow

#endif // CANVASFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
