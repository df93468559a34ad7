// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <stdexcept>

namespace agentflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);
    env_.set_throw_at_missing_includes(true);

    configure_security();
    register_callbacks();
}

void InjaTemplateRenderer::configure_security() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string& name) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for prompts: " + name);
    });
}

void InjaTemplateRenderer::register_callbacks() {
    // {{ json(value) }} dumps a value inline
    env_.add_callback("json", 1, [](inja::Arguments& args) {
        return args.at(0)->dump();
    });
    // {{ default(value, fallback) }}
    env_.add_callback("default", 2, [](inja::Arguments& args) {
        const auto* v = args.at(0);
        return (v == nullptr || v->is_null()) ? *args.at(1) : *v;
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Value& data) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Value& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

} // namespace agentflow
