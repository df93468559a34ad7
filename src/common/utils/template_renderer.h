#ifndef AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h" // 引入 Value (nlohmann::json)
#include <filesystem> // Required by Inja for set_include_callback
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace agentflow {

// Renders prompt templates ({{ name }}, {% if %}, ...) against a Value
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用默认环境渲染模板
    static std::string render(std::string_view template_str, const Value& data);

    std::string render_with_env(std::string_view template_str, const Value& data);

private:
    inja::Environment env_;
    std::mutex mutex_; // inja::Environment is not safe for concurrent render calls
    void configure_security(); // 禁用 include
    void register_callbacks();
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
