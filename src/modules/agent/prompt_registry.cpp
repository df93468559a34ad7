// modules/agent/prompt_registry.cpp
#include "agent/prompt_registry.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include "common/utils/template_renderer.h"
#include "common/utils/yaml_json.h"
#include "tools/builtin_registry.h"
#include <algorithm>

namespace agentflow {

PromptResource PromptRegistry::parse(const std::string& text, const std::string& origin) {
    PromptResource prompt;
    prompt.content = text;

    // front matter is delimited by lines holding only "---"
    if (text.rfind("---", 0) != 0) return prompt;
    size_t header_start = text.find('\n');
    if (header_start == std::string::npos) return prompt;
    size_t header_end = text.find("\n---", header_start);
    if (header_end == std::string::npos) return prompt;

    Value meta = parse_yaml_string(text.substr(header_start + 1, header_end - header_start), origin);
    size_t body_start = text.find('\n', header_end + 4);
    prompt.content = body_start == std::string::npos ? "" : text.substr(body_start + 1);

    if (meta.is_object()) {
        prompt.slug = meta.value("slug", "");
        prompt.name = meta.value("name", "");
        prompt.description = meta.value("description", "");
        if (meta.contains("inputs") && meta["inputs"].is_object()) prompt.inputs = meta["inputs"];
    } else if (!meta.is_null()) {
        throw FlowError(ErrorCode::PARSE_ERROR, origin + ": prompt front matter must be a mapping");
    }
    return prompt;
}

void PromptRegistry::register_prompt(PromptResource prompt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (prompts_.count(prompt.slug)) log_warning("Prompt '" + prompt.slug + "' redefined");
    std::string slug = prompt.slug;
    prompts_[slug] = std::move(prompt);
}

PromptResource PromptRegistry::load_file(const std::string& path) {
    PromptResource prompt = parse(read_text_file(path), path);
    if (prompt.slug.empty()) prompt.slug = file_stem(path);
    if (prompt.name.empty()) prompt.name = prompt.slug;
    register_prompt(prompt);
    return prompt;
}

bool PromptRegistry::has_prompt(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_.count(slug) > 0;
}

std::optional<PromptResource> PromptRegistry::find(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prompts_.find(slug);
    if (it == prompts_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> PromptRegistry::list_prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> slugs;
    for (const auto& [slug, _] : prompts_) slugs.push_back(slug);
    std::sort(slugs.begin(), slugs.end());
    return slugs;
}

std::string PromptRegistry::render(const std::string& slug, const Value& vars) const {
    auto prompt = find(slug);
    if (!prompt) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "Prompt not found: " + slug, {}, Value{{"slug", slug}});
    }
    Value data = prompt->inputs;
    if (vars.is_object()) data.update(vars);
    return InjaTemplateRenderer::render(prompt->content, data);
}

void register_prompt_builtin(BuiltinRegistry& registry) {
    registry.register_tool("prompt", [](const Value& args, ToolCallContext& tc) -> Value {
        if (!tc.services.prompts) {
            throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "No prompts loaded", tc.node);
        }
        std::string slug = value::to_display(args["slug"]);
        Value vars = args;
        vars.erase("slug");
        vars["ctx"] = tc.context.ctx();
        vars["input"] = tc.context.input();
        try {
            return tc.services.prompts->render(slug, vars);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
    }, {"slug"}, "Render a prompt template");
}

} // namespace agentflow
