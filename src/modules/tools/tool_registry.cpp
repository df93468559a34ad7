// modules/tools/tool_registry.cpp
#include "tools/tool_registry.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include <algorithm>

namespace agentflow {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool empty_reference(const Value& v) {
    if (v.is_null()) return true;
    if (v.is_string()) return trim(v.get<std::string>()).empty();
    if (v.is_array()) return v.empty();
    return false;
}

// union by function name; a later definition replaces the earlier one in place
void merge_definition(Value def, Value& out) {
    def = normalize_tool_definition(def);
    const std::string name = tool_definition_name(def);
    for (auto& existing : out) {
        if (tool_definition_name(existing) == name) {
            existing = std::move(def);
            return;
        }
    }
    out.push_back(std::move(def));
}

} // namespace

std::string tool_definition_name(const Value& def) {
    if (def.is_object()) {
        if (def.contains("function") && def["function"].is_object() && def["function"].contains("name") &&
            def["function"]["name"].is_string()) {
            return def["function"]["name"].get<std::string>();
        }
        if (def.contains("name") && def["name"].is_string()) return def["name"].get<std::string>();
    }
    return "";
}

Value normalize_tool_definition(const Value& def) {
    std::string name = tool_definition_name(def);
    if (name.empty()) {
        throw FlowError(ErrorCode::INVALID_ARGUMENT, "Tool definition without a name: " + def.dump());
    }
    if (def.contains("function")) {
        Value out = def;
        out["type"] = "function";
        if (!out["function"].contains("parameters")) {
            out["function"]["parameters"] = Value{{"type", "object"}, {"properties", Value::object()}};
        }
        return out;
    }
    return Value{{"type", "function"},
                 {"function",
                  {{"name", name},
                   {"description", def.value("description", "")},
                   {"parameters", def.value("parameters", Value{{"type", "object"}, {"properties", Value::object()}})}}}};
}

void ToolRegistry::register_bundle(ToolResource bundle) {
    Value normalized = Value::array();
    for (const auto& def : bundle.tools) merge_definition(def, normalized);
    bundle.tools = std::move(normalized);

    std::lock_guard<std::mutex> lock(mutex_);
    if (bundles_.count(bundle.slug)) log_warning("Tool bundle '" + bundle.slug + "' redefined");
    std::string slug = bundle.slug;
    bundles_[slug] = std::move(bundle);
}

ToolResource ToolRegistry::load_bundle_file(const std::string& path) {
    Value doc;
    try {
        doc = Value::parse(read_text_file(path));
    } catch (const Value::parse_error& e) {
        throw FlowError(ErrorCode::PARSE_ERROR, path + ": " + e.what());
    }

    ToolResource bundle;
    if (doc.is_array()) {
        bundle.tools = doc;
    } else if (doc.is_object()) {
        bundle.slug = doc.value("slug", "");
        bundle.name = doc.value("name", "");
        bundle.description = doc.value("description", "");
        if (doc.contains("tools")) bundle.tools = doc["tools"];
    } else {
        throw FlowError(ErrorCode::PARSE_ERROR, path + ": tool file must be an object or a list");
    }
    if (!bundle.tools.is_array()) throw FlowError(ErrorCode::PARSE_ERROR, path + ": 'tools' must be a list");
    if (bundle.slug.empty()) bundle.slug = file_stem(path);
    if (bundle.name.empty()) bundle.name = bundle.slug;

    try {
        register_bundle(bundle);
    } catch (const FlowError& e) {
        throw FlowError(ErrorCode::PARSE_ERROR, path + ": " + e.what());
    }
    return get_bundle(bundle.slug);
}

bool ToolRegistry::has_bundle(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bundles_.count(slug) > 0;
}

ToolResource ToolRegistry::get_bundle(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bundles_.find(slug);
    if (it == bundles_.end()) {
        throw FlowError(ErrorCode::TOOL_RESOLUTION_ERROR, "Unknown tool bundle: " + slug, {},
                        Value{{"slug", slug}});
    }
    return it->second;
}

std::vector<std::string> ToolRegistry::list_bundles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> slugs;
    for (const auto& [slug, _] : bundles_) slugs.push_back(slug);
    std::sort(slugs.begin(), slugs.end());
    return slugs;
}

Value ToolRegistry::resolve_tools(const Value& call_tools, const Value& agent_tools) const {
    Value out = Value::array();
    append_reference(empty_reference(call_tools) ? agent_tools : call_tools, out);
    return out;
}

void ToolRegistry::append_reference(const Value& ref, Value& out) const {
    if (ref.is_null()) return;
    if (ref.is_object()) {
        merge_definition(ref, out);
        return;
    }
    if (ref.is_array()) {
        for (const auto& item : ref) append_reference(item, out);
        return;
    }
    if (!ref.is_string()) {
        throw FlowError(ErrorCode::INVALID_ARGUMENT, "Unsupported tools reference: " + ref.dump());
    }

    std::string text = trim(ref.get<std::string>());
    if (text.empty()) return;
    if (text.front() == '[' || text.front() == '{') {
        Value parsed;
        try {
            parsed = Value::parse(text);
        } catch (const Value::parse_error& e) {
            throw FlowError(ErrorCode::INVALID_ARGUMENT, std::string("tools: invalid JSON: ") + e.what());
        }
        append_reference(parsed, out);
        return;
    }
    // "a, @b"
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string part = trim(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!part.empty()) append_slug(part, out);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
}

void ToolRegistry::append_slug(std::string slug, Value& out) const {
    if (!slug.empty() && slug.front() == '@') slug.erase(0, 1);
    for (const auto& def : get_bundle(slug).tools) merge_definition(def, out);
}

} // namespace agentflow
