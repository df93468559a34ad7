// modules/graph/graph_merger.cpp
#include "graph/graph_merger.h"
#include "graph/graph_validator.h"
#include "graph/workflow_loader.h"
#include "expr/variable_resolver.h"
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include <algorithm>
#include <cctype>

namespace agentflow {

namespace {

bool valid_alias(const std::string& alias) {
    if (alias.empty() || std::isdigit(static_cast<unsigned char>(alias[0]))) return false;
    return std::all_of(alias.begin(), alias.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

} // namespace

WorkflowGraph GraphMerger::merge(const std::string& root_path) const {
    Chain chain;
    chain.keys.push_back(canonical_key(root_path));
    chain.display.push_back(root_path);
    WorkflowGraph merged = merge_unit(WorkflowLoader::load_file(root_path), parent_dir(root_path), chain);
    if (config_.validate) ensure_valid(merged);
    return merged;
}

WorkflowGraph GraphMerger::merge(WorkflowGraph root, const std::string& base_dir) const {
    Chain chain;
    if (!root.source_path.empty() && root.source_path.front() != '<') {
        chain.keys.push_back(canonical_key(root.source_path));
        chain.display.push_back(root.source_path);
    }
    WorkflowGraph merged = merge_unit(std::move(root), base_dir, chain);
    if (config_.validate) ensure_valid(merged);
    return merged;
}

WorkflowGraph GraphMerger::merge_unit(WorkflowGraph unit, const std::string& dir, Chain& chain) const {
    // 先解析本单元自己的资源路径，子单元返回的路径已经是解析过的
    std::vector<ResourcePattern> own = std::move(unit.resources);
    unit.resources.clear();
    for (const auto& r : own) add_resource(unit, ResourcePattern{r.kind, resolve_path(dir, r.pattern)});

    std::vector<FlowImport> flows = std::move(unit.flows);
    unit.flows.clear();

    for (const auto& flow : flows) {
        if (!valid_alias(flow.alias) || is_reserved_root(flow.alias)) {
            throw FlowError(ErrorCode::GRAPH_ERROR, "Invalid flow alias '" + flow.alias + "' in " + unit.source_path);
        }
        if (unit.has_node(flow.alias)) {
            throw FlowError(ErrorCode::GRAPH_ERROR, "Flow alias '" + flow.alias + "' collides with a node id in " +
                            unit.source_path);
        }

        std::string child_path = resolve_path(dir, flow.path);
        std::string key = canonical_key(child_path);
        if (std::find(chain.keys.begin(), chain.keys.end(), key) != chain.keys.end()) {
            std::string trail;
            for (const auto& p : chain.display) trail += p + " -> ";
            trail += child_path;
            throw FlowError(ErrorCode::CIRCULAR_IMPORT, "Circular flow import: " + trail, {},
                            Value{{"chain", chain.display}, {"repeated", child_path}});
        }

        log_debug("Merging flow '" + flow.alias + "' from " + child_path);
        chain.keys.push_back(key);
        chain.display.push_back(child_path);
        WorkflowGraph child = merge_unit(WorkflowLoader::load_file(child_path), parent_dir(child_path), chain);
        chain.keys.pop_back();
        chain.display.pop_back();

        splice(unit, std::move(child), flow.alias);
    }
    return unit;
}

void GraphMerger::splice(WorkflowGraph& parent, WorkflowGraph child, const std::string& alias) {
    const auto local = child.local_ids();
    const auto roots = root_segments(local);

    WorkflowGraph prefixed = child.rewritten(
        [&](const NodeId& id) { return local.count(id) ? alias + "." + id : id; },
        [&](const std::string& expr) { return prefix_references(expr, alias, roots); });

    for (auto& node : prefixed.nodes) parent.add_node(std::move(node));
    for (auto& edge : prefixed.edges) parent.edges.push_back(std::move(edge));
    for (const auto& r : prefixed.resources) add_resource(parent, r);
}

void GraphMerger::add_resource(WorkflowGraph& graph, const ResourcePattern& pattern) {
    if (std::find(graph.resources.begin(), graph.resources.end(), pattern) == graph.resources.end()) {
        graph.resources.push_back(pattern);
    }
}

} // namespace agentflow
