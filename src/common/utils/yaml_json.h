#ifndef AGENTFLOW_COMMON_UTILS_YAML_JSON_H
#define AGENTFLOW_COMMON_UTILS_YAML_JSON_H

#include "core/types/context.h"
#include <string>
#include <yaml-cpp/yaml.h>

namespace agentflow {

// 将 YAML::Node 转换为 Value. Quoted scalars always stay strings.
Value yaml_to_json(const YAML::Node& node);

// Reads and converts a whole YAML file; failures are ParseError naming the file
Value load_yaml_file(const std::string& path);

// Same for an in-memory document; `origin` is used in error messages
Value parse_yaml_string(const std::string& content, const std::string& origin = "<string>");

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_YAML_JSON_H
