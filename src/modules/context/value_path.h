// modules/context/value_path.h
#ifndef AGENTFLOW_MODULES_CONTEXT_VALUE_PATH_H
#define AGENTFLOW_MODULES_CONTEXT_VALUE_PATH_H

#include "core/types/context.h"
#include <string>
#include <vector>

namespace agentflow {

// "a.b.0.c" -> {"a", "b", "0", "c"}; "items[2]" -> {"items", "2"}
std::vector<std::string> split_path(const std::string& dotted);
std::string join_path(const std::vector<std::string>& segments, size_t from = 0);

// Walks objects by key and arrays by numeric segment. Missing -> null.
Value get_at_path(const Value& root, const std::vector<std::string>& segments, size_t from = 0);

// Creates intermediate objects; replaces non-object intermediates
void set_at_path(Value& root, const std::vector<std::string>& segments, Value v);

bool erase_at_path(Value& root, const std::vector<std::string>& segments);

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CONTEXT_VALUE_PATH_H
