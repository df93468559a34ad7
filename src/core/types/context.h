#ifndef AGENTFLOW_TYPES_CONTEXT_H
#define AGENTFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <string>

namespace agentflow {

// 使用 nlohmann::json 作为统一的数据类型 (null/bool/number/string/array/object)
using Value = nlohmann::json;

// 求值边界上的显式转换规则
namespace value {

// null, false, 0, "", [] and {} are false
bool truthy(const Value& v);

// strings are returned unquoted, everything else is dumped as JSON
std::string to_display(const Value& v);

// bool -> 0/1, numbers unchanged; anything else throws EvalError
double to_number(const Value& v);

bool is_integral(double d);

// keeps integers as integers so "1 + 2" stays 3 and not 3.0
Value from_number(double d);

std::string type_name(const Value& v);

} // namespace value

} // namespace agentflow

#endif // AGENTFLOW_TYPES_CONTEXT_H
