#include "core/types/context.h"
#include "core/types/errors.h"
#include <cmath>
#include <limits>

namespace agentflow::value {

bool truthy(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return false;
        case Value::value_t::boolean:
            return v.get<bool>();
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return v.get<double>() != 0.0;
        case Value::value_t::string:
            return !v.get_ref<const std::string&>().empty();
        case Value::value_t::array:
        case Value::value_t::object:
            return !v.empty();
        default:
            return false;
    }
}

std::string to_display(const Value& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "null";
    return v.dump();
}

double to_number(const Value& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    throw FlowError(ErrorCode::EVAL_ERROR, "Expected a number, got " + type_name(v) + ": " + to_display(v));
}

bool is_integral(double d) {
    return std::isfinite(d) && std::floor(d) == d &&
           std::fabs(d) < static_cast<double>(std::numeric_limits<int64_t>::max());
}

Value from_number(double d) {
    if (is_integral(d)) return static_cast<int64_t>(d);
    return d;
}

std::string type_name(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "bool";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: return "number";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        default: return "unknown";
    }
}

} // namespace agentflow::value
