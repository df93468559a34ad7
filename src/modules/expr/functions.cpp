// modules/expr/functions.cpp
#include "expr/expression.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_map>

namespace agentflow {

namespace {

using Args = std::vector<Value>;
using Function = Value (*)(const Args&);

void require_arity(const std::string& name, const Args& args, size_t min, size_t max) {
    if (args.size() < min || args.size() > max) {
        throw FlowError(ErrorCode::EVAL_ERROR, name + "() takes " + std::to_string(min) +
                        (min == max ? "" : ".." + std::to_string(max)) + " argument(s), got " +
                        std::to_string(args.size()));
    }
}

const std::string& require_string(const std::string& name, const Value& v) {
    if (!v.is_string()) throw FlowError(ErrorCode::EVAL_ERROR, name + "() expects a string, got " + value::type_name(v));
    return v.get_ref<const std::string&>();
}

const Value& require_array(const std::string& name, const Value& v) {
    if (!v.is_array()) throw FlowError(ErrorCode::EVAL_ERROR, name + "() expects an array, got " + value::type_name(v));
    return v;
}

Value fn_len(const Args& a) {
    require_arity("len", a, 1, 1);
    const Value& v = a[0];
    if (v.is_string()) return static_cast<int64_t>(v.get_ref<const std::string&>().size());
    if (v.is_array() || v.is_object()) return static_cast<int64_t>(v.size());
    if (v.is_null()) return 0;
    throw FlowError(ErrorCode::EVAL_ERROR, "len() of " + value::type_name(v));
}

Value fn_append(const Args& a) {
    if (a.empty()) throw FlowError(ErrorCode::EVAL_ERROR, "append() needs a list");
    Value out = a[0].is_null() ? Value::array() : require_array("append", a[0]);
    for (size_t i = 1; i < a.size(); ++i) out.push_back(a[i]);
    return out;
}

Value fn_contains(const Args& a) {
    require_arity("contains", a, 2, 2);
    const Value& c = a[0];
    if (c.is_string()) {
        return c.get_ref<const std::string&>().find(value::to_display(a[1])) != std::string::npos;
    }
    if (c.is_array()) return std::find(c.begin(), c.end(), a[1]) != c.end();
    if (c.is_object()) return a[1].is_string() && c.contains(a[1].get<std::string>());
    return false;
}

Value fn_keys(const Args& a) {
    require_arity("keys", a, 1, 1);
    Value out = Value::array();
    if (a[0].is_object()) {
        for (auto it = a[0].begin(); it != a[0].end(); ++it) out.push_back(it.key());
    }
    return out;
}

Value fn_values(const Args& a) {
    require_arity("values", a, 1, 1);
    Value out = Value::array();
    if (a[0].is_object()) {
        for (const auto& v : a[0]) out.push_back(v);
    }
    return out;
}

Value fn_upper(const Args& a) {
    require_arity("upper", a, 1, 1);
    std::string s = value::to_display(a[0]);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

Value fn_lower(const Args& a) {
    require_arity("lower", a, 1, 1);
    std::string s = value::to_display(a[0]);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

Value fn_trim(const Args& a) {
    require_arity("trim", a, 1, 1);
    std::string s = value::to_display(a[0]);
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

Value fn_str(const Args& a) {
    require_arity("str", a, 1, 1);
    return value::to_display(a[0]);
}

Value fn_int(const Args& a) {
    require_arity("int", a, 1, 1);
    if (a[0].is_string()) {
        try {
            return static_cast<int64_t>(std::stoll(a[0].get<std::string>()));
        } catch (const std::exception&) {
            throw FlowError(ErrorCode::EVAL_ERROR, "int(): not a number: " + a[0].get<std::string>());
        }
    }
    return static_cast<int64_t>(value::to_number(a[0]));
}

Value fn_float(const Args& a) {
    require_arity("float", a, 1, 1);
    if (a[0].is_string()) {
        try {
            return std::stod(a[0].get<std::string>());
        } catch (const std::exception&) {
            throw FlowError(ErrorCode::EVAL_ERROR, "float(): not a number: " + a[0].get<std::string>());
        }
    }
    return value::to_number(a[0]);
}

Value fn_default(const Args& a) {
    require_arity("default", a, 2, 2);
    return a[0].is_null() ? a[1] : a[0];
}

Value fn_join(const Args& a) {
    require_arity("join", a, 1, 2);
    const Value& list = require_array("join", a[0]);
    std::string sep = a.size() > 1 ? value::to_display(a[1]) : ",";
    std::string out;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i) out += sep;
        out += value::to_display(list[i]);
    }
    return out;
}

Value fn_split(const Args& a) {
    require_arity("split", a, 1, 2);
    const std::string& s = require_string("split", a[0]);
    std::string sep = a.size() > 1 ? value::to_display(a[1]) : ",";
    Value out = Value::array();
    if (sep.empty()) {
        for (char c : s) out.push_back(std::string(1, c));
        return out;
    }
    size_t start = 0;
    while (true) {
        size_t hit = s.find(sep, start);
        out.push_back(s.substr(start, hit - start));
        if (hit == std::string::npos) break;
        start = hit + sep.size();
    }
    return out;
}

constexpr double kMaxRangeSize = 100000;

Value fn_range(const Args& a) {
    require_arity("range", a, 1, 2);
    double lo = 0, hi = 0;
    if (a.size() == 1) {
        hi = value::to_number(a[0]);
    } else {
        lo = value::to_number(a[0]);
        hi = value::to_number(a[1]);
    }
    if (hi <= lo) return Value::array();
    if (!std::isfinite(lo) || !std::isfinite(hi) || hi - lo > kMaxRangeSize || std::fabs(lo) > 9e15) {
        throw FlowError(ErrorCode::EVAL_ERROR, "range() is limited to " +
                        std::to_string(static_cast<int>(kMaxRangeSize)) + " elements");
    }
    auto from = static_cast<int64_t>(lo);
    auto to = static_cast<int64_t>(hi);
    Value out = Value::array();
    for (int64_t i = from; i < to; ++i) out.push_back(i);
    return out;
}

// map(list, "field") plucks a field from every object
Value fn_map(const Args& a) {
    require_arity("map", a, 2, 2);
    const Value& list = require_array("map", a[0]);
    const std::string& field = require_string("map", a[1]);
    Value out = Value::array();
    for (const auto& item : list) {
        out.push_back(item.is_object() && item.contains(field) ? item[field] : Value(nullptr));
    }
    return out;
}

// filter(list) keeps truthy items; filter(list, "field", value) keeps items whose field equals value
Value fn_filter(const Args& a) {
    if (a.size() != 1 && a.size() != 3) {
        throw FlowError(ErrorCode::EVAL_ERROR, "filter() takes 1 or 3 arguments");
    }
    const Value& list = require_array("filter", a[0]);
    Value out = Value::array();
    for (const auto& item : list) {
        bool keep;
        if (a.size() == 1) {
            keep = value::truthy(item);
        } else {
            const std::string& field = require_string("filter", a[1]);
            keep = item.is_object() && item.contains(field) && item[field] == a[2];
        }
        if (keep) out.push_back(item);
    }
    return out;
}

Value fn_json(const Args& a) {
    require_arity("json", a, 1, 1);
    if (!a[0].is_string()) return a[0];
    try {
        return Value::parse(a[0].get<std::string>());
    } catch (const Value::parse_error& e) {
        throw FlowError(ErrorCode::EVAL_ERROR, std::string("json(): ") + e.what());
    }
}

Value fn_type(const Args& a) {
    require_arity("type", a, 1, 1);
    return value::type_name(a[0]);
}

Value min_max(const std::string& name, const Args& a, bool want_max) {
    const Args* items = &a;
    Args unpacked;
    if (a.size() == 1 && a[0].is_array()) {
        unpacked.assign(a[0].begin(), a[0].end());
        items = &unpacked;
    }
    if (items->empty()) throw FlowError(ErrorCode::EVAL_ERROR, name + "() of nothing");
    Value best = (*items)[0];
    for (const auto& v : *items) {
        double x = value::to_number(v), y = value::to_number(best);
        if (want_max ? x > y : x < y) best = v;
    }
    return best;
}

Value fn_min(const Args& a) { return min_max("min", a, false); }
Value fn_max(const Args& a) { return min_max("max", a, true); }

const std::unordered_map<std::string, Function>& function_table() {
    static const std::unordered_map<std::string, Function> table = {
        {"len", fn_len},       {"length", fn_len},   {"append", fn_append}, {"contains", fn_contains},
        {"keys", fn_keys},     {"values", fn_values}, {"upper", fn_upper},  {"lower", fn_lower},
        {"trim", fn_trim},     {"str", fn_str},      {"int", fn_int},       {"float", fn_float},
        {"default", fn_default}, {"join", fn_join},  {"split", fn_split},   {"range", fn_range},
        {"map", fn_map},       {"filter", fn_filter}, {"json", fn_json},    {"type", fn_type},
        {"min", fn_min},       {"max", fn_max},
    };
    return table;
}

} // namespace

bool has_expression_function(const std::string& name) {
    return function_table().count(name) > 0;
}

Value call_expression_function(const std::string& name, const std::vector<Value>& args) {
    auto it = function_table().find(name);
    if (it == function_table().end()) {
        throw FlowError(ErrorCode::EVAL_ERROR, "Unknown function: " + name + "()");
    }
    return it->second(args);
}

} // namespace agentflow
