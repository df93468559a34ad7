// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace agentflow {

namespace {

bool is_integer_literal(const std::string& s) {
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// strtod accepts "inf", "nan" and hex; YAML plain numbers do not start with a letter
bool is_float_literal(const std::string& s) {
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size() || !(std::isdigit(static_cast<unsigned char>(s[start])) || s[start] == '.')) {
        return false;
    }
    char* end = nullptr;
    std::strtod(s.c_str(), &end);
    return end != nullptr && *end == '\0';
}

Value scalar_to_value(const YAML::Node& node) {
    const std::string& s = node.Scalar();
    // "!" 标签表示带引号的标量
    if (node.Tag() == "!") return s;

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s == "Null" || s.empty()) return nullptr;

    if (is_integer_literal(s)) {
        try {
            return std::stoll(s);
        } catch (const std::out_of_range&) {
            return s; // too large, keep the text
        }
    }
    if (is_float_literal(s)) {
        return std::strtod(s.c_str(), nullptr);
    }
    return s;
}

} // namespace

Value yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_value(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& kv : node) obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            return obj;
        }
    }
    return nullptr;
}

Value parse_yaml_string(const std::string& content, const std::string& origin) {
    try {
        return yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
        throw FlowError(ErrorCode::PARSE_ERROR, origin + ": " + e.what());
    }
}

Value load_yaml_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FlowError(ErrorCode::PARSE_ERROR, "Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_yaml_string(buffer.str(), path);
}

} // namespace agentflow
