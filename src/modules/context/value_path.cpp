// modules/context/value_path.cpp
#include "context/value_path.h"
#include "core/types/errors.h"
#include <cctype>

namespace agentflow {

namespace {
bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}
} // namespace

std::vector<std::string> split_path(const std::string& dotted) {
    std::vector<std::string> out;
    std::string cur;
    for (size_t i = 0; i < dotted.size(); ++i) {
        char c = dotted[i];
        if (c == '.' || c == '[' || c == ']') {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

std::string join_path(const std::vector<std::string>& segments, size_t from) {
    std::string out;
    for (size_t i = from; i < segments.size(); ++i) {
        if (i > from) out += '.';
        out += segments[i];
    }
    return out;
}

Value get_at_path(const Value& root, const std::vector<std::string>& segments, size_t from) {
    const Value* cur = &root;
    for (size_t i = from; i < segments.size(); ++i) {
        const std::string& seg = segments[i];
        if (cur->is_object()) {
            auto it = cur->find(seg);
            if (it == cur->end()) return nullptr;
            cur = &*it;
        } else if (cur->is_array() && all_digits(seg)) {
            size_t idx = std::stoul(seg);
            if (idx >= cur->size()) return nullptr;
            cur = &(*cur)[idx];
        } else {
            return nullptr;
        }
    }
    return *cur;
}

void set_at_path(Value& root, const std::vector<std::string>& segments, Value v) {
    if (segments.empty()) {
        throw FlowError(ErrorCode::INVALID_ARGUMENT, "Cannot assign to an empty context path");
    }
    Value* cur = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const std::string& seg = segments[i];
        if (cur->is_array() && all_digits(seg) && std::stoul(seg) < cur->size()) {
            cur = &(*cur)[std::stoul(seg)];
            continue;
        }
        if (!cur->is_object()) *cur = Value::object();
        Value& next = (*cur)[seg];
        if (!next.is_object() && !next.is_array()) next = Value::object();
        cur = &next;
    }
    const std::string& last = segments.back();
    if (cur->is_array() && all_digits(last) && std::stoul(last) < cur->size()) {
        (*cur)[std::stoul(last)] = std::move(v);
        return;
    }
    if (!cur->is_object()) *cur = Value::object();
    (*cur)[last] = std::move(v);
}

bool erase_at_path(Value& root, const std::vector<std::string>& segments) {
    if (segments.empty()) return false;
    Value* cur = &root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!cur->is_object() || !cur->contains(segments[i])) return false;
        cur = &(*cur)[segments[i]];
    }
    if (!cur->is_object()) return false;
    return cur->erase(segments.back()) > 0;
}

} // namespace agentflow
