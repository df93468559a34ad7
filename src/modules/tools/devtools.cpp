// modules/tools/devtools.cpp
#include "common/utils/logger.h"
#include "common/utils/path_utils.h"
#include "tools/builtin_registry.h"
#include <algorithm>
#include <array>
#include <cstdio>
#include <filesystem>
#include <fnmatch.h>
#include <regex>
#include <sys/wait.h>

namespace agentflow {

namespace {

namespace fs = std::filesystem;

constexpr size_t kMaxShellOutput = 30000;

std::string path_arg(const Value& args) {
    const Value& p = args.contains("file_path") ? args["file_path"] : args["path"];
    return value::to_display(p);
}

int64_t int_arg(const Value& args, const std::string& key, int64_t fallback) {
    if (!args.contains(key) || args[key].is_null()) return fallback;
    return static_cast<int64_t>(value::to_number(args[key]));
}

// `**` crosses directories, `*` stays inside one; "**/x" also matches a top-level "x"
bool path_matches(const std::string& pattern, const std::string& rel) {
    if (pattern.find("**") == std::string::npos) return fnmatch(pattern.c_str(), rel.c_str(), FNM_PATHNAME) == 0;
    if (fnmatch(pattern.c_str(), rel.c_str(), 0) == 0) return true;
    return pattern.rfind("**/", 0) == 0 && path_matches(pattern.substr(3), rel);
}

// Regular files under `root` whose relative path matches `pattern`, sorted
std::vector<std::string> glob_files(const std::string& root, const std::string& pattern) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return out;
    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        std::string rel = fs::relative(it->path(), root, ec).generic_string();
        if (path_matches(pattern, rel)) out.push_back(it->path().generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

void register_devtools(BuiltinRegistry& registry) {
    // read_file(file_path, offset=1, limit=2000)
    registry.register_tool("read_file", [](const Value& args, ToolCallContext& tc) -> Value {
        if (!args.contains("file_path") && !args.contains("path")) {
            throw FlowError(ErrorCode::MISSING_ARGUMENT, "read_file() requires 'file_path'", tc.node);
        }
        std::string path = path_arg(args);
        std::string content;
        try {
            content = read_text_file(path);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }

        int64_t offset = std::max<int64_t>(1, int_arg(args, "offset", 1));
        int64_t limit = int_arg(args, "limit", 2000);
        std::string selected;
        int64_t line_no = 0, returned = 0;
        size_t start = 0;
        while (start < content.size()) {
            size_t nl = content.find('\n', start);
            std::string line = content.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
            ++line_no;
            if (line_no >= offset && returned < limit) {
                if (returned) selected += "\n";
                selected += line;
                ++returned;
            }
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
        log_debug("read_file: " + path + " (" + std::to_string(line_no) + " lines)");
        return Value{{"content", selected}, {"total_lines", line_no}, {"lines_returned", returned}, {"offset", offset}};
    }, {}, "Read a text file");

    registry.register_tool("write_file", [](const Value& args, ToolCallContext& tc) -> Value {
        std::string path = value::to_display(args["file_path"]);
        std::string content = value::to_display(args["content"]);
        try {
            write_text_file(path, content);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
        return Value{{"status", "ok"}, {"file_path", path}, {"bytes_written", content.size()}};
    }, {"file_path", "content"}, "Write a text file, creating parent directories");

    // edit_file(file_path, old_string, new_string, replace_all=false)
    registry.register_tool("edit_file", [](const Value& args, ToolCallContext& tc) -> Value {
        std::string path = value::to_display(args["file_path"]);
        std::string old_string = value::to_display(args["old_string"]);
        std::string new_string = value::to_display(args["new_string"]);
        bool replace_all = args.contains("replace_all") && value::truthy(args["replace_all"]);
        if (old_string.empty()) throw FlowError(ErrorCode::INVALID_ARGUMENT, "edit_file(): empty old_string", tc.node);

        std::string content;
        try {
            content = read_text_file(path);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
        size_t matches = 0;
        for (size_t pos = content.find(old_string); pos != std::string::npos;
             pos = content.find(old_string, pos + old_string.size())) {
            ++matches;
        }
        if (matches == 0) throw FlowError(ErrorCode::CALL_FAILURE, "edit_file(): old_string not found", tc.node);
        if (matches > 1 && !replace_all) {
            throw FlowError(ErrorCode::CALL_FAILURE,
                            "edit_file(): old_string found " + std::to_string(matches) + " times", tc.node);
        }
        size_t replaced = 0;
        for (size_t pos = content.find(old_string); pos != std::string::npos;
             pos = content.find(old_string, pos + new_string.size())) {
            content.replace(pos, old_string.size(), new_string);
            ++replaced;
            if (!replace_all) break;
        }
        try {
            write_text_file(path, content);
        } catch (const FlowError& e) {
            throw e.at_node(tc.node);
        }
        return Value{{"status", "ok"}, {"file_path", path}, {"replacements", replaced}};
    }, {"file_path", "old_string", "new_string"}, "Replace text in a file");

    // glob(pattern, path="."): files only
    registry.register_tool("glob", [](const Value& args, ToolCallContext&) -> Value {
        std::string pattern = value::to_display(args["pattern"]);
        std::string root = args.contains("path") ? value::to_display(args["path"]) : ".";
        if (!pattern.empty() && pattern.front() == '/') {
            root = "/";
            pattern.erase(0, 1);
        }
        std::vector<std::string> matches = glob_files(root, pattern);
        log_info("glob: " + pattern + " in " + root + " -> " + std::to_string(matches.size()) + " match(es)");
        return Value{{"matches", matches}, {"count", matches.size()}, {"pattern", pattern}};
    }, {"pattern"}, "Find files by glob pattern such as '**/*.cpp'");

    // grep(pattern, path=".", include, context_lines=0, max_matches=50)
    registry.register_tool("grep", [](const Value& args, ToolCallContext& tc) -> Value {
        std::string pattern = value::to_display(args["pattern"]);
        std::regex re;
        try {
            re = std::regex(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw FlowError(ErrorCode::INVALID_ARGUMENT, "grep(): invalid pattern '" + pattern + "': " + e.what(),
                            tc.node);
        }
        std::string path = args.contains("path") ? value::to_display(args["path"]) : ".";
        std::string include = args.contains("include") ? value::to_display(args["include"]) : "**/*";
        int64_t context_lines = std::max<int64_t>(0, int_arg(args, "context_lines", 0));
        int64_t max_matches = std::max<int64_t>(1, int_arg(args, "max_matches", 50));

        std::error_code ec;
        std::vector<std::string> files =
            fs::is_regular_file(path, ec) ? std::vector<std::string>{path} : glob_files(path, include);

        Value results = Value::array();
        int64_t total = 0;
        for (const auto& file : files) {
            std::string content;
            try {
                content = read_text_file(file);
            } catch (const FlowError&) {
                log_debug("grep: skipping unreadable " + file);
                continue;
            }
            std::vector<std::string> lines;
            size_t start = 0;
            while (start <= content.size()) {
                size_t nl = content.find('\n', start);
                if (nl == std::string::npos) {
                    if (start < content.size()) lines.push_back(content.substr(start));
                    break;
                }
                lines.push_back(content.substr(start, nl - start));
                start = nl + 1;
            }
            for (size_t i = 0; i < lines.size(); ++i) {
                if (!std::regex_search(lines[i], re)) continue;
                ++total;
                if (static_cast<int64_t>(results.size()) >= max_matches) continue;
                size_t from = i >= static_cast<size_t>(context_lines) ? i - context_lines : 0;
                size_t to = std::min(lines.size(), i + context_lines + 1);
                std::string context;
                for (size_t j = from; j < to; ++j) {
                    if (!context.empty()) context += "\n";
                    context += std::to_string(j + 1) + "\t" + lines[j];
                }
                results.push_back(Value{{"file", file}, {"line", i + 1}, {"match", lines[i]}, {"context", context}});
            }
        }
        log_info("grep: '" + pattern + "' in " + path + " -> " + std::to_string(total) + " match(es) across " +
                 std::to_string(files.size()) + " file(s)");
        return Value{{"matches", results},
                     {"total_matches", total},
                     {"files_searched", files.size()},
                     {"truncated", total > max_matches}};
    }, {"pattern"}, "Search file contents with a regular expression");

    // shell(command="ls -1"): stdout, exit_code, ok
    registry.register_tool("shell", [](const Value& args, ToolCallContext& tc) -> Value {
        Value cmd_value = args.value("command", args.value("cmd", Value(nullptr)));
        if (cmd_value.is_null()) throw FlowError(ErrorCode::MISSING_ARGUMENT, "shell() requires 'command'", tc.node);
        std::string command = value::to_display(cmd_value);
        tc.services.cancel.throw_if_cancelled(tc.node);
        log_info("shell: " + command);

        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) throw FlowError(ErrorCode::CALL_FAILURE, "Failed to run: " + command, tc.node);
        std::string output;
        std::array<char, 4096> buffer;
        while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
            if (output.size() < kMaxShellOutput) output += buffer.data();
        }
        int status = pclose(pipe);
        int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

        if (output.size() > kMaxShellOutput) output = output.substr(0, kMaxShellOutput) + "\n... (output truncated)";
        while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) output.pop_back();
        return Value{{"stdout", output}, {"exit_code", exit_code}, {"ok", exit_code == 0}};
    }, {}, "Run a shell command");
}

} // namespace agentflow
