#include "common/utils/path_utils.h"
#include "core/types/errors.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <glob.h>
#include <sstream>

namespace agentflow {

namespace fs = std::filesystem;

std::string resolve_path(const std::string& base_dir, const std::string& relative) {
    fs::path p(relative);
    if (p.is_absolute() || base_dir.empty()) return p.lexically_normal().string();
    return (fs::path(base_dir) / p).lexically_normal().string();
}

std::string parent_dir(const std::string& file_path) {
    auto dir = fs::path(file_path).parent_path();
    return dir.empty() ? "." : dir.string();
}

std::string canonical_key(const std::string& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(fs::absolute(path), ec);
    if (ec) return fs::absolute(path).lexically_normal().string();
    return canonical.string();
}

std::vector<std::string> expand_glob(const std::string& pattern) {
    glob_t results{};
    std::vector<std::string> out;
    int rc = ::glob(pattern.c_str(), GLOB_TILDE, nullptr, &results);
    if (rc == 0) {
        for (size_t i = 0; i < results.gl_pathc; ++i) out.emplace_back(results.gl_pathv[i]);
    }
    ::globfree(&results);
    std::sort(out.begin(), out.end());
    return out;
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_text_file(const std::string& path, const std::string& content) {
    auto dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Cannot write file: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw FlowError(ErrorCode::CALL_FAILURE, "Write failed: " + path);
    }
}

std::string file_stem(const std::string& path) {
    std::string name = fs::path(path).filename().string();
    auto dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

} // namespace agentflow
