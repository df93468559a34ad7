#ifndef AGENTFLOW_COMMON_UTILS_PATH_UTILS_H
#define AGENTFLOW_COMMON_UTILS_PATH_UTILS_H

#include <string>
#include <vector>

namespace agentflow {

// `relative` resolved against `base_dir` unless it is already absolute
std::string resolve_path(const std::string& base_dir, const std::string& relative);

// Directory that contains `file_path` ("." when it has none)
std::string parent_dir(const std::string& file_path);

// Normalized absolute path used for import-cycle bookkeeping
std::string canonical_key(const std::string& path);

// POSIX glob expansion, sorted; a pattern without matches yields nothing
std::vector<std::string> expand_glob(const std::string& pattern);

std::string read_text_file(const std::string& path);
void write_text_file(const std::string& path, const std::string& content);

// "prompts/greet.prompt" -> "greet"; "agents/a.agent.yaml" -> "a"
std::string file_stem(const std::string& path);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_PATH_UTILS_H
