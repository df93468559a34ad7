// modules/tools/stdio_transport.cpp
#include "tools/stdio_transport.h"
#include "common/utils/logger.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentflow {

namespace {

std::string command_line(const std::vector<std::string>& command) {
    std::string out;
    for (const auto& part : command) out += (out.empty() ? "" : " ") + part;
    return out;
}

// A dead server must surface as EPIPE on write, not kill the host
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

StdioTransport::StdioTransport(std::vector<std::string> command, const Value& env, int timeout_ms)
    : command_(std::move(command)), timeout_ms_(timeout_ms) {
    if (command_.empty()) throw FlowError(ErrorCode::CALL_FAILURE, "Tool server command is empty");
    ignore_sigpipe();

    int in_pipe[2];
    int out_pipe[2];
    if (pipe(in_pipe) != 0) throw FlowError(ErrorCode::CALL_FAILURE, std::string("pipe: ") + std::strerror(errno));
    if (pipe(out_pipe) != 0) {
        close(in_pipe[0]);
        close(in_pipe[1]);
        throw FlowError(ErrorCode::CALL_FAILURE, std::string("pipe: ") + std::strerror(errno));
    }

    // argv and env prepared before fork
    std::vector<char*> argv;
    for (auto& part : command_) argv.push_back(part.data());
    argv.push_back(nullptr);
    std::vector<std::pair<std::string, std::string>> env_vars;
    if (env.is_object()) {
        for (auto it = env.begin(); it != env.end(); ++it) {
            env_vars.emplace_back(it.key(), it.value().is_string() ? it.value().get<std::string>() : it.value().dump());
        }
    }

    pid_ = fork();
    if (pid_ < 0) {
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw FlowError(ErrorCode::CALL_FAILURE, std::string("fork: ") + std::strerror(errno));
    }
    if (pid_ == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        for (const auto& [key, val] : env_vars) setenv(key.c_str(), val.c_str(), 1);
        std::signal(SIGPIPE, SIG_DFL);
        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(in_pipe[0]);
    close(out_pipe[1]);
    to_child_ = in_pipe[1];
    from_child_ = out_pipe[0];
    fcntl(to_child_, F_SETFD, FD_CLOEXEC);
    fcntl(from_child_, F_SETFD, FD_CLOEXEC);
    log_debug("Started tool server: " + command_line(command_) + " (pid " + std::to_string(pid_) + ")");
}

StdioTransport::~StdioTransport() {
    shutdown();
}

void StdioTransport::shutdown() {
    if (to_child_ >= 0) close(to_child_);
    if (from_child_ >= 0) close(from_child_);
    to_child_ = from_child_ = -1;
    if (pid_ > 0) {
        kill(pid_, SIGTERM);
        int status = 0;
        waitpid(pid_, &status, 0);
        pid_ = -1;
    }
}

void StdioTransport::write_line(const std::string& line) {
    std::string data = line + "\n";
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = write(to_child_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) throw FlowError(ErrorCode::CALL_FAILURE, "Tool server exited: " + command_line(command_));
            throw FlowError(ErrorCode::CALL_FAILURE, std::string("Tool server write failed: ") + std::strerror(errno));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

std::string StdioTransport::read_line() {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return line;
        }
        pollfd pfd{from_child_, POLLIN, 0};
        int ready = poll(&pfd, 1, timeout_ms_);
        if (ready == 0) {
            throw FlowError(ErrorCode::TOOL_TIMEOUT, "Tool server did not answer within " +
                                                         std::to_string(timeout_ms_) + " ms: " + command_line(command_));
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw FlowError(ErrorCode::CALL_FAILURE, std::string("poll: ") + std::strerror(errno));
        }
        char chunk[4096];
        ssize_t n = read(from_child_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) throw FlowError(ErrorCode::CALL_FAILURE, "Tool server exited: " + command_line(command_));
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

Value StdioTransport::request(const Value& message) {
    write_line(message.dump());
    const Value& id = message["id"];
    while (true) {
        std::string line = read_line();
        if (line.empty()) continue;
        Value response;
        try {
            response = Value::parse(line);
        } catch (const Value::parse_error&) {
            log_debug("Tool server noise: " + line);
            continue;
        }
        // server-initiated notifications and stale replies are skipped
        if (response.contains("id") && response["id"] == id) return response;
    }
}

void StdioTransport::notify(const Value& message) {
    write_line(message.dump());
}

} // namespace agentflow
