#include "skills/skill_channel.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

extern char** environ;

namespace toolgate::skills {

using core::errors::ErrorCategory;
using core::errors::GatewayError;
using nlohmann::json;
using resilience::Readiness;
using resilience::ServiceExited;

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kGracefulExit = std::chrono::milliseconds(200);

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

bool is_executable(const std::string& path) {
    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& command) {
    if (command.find('/') != std::string::npos) {
        if (is_executable(command)) {
            return command;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::istringstream dirs(path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + command;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

// Parent environment with the skill's overrides applied.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string text(*entry);
        const auto eq = text.find('=');
        const std::string key = eq == std::string::npos ? text : text.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(text);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string error_message_of(const json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

SkillChannel::SkillChannel(SkillSpec spec)
    : ServiceHandle(spec.name), spec_(std::move(spec)) {}

SkillChannel::~SkillChannel() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    close_locked();
}

core::errors::Status SkillChannel::start(const std::chrono::milliseconds connect_timeout) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    const Readiness current = readiness();
    if (current == Readiness::Ready) {
        return core::errors::ok_status();
    }
    if (current == Readiness::Crashed) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Skill '" + spec_.name + "' is not alive.", "skill_not_alive"};
    }

    ignore_sigpipe();
    set_readiness(Readiness::Initializing);

    const auto executable = find_executable(spec_.command);
    if (!executable) {
        set_readiness(Readiness::Crashed);
        return GatewayError{ErrorCategory::Collaborator,
                            "Command not found for skill '" + spec_.name + "': " + spec_.command,
                            "skill_command_not_found",
                            "Check the skill's \"command\" and the gateway's PATH."};
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec_.command);
    argv_storage.insert(argv_storage.end(), spec_.args.begin(), spec_.args.end());
    std::vector<std::string> env_storage = build_environment(spec_.env);
    std::vector<char*> argv = to_pointer_array(argv_storage);
    std::vector<char*> envp = to_pointer_array(env_storage);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        set_readiness(Readiness::Crashed);
        return GatewayError{ErrorCategory::Internal, "Failed to create skill pipes.",
                            "pipe_creation_failed"};
    }
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        set_readiness(Readiness::Crashed);
        return GatewayError{ErrorCategory::Internal, "Failed to create skill pipes.",
                            "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        set_readiness(Readiness::Crashed);
        return GatewayError{ErrorCategory::Internal, "Failed to fork skill process.",
                            "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        execve(executable->c_str(), argv.data(), envp.data());
        _exit(127);
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    set_nonblocking(stdout_fd_);
    read_buffer_.clear();
    {
        std::lock_guard<std::mutex> process_lock(process_mutex_);
        pid_ = pid;
        exited_ = false;
        exit_status_ = -1;
    }
    LOG_INFO("SkillChannel: started '" + spec_.name + "' (pid " + std::to_string(pid) + ")");

    json params;
    params["protocolVersion"] = protocol::kProtocolVersion;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", "toolgate"}, {"version", "1.0.0"}};

    std::string failure;
    try {
        const auto handshake = request_locked("initialize", params, connect_timeout, nullptr);
        if (core::errors::is_error(handshake)) {
            failure = core::errors::get_error(handshake).message;
        } else if (stdout_fd_ < 0) {
            failure = exit_reason_locked();
        } else {
            set_readiness(Readiness::Ready);
            return core::errors::ok_status();
        }
    } catch (const ServiceExited& e) {
        failure = e.what();
    }

    LOG_WARN("SkillChannel: '" + spec_.name + "' failed to initialize: " + failure);
    close_locked();
    set_readiness(Readiness::Crashed);
    return GatewayError{ErrorCategory::Collaborator,
                        "Skill '" + spec_.name + "' failed to initialize: " + failure,
                        "skill_start_failed"};
}

core::errors::Status SkillChannel::ensure_started(const std::chrono::milliseconds connect_timeout) {
    const Readiness current = readiness();
    if (current == Readiness::Ready) {
        return core::errors::ok_status();
    }
    if (current == Readiness::Crashed) {
        return GatewayError{ErrorCategory::Collaborator,
                            "Skill '" + spec_.name + "' is not alive.", "skill_not_alive"};
    }
    return start(connect_timeout);
}

core::errors::Result<json> SkillChannel::request(const std::string& method,
                                                 const json& params,
                                                 const std::chrono::milliseconds timeout,
                                                 const resilience::CancelToken& cancel_token) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (stdin_fd_ < 0 || stdout_fd_ < 0) {
        if (reap_locked(false)) {
            throw ServiceExited(exit_reason_locked());
        }
        return GatewayError{ErrorCategory::Collaborator,
                            "Skill '" + spec_.name + "' is not running.", "skill_not_running"};
    }
    if (reap_locked(false)) {
        set_readiness(Readiness::Crashed);
        throw ServiceExited(exit_reason_locked());
    }
    return request_locked(method, params, timeout, cancel_token);
}

core::errors::Result<json> SkillChannel::request_locked(const std::string& method,
                                                        const json& params,
                                                        const std::chrono::milliseconds timeout,
                                                        const resilience::CancelToken& cancel_token) {
    const std::int64_t id = next_id_++;
    json message;
    message["jsonrpc"] = protocol::kJsonRpcVersion;
    message["id"] = id;
    message["method"] = method;
    message["params"] = params;
    write_line_locked(protocol::encode(message) + "\n");

    const auto started = std::chrono::steady_clock::now();
    const json expected_id = id;
    while (true) {
        auto response = take_response_locked(expected_id);
        if (response.has_value()) {
            return std::move(response.value());
        }

        if (cancel_token && cancel_token->load()) {
            return GatewayError{ErrorCategory::Execution,
                                "Request '" + method + "' to skill '" + spec_.name +
                                    "' was cancelled.",
                                "skill_cancelled"};
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed >= timeout) {
            return GatewayError{ErrorCategory::Execution,
                                "Skill '" + spec_.name + "' did not answer '" + method +
                                    "' within " + std::to_string(timeout.count()) + " ms",
                                "skill_timeout"};
        }

        const auto remaining = (timeout - elapsed).count();
        pollfd fd{};
        fd.fd = stdout_fd_;
        fd.events = POLLIN;
        static_cast<void>(poll(&fd, 1, static_cast<int>(std::min<long long>(kPollSliceMs, remaining))));

        char buffer[4096];
        while (true) {
            const ssize_t n = read(stdout_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                read_buffer_.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            }
            // EOF or a read failure: the peer is gone, but its last lines
            // may already hold the answer.
            if (!read_buffer_.empty() && read_buffer_.back() != '\n') {
                read_buffer_.push_back('\n');
            }
            auto last_words = take_response_locked(expected_id);
            mark_exited_locked();
            if (last_words.has_value()) {
                LOG_DEBUG("SkillChannel: '" + spec_.name + "' answered, then " +
                          exit_reason_locked());
                return std::move(last_words.value());
            }
            throw ServiceExited(exit_reason_locked());
        }
    }
}

std::optional<core::errors::Result<json>> SkillChannel::take_response_locked(
    const json& expected_id) {
    auto newline = read_buffer_.find('\n');
    while (newline != std::string::npos) {
        std::string line = read_buffer_.substr(0, newline);
        read_buffer_.erase(0, newline + 1);
        newline = read_buffer_.find('\n');
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const json response = json::parse(line, nullptr, false);
        if (response.is_discarded() || !response.is_object()) {
            LOG_DEBUG("SkillChannel: '" + spec_.name + "' wrote a non-JSON line, skipped");
            continue;
        }
        if (!response.contains("id") || response["id"] != expected_id) {
            LOG_DEBUG("SkillChannel: '" + spec_.name + "' skipped unrelated message");
            continue;
        }
        if (response.contains("error")) {
            return core::errors::Result<json>{GatewayError{
                ErrorCategory::Execution, error_message_of(response["error"]), "skill_error"}};
        }
        if (response.contains("result")) {
            return core::errors::Result<json>{response["result"]};
        }
        return core::errors::Result<json>{
            GatewayError{ErrorCategory::Protocol,
                         "Skill '" + spec_.name + "' answered without result or error.",
                         "skill_bad_response"}};
    }
    return std::nullopt;
}

void SkillChannel::write_line_locked(const std::string& line) {
    std::size_t written = 0;
    while (written < line.size()) {
        const ssize_t n = write(stdin_fd_, line.data() + written, line.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        const std::string error_text = std::strerror(errno);
        mark_exited_locked();
        throw ServiceExited("write to skill '" + spec_.name + "' failed (" + error_text +
                            "); " + exit_reason_locked());
    }
}

void SkillChannel::mark_exited_locked() {
    if (!reap_locked(false)) {
        static_cast<void>(kill(pid(), SIGKILL));
        static_cast<void>(reap_locked(true));
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    set_readiness(Readiness::Crashed);
}

Readiness SkillChannel::readiness() const {
    const Readiness current = ServiceHandle::readiness();
    if (current == Readiness::Ready && reap_locked(false)) {
        return Readiness::Crashed;
    }
    return current;
}

void SkillChannel::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    close_locked();
}

void SkillChannel::close_locked() {
    close_fd(stdin_fd_);
    if (pid() > 0 && !reap_locked(false)) {
        const auto deadline = std::chrono::steady_clock::now() + kGracefulExit;
        while (std::chrono::steady_clock::now() < deadline && !reap_locked(false)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (!reap_locked(false)) {
            static_cast<void>(kill(pid(), SIGKILL));
            static_cast<void>(reap_locked(true));
        }
        LOG_INFO("SkillChannel: closed '" + spec_.name + "' (" + exit_reason_locked() + ")");
    }
    close_fd(stdout_fd_);
    if (pid() > 0) {
        set_readiness(Readiness::Crashed);
    }
}

pid_t SkillChannel::pid() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return pid_;
}

bool SkillChannel::reap_locked(const bool block) const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (exited_) {
        return true;
    }
    if (pid_ <= 0) {
        return false;
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        exited_ = true;
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
        return true;
    }
    if (waited < 0 && errno == ECHILD) {
        exited_ = true;
        return true;
    }
    return false;
}

std::string SkillChannel::exit_reason_locked() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    if (!exited_) {
        return "skill '" + spec_.name + "' closed its output";
    }
    if (exit_status_ > 128) {
        return "skill '" + spec_.name + "' killed by signal " + std::to_string(exit_status_ - 128);
    }
    return "skill '" + spec_.name + "' exited with status " + std::to_string(exit_status_);
}

}  // namespace toolgate::skills
