#include "exec/command_executor.hpp"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"

namespace cloudctx::exec {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) {
        static_cast<void>(close(fds[0]));
    }
    if (fds[1] >= 0) {
        static_cast<void>(close(fds[1]));
    }
}

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::ostringstream out;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << argv[i];
    }
    return out.str();
}

void parse_stdout(ExternalCommandResult& result) {
    try {
        result.parsed_json = nlohmann::json::parse(result.stdout_text);
    } catch (const nlohmann::json::parse_error& e) {
        result.parsed_json.reset();
        result.parse_error = e.what();
    }
}

}  // namespace

std::string to_string(const ExitStatus status) {
    switch (status) {
        case ExitStatus::Success:
            return "success";
        case ExitStatus::NonZero:
            return "non_zero";
        case ExitStatus::TimedOut:
            return "timed_out";
        case ExitStatus::NotFound:
            return "not_found";
        default:
            return "unknown";
    }
}

std::optional<std::string> CommandExecutor::resolve_program(
    const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) {
            return program;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string search_path =
        (path_env != nullptr && *path_env != '\0') ? path_env : "/usr/bin:/bin";

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        const auto candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::vector<std::string> CommandExecutor::with_output_flag(
    std::vector<std::string> argv, const std::vector<std::string>& output_flag) {
    if (output_flag.empty()) {
        return argv;
    }
    const bool present =
        std::find(argv.begin(), argv.end(), output_flag.front()) != argv.end();
    if (!present) {
        argv.insert(argv.end(), output_flag.begin(), output_flag.end());
    }
    return argv;
}

core::errors::Result<ExternalCommandResult> CommandExecutor::execute(
    const CommandRequest& request) const {
    if (request.argv.empty()) {
        return ToolError{ErrorCategory::Internal, "Command line cannot be empty.",
                         "empty_command"};
    }

    const auto argv = with_output_flag(request.argv, request.output_flag);
    LOG_DEBUG("exec: " + join_argv(argv));

    ExternalCommandResult result;
    const auto resolved = resolve_program(argv.front());
    if (!resolved.has_value()) {
        result.status = ExitStatus::NotFound;
        result.stderr_text = "Program not found: " + argv.front();
        LOG_WARN("exec: program not found: " + argv.front());
        return result;
    }

    std::vector<char*> child_argv;
    child_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ToolError{ErrorCategory::Internal, "Failed to create process pipes.",
                         "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return ToolError{ErrorCategory::Internal, "Failed to fork process.",
                         "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        // Standard input belongs to the protocol stream; never hand it down.
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));
        execv(resolved->c_str(), child_argv.data());
        _exit(127);
    }

    // Own process group so a timeout takes down anything the program spawned.
    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool timed_out = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - started)
                                 .count();
        if (!timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(usleep(10000));
        }

        drain_pipe(stdout_pipe[0], stdout_open, result.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, result.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A grandchild can keep the pipes open after the timeout has fired.
        if (timed_out && child_exited) {
            if (stdout_open) {
                static_cast<void>(close(stdout_pipe[0]));
                stdout_open = false;
            }
            if (stderr_open) {
                static_cast<void>(close(stderr_pipe[0]));
                stderr_open = false;
            }
        }

        if (child_exited && !stdout_open && !stderr_open) {
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    result.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();

    if (timed_out) {
        result.status = ExitStatus::TimedOut;
    } else if (result.exit_code != 0) {
        result.status = ExitStatus::NonZero;
    } else {
        result.status = ExitStatus::Success;
        parse_stdout(result);
    }

    LOG_DEBUG("exec: " + argv.front() + " finished status=" + to_string(result.status) +
              " exit_code=" + std::to_string(result.exit_code) + " duration_ms=" +
              std::to_string(static_cast<std::int64_t>(result.duration_ms)));
    return result;
}

}  // namespace cloudctx::exec
