#include "strata/process.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace strata {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

#ifndef _WIN32

namespace {

constexpr int POLL_INTERVAL_MS = 50;

// The shell leads its own process group, so this also takes down anything
// it started (installers, subshells)
void kill_and_reap(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
    int status;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

CommandResult run_shell_command(const std::string& command,
                                const std::string& shell,
                                std::chrono::milliseconds timeout,
                                const CancellationToken* cancel) {
    CommandResult result;

    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    std::vector<char*> argv;
    std::string shell_copy = shell;
    std::string flag = "-c";
    std::string command_copy = command;
    argv.push_back(const_cast<char*>(shell_copy.c_str()));
    argv.push_back(const_cast<char*>(flag.c_str()));
    argv.push_back(const_cast<char*>(command_copy.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child
        setpgid(0, 0);
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        execv(shell_copy.c_str(), argv.data());
        _exit(127);
    }

    // Also set from the parent so a kill right after fork reaches the group
    setpgid(pid, pid);
    close(pipe_fds[1]);
    int read_fd = pipe_fds[0];
    fcntl(read_fd, F_SETFL, fcntl(read_fd, F_GETFL) | O_NONBLOCK);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool pipe_open = true;
    int status = 0;
    bool reaped = false;
    char buffer[4096];

    while (!reaped) {
        if (pipe_open) {
            pollfd pfd{read_fd, POLLIN, 0};
            int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
            if (rc > 0) {
                ssize_t n = read(read_fd, buffer, sizeof(buffer));
                if (n > 0) {
                    result.output.append(buffer, static_cast<size_t>(n));
                } else if (n == 0) {
                    pipe_open = false;
                }
            }
        } else {
            poll(nullptr, 0, POLL_INTERVAL_MS);
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            close(read_fd);
            return result;
        }

        if (cancel && cancel->is_cancelled()) {
            kill_and_reap(pid);
            close(read_fd);
            result.cancelled = true;
            result.error = "cancelled";
            return result;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            kill_and_reap(pid);
            close(read_fd);
            result.timed_out = true;
            result.error = "timed out after " + std::to_string(timeout.count()) + "ms";
            return result;
        }
    }

    // Drain whatever is left in the pipe
    while (pipe_open) {
        ssize_t n = read(read_fd, buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else {
            pipe_open = false;
        }
    }
    close(read_fd);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

#else

CommandResult run_shell_command(const std::string&, const std::string&,
                                std::chrono::milliseconds, const CancellationToken*) {
    CommandResult result;
    result.error = "shell commands are not supported on this platform";
    return result;
}

#endif

} // namespace strata
