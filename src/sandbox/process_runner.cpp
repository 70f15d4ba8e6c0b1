#include "sandbox/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codebox::sandbox {

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
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

// Closes both ends of each pipe that is still open.
void close_pipes(int (&first)[2], int (&second)[2]) {
    for (int* fds : {first, second}) {
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                static_cast<void>(close(fds[i]));
                fds[i] = -1;
            }
        }
    }
}

void kill_group(const pid_t pid) {
    // The child is a group leader; fall back to the pid if the group is gone.
    if (kill(-pid, SIGKILL) != 0) {
        static_cast<void>(kill(pid, SIGKILL));
    }
}

}  // namespace

std::string shell_quote(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 8);
    quoted.push_back('\'');
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Command cancelled before start.";
        return capture;
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return core::errors::ExecError{core::errors::ErrorCategory::Internal,
                                       "Failed to create process pipes.",
                                       "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_pipes(stdout_pipe, stderr_pipe);
        return core::errors::ExecError{core::errors::ErrorCategory::Internal,
                                       "Failed to create process pipes.",
                                       "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipes(stdout_pipe, stderr_pipe);
        return core::errors::ExecError{core::errors::ErrorCategory::Internal,
                                       "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            static_cast<void>(dup2(devnull, STDIN_FILENO));
            static_cast<void>(close(devnull));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        close_pipes(stdout_pipe, stderr_pipe);
        execl("/bin/sh", "sh", "-c", request.command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    bool killed = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited &&
            !capture.cancelled) {
            capture.cancelled = true;
            kill_group(pid);
            killed = true;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) &&
            (!child_exited || stdout_open || stderr_open)) {
            capture.timed_out = true;
            kill_group(pid);
            killed = true;
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
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A grandchild that escaped the group may still hold the pipes open.
        if (child_exited && killed) {
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

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace codebox::sandbox
