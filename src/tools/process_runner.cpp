#include "tools/process_runner.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace popper::tools {

using core::errors::ErrorCategory;
using core::errors::PopperError;

namespace {

std::atomic<pid_t> g_active_child{0};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
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
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Blocks until `pid` exits; retries on EINTR.
int wait_for_child(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_status(status);
}

}  // namespace

pid_t active_child_pid() {
    return g_active_child.load();
}

core::errors::Result<ProcessCapture> ProcessRunner::run(const ProcessRequest& request) const {
    if (request.argv.empty() || request.argv.front().empty()) {
        return PopperError{ErrorCategory::Internal, "Process command cannot be empty.",
                           "empty_command"};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (request.capture_output && (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0)) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return PopperError{ErrorCategory::Internal, "Failed to create process pipes.",
                           "pipe_creation_failed"};
    }

    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // SIGINT/SIGTERM stay blocked until the child's group exists and its pid
    // is published, so the interrupt handler never misses it.
    sigset_t interrupts;
    sigset_t previous_mask;
    sigemptyset(&interrupts);
    sigaddset(&interrupts, SIGINT);
    sigaddset(&interrupts, SIGTERM);
    static_cast<void>(sigprocmask(SIG_BLOCK, &interrupts, &previous_mask));

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(sigprocmask(SIG_SETMASK, &previous_mask, nullptr));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return PopperError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        // The child leads its own group; the interrupt handler signals that
        // group so everything it spawned stops with it.
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(sigprocmask(SIG_SETMASK, &previous_mask, nullptr));
        if (chdir(request.working_directory.c_str()) != 0) {
            _exit(126);
        }
        if (request.capture_output) {
            static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
            static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
        }
        execvp(argv[0], argv.data());
        _exit(kExitCommandNotFound);
    }

    // Mirrors the child's setpgid so the group exists before the pid is published.
    static_cast<void>(setpgid(pid, pid));
    g_active_child.store(pid);
    static_cast<void>(sigprocmask(SIG_SETMASK, &previous_mask, nullptr));
    ProcessCapture capture;

    if (!request.capture_output) {
        capture.exit_code = wait_for_child(pid);
    } else {
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[1]));
        set_nonblocking(stdout_pipe[0]);
        set_nonblocking(stderr_pipe[0]);

        bool stdout_open = true;
        bool stderr_open = true;
        while (stdout_open || stderr_open) {
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
            static_cast<void>(poll(fds, nfds, 50));

            drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
            drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);
        }
        capture.exit_code = wait_for_child(pid);
    }
    g_active_child.store(0);

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace popper::tools
