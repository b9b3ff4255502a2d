#include "hooks/command_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/logger.hpp"

namespace helm {
namespace hooks {

namespace {
constexpr int kPollIntervalMs = 50;
}  // namespace

ShellCommand::ShellCommand(std::string command) : command_(std::move(command)) {}

ShellCommand::~ShellCommand() {
    if (pid_ > 0) {
        force_terminate();
        reap();
    }
    close_pipes();
}

bool ShellCommand::run(const runtime::StopToken &token) {
    if (!spawn()) {
        return false;
    }

    pump(token);

    if (token.stop_requested()) {
        cancelled_ = true;
        error_ = "Command cancelled";
        force_terminate();
    }
    close_pipes();
    reap();

    return !cancelled_;
}

bool ShellCommand::spawn() {
    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) < 0) {
        error_ = std::string("Failed to create stdout pipe: ") + std::strerror(errno);
        return false;
    }
    if (pipe(stderr_pipe) < 0) {
        error_ = std::string("Failed to create stderr pipe: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    pid_ = fork();
    if (pid_ < 0) {
        error_ = std::string("Fork failed: ") + std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        pid_ = -1;
        return false;
    }

    if (pid_ == 0) {
        // Child: own process group, stdin from /dev/null, both outputs piped
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }

    // Parent
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    LOG_DEBUG("[Hooks] Spawned command (PID=" << pid_ << "): " << command_);
    return true;
}

void ShellCommand::pump(const runtime::StopToken &token) {
    char buffer[4096];

    while ((stdout_fd_ >= 0 || stderr_fd_ >= 0) && !token.stop_requested()) {
        pollfd fds[2];
        nfds_t count = 0;
        if (stdout_fd_ >= 0) {
            fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        int ready = poll(fds, count, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = std::string("poll failed: ") + std::strerror(errno);
            return;
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            int &fd = fds[i].fd == stdout_fd_ ? stdout_fd_ : stderr_fd_;
            std::string &sink = fds[i].fd == stdout_fd_ ? stdout_ : stderr_;

            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                size_t room = kMaxCapturedBytes - std::min(sink.size(), kMaxCapturedBytes);
                sink.append(buffer, std::min(static_cast<size_t>(n), room));
            } else if (n == 0 || errno != EINTR) {
                close(fd);
                fd = -1;
            }
        }
    }
}

void ShellCommand::reap() {
    if (pid_ <= 0) {
        return;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            }
            break;
        }
        if (result == -1 && errno == EINTR) {
            continue;
        }
        // ECHILD or unexpected error: nothing left to wait for
        break;
    }
    pid_ = -1;
}

void ShellCommand::force_terminate() {
    if (pid_ > 0) {
        // Negative pid targets the whole process group created in spawn()
        if (kill(-pid_, SIGKILL) < 0) {
            kill(pid_, SIGKILL);
        }
    }
}

void ShellCommand::close_pipes() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

}  // namespace hooks
}  // namespace helm
