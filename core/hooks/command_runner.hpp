#pragma once

#include <string>

#include "runtime/task.hpp"

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace helm {
namespace hooks {

/**
 * ShellCommand - run one command line through /bin/sh -c.
 *
 * stdout and stderr are captured (each truncated to kMaxCapturedBytes). stdin
 * is /dev/null. The child runs in its own process group so cancellation
 * kills the shell and everything it started.
 *
 * Linux/POSIX only.
 */
class ShellCommand {
public:
    static constexpr size_t kMaxCapturedBytes = 64 * 1024;

    explicit ShellCommand(std::string command);
    ~ShellCommand();

    // Non-copyable (owns a child process)
    ShellCommand(const ShellCommand &) = delete;
    ShellCommand &operator=(const ShellCommand &) = delete;

    /**
     * Spawn the command and wait for it to exit.
     *
     * Returns early, killing the child, once token is cancelled.
     *
     * @return true if the command ran to completion (check exit_code()),
     *         false if it could not be spawned or was cancelled (see error())
     */
    bool run(const runtime::StopToken &token);

    // Exit status, or 128 + signal number if the child was killed
    int exit_code() const { return exit_code_; }
    bool cancelled() const { return cancelled_; }
    const std::string &output() const { return stdout_; }
    const std::string &error_output() const { return stderr_; }
    const std::string &error() const { return error_; }

private:
    bool spawn();
    void pump(const runtime::StopToken &token);
    void reap();
    void force_terminate();
    void close_pipes();

    std::string command_;
    std::string stdout_;
    std::string stderr_;
    std::string error_;
    int exit_code_ = -1;
    bool cancelled_ = false;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
};

}  // namespace hooks
}  // namespace helm
