#include "tools/action_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <initializer_list>
#include <poll.h>
#include <signal.h>
#include <string>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace keel::tools {

using core::errors::ErrorCategory;
using core::errors::KeelError;
using protocol::ActionOutput;
using protocol::ActionRequest;
using protocol::Context;

namespace {

using Clock = std::chrono::steady_clock;

// Read end of one child stream. Closes itself at EOF or on a hard error.
class OutputStream {
public:
    OutputStream() = default;
    ~OutputStream() { close_fd(); }

    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    void adopt(const int fd) {
        fd_ = fd;
        const int flags = fcntl(fd_, F_GETFL, 0);
        if (flags != -1) {
            static_cast<void>(fcntl(fd_, F_SETFL, flags | O_NONBLOCK));
        }
    }

    bool open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& text() const { return text_; }

    // Reads whatever is available without blocking.
    void pump() {
        char chunk[4096];
        while (open()) {
            const ssize_t n = read(fd_, chunk, sizeof(chunk));
            if (n > 0) {
                text_.append(chunk, static_cast<std::size_t>(n));
            } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
                return;
            } else {
                close_fd();
            }
        }
    }

private:
    void close_fd() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
            fd_ = -1;
        }
    }

    int fd_ = -1;
    std::string text_;
};

enum class StopCause { None, Cancelled, TimedOut };

// One `/bin/sh -c` child in its own process group. The destructor kills and
// reaps a child that is still around.
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess() {
        if (pid_ > 0 && !exited_) {
            kill_group();
            static_cast<void>(waitpid(pid_, &status_, 0));
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    core::errors::Status start(const std::string& command, const std::filesystem::path& cwd) {
        int out[2] = {-1, -1};
        int err[2] = {-1, -1};
        if (pipe(out) != 0) {
            return KeelError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
        }
        if (pipe(err) != 0) {
            close_both(out);
            return KeelError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
        }

        started_ = Clock::now();
        pid_ = fork();
        if (pid_ < 0) {
            close_both(out);
            close_both(err);
            return KeelError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
        }
        if (pid_ == 0) {
            // Own group: killing it also reaches whatever the shell forked.
            static_cast<void>(setpgid(0, 0));
            if (chdir(cwd.c_str()) != 0) {
                _exit(126);
            }
            static_cast<void>(dup2(out[1], STDOUT_FILENO));
            static_cast<void>(dup2(err[1], STDERR_FILENO));
            close_both(out);
            close_both(err);
            execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        static_cast<void>(setpgid(pid_, pid_));
        static_cast<void>(close(out[1]));
        static_cast<void>(close(err[1]));
        stdout_.adopt(out[0]);
        stderr_.adopt(err[0]);
        return core::errors::ok();
    }

    // Collects output until the child has exited and both streams hit EOF.
    // The token and the deadline are checked on every 50 ms tick.
    StopCause supervise(const runtime::CancelToken& cancel_token,
                        const std::uint32_t timeout_ms) {
        StopCause cause = StopCause::None;
        const auto deadline = started_ + std::chrono::milliseconds(timeout_ms);
        while (!exited_ || stdout_.open() || stderr_.open()) {
            if (!exited_ && cause == StopCause::None) {
                if (cancel_token.is_requested()) {
                    cause = StopCause::Cancelled;
                    kill_group();
                } else if (timeout_ms > 0 && Clock::now() > deadline) {
                    cause = StopCause::TimedOut;
                    kill_group();
                }
            }

            wait_readable(50);
            stdout_.pump();
            stderr_.pump();
            if (!exited_ && waitpid(pid_, &status_, WNOHANG) == pid_) {
                exited_ = true;
            }
        }
        return cause;
    }

    int exit_code() const {
        if (WIFEXITED(status_)) {
            return WEXITSTATUS(status_);
        }
        if (WIFSIGNALED(status_)) {
            return 128 + WTERMSIG(status_);
        }
        return -1;
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
    }

    const OutputStream& out() const { return stdout_; }
    const OutputStream& err() const { return stderr_; }

private:
    static void close_both(int (&fds)[2]) {
        for (const int fd : fds) {
            if (fd >= 0) {
                static_cast<void>(close(fd));
            }
        }
    }

    void kill_group() const { static_cast<void>(kill(-pid_, SIGKILL)); }

    // With both streams closed the poll is only a sleep, so a child that shut
    // its own stdout still gets its cancel and deadline checks.
    void wait_readable(const int timeout) const {
        pollfd fds[2];
        nfds_t count = 0;
        for (const OutputStream* stream : {&stdout_, &stderr_}) {
            if (stream->open()) {
                fds[count].fd = stream->fd();
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                ++count;
            }
        }
        static_cast<void>(poll(count > 0 ? fds : nullptr, count, timeout));
    }

    pid_t pid_ = -1;
    int status_ = 0;
    bool exited_ = false;
    Clock::time_point started_;
    OutputStream stdout_;
    OutputStream stderr_;
};

KeelError cancelled_error(const runtime::CancelToken& cancel_token) {
    const std::string reason = cancel_token.reason();
    return core::errors::cancellation(
        "Action cancelled" + (reason.empty() ? std::string(".") : ": " + reason),
        "action_cancelled");
}

}  // namespace

ShellActionRunner::ShellActionRunner(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

core::errors::Result<ActionOutput> ShellActionRunner::run(
    const ActionRequest& request, const Context& context,
    const runtime::CancelToken& cancel_token) {
    if (request.command.empty()) {
        return KeelError{ErrorCategory::Input, "Action command cannot be empty.",
                         "empty_command"};
    }

    const std::filesystem::path cwd = request.working_directory.is_absolute()
                                          ? request.working_directory
                                          : workspace_root_ / request.working_directory;
    std::error_code ec;
    if (!std::filesystem::is_directory(cwd, ec)) {
        return KeelError{ErrorCategory::Input,
                         "Working directory does not exist: " + cwd.string(),
                         "invalid_working_directory"};
    }

    if (cancel_token.is_requested()) {
        return cancelled_error(cancel_token);
    }

    KEEL_LOG_DEBUG("ShellActionRunner: [" + context.span_id() + "] (" +
                   request.working_directory.string() + ") $ " + request.command);
    ChildProcess child;
    auto started = child.start(request.command, cwd);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    switch (child.supervise(cancel_token, request.timeout_ms)) {
        case StopCause::Cancelled:
            return cancelled_error(cancel_token);
        case StopCause::TimedOut:
            // Deadline kills stop the action cleanly.
            return core::errors::cancellation(
                "Action timed out after " + std::to_string(request.timeout_ms) +
                    " ms: " + request.command,
                "action_timeout");
        case StopCause::None:
            break;
    }

    const int code = child.exit_code();
    if (code != 0) {
        const std::string detail =
            child.err().text().empty() ? "exit code " + std::to_string(code) : child.err().text();
        return KeelError{ErrorCategory::Execution, "Action failed: " + detail, "action_failed"};
    }

    ActionOutput output;
    output.output = child.out().text();
    output.error_output = child.err().text();
    output.exit_code = code;
    output.duration_ms = child.elapsed_ms();
    return output;
}

}  // namespace keel::tools
