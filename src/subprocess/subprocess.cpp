#include "subprocess/subprocess.hpp"

#include "output/sink.hpp"
#include "subprocess/process.hpp"

#include <labmarker/common/error_types.hpp>
#include <labmarker/common/linux.hpp>
#include <labmarker/logging.hpp>

#include <libassert/assert.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace labmarker {

namespace {

constexpr int EXEC_FAILURE_EXIT_CODE = 127;
constexpr int SIGNAL_EXIT_CODE_BASE = 128;

/// Runs in the forked child; only async-signal-safe calls from here on
[[noreturn]] void exec_child(const std::string& command, const std::filesystem::path& working_dir, linux::Pipe output) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY); // NOLINT(*vararg)
    if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1) {
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    }

    if (::dup2(output.write_fd, STDOUT_FILENO) == -1 || ::dup2(output.write_fd, STDERR_FILENO) == -1) {
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    }

    if (::chdir(working_dir.c_str()) == -1) {
        ::_exit(EXEC_FAILURE_EXIT_CODE);
    }

    // NOLINTNEXTLINE(*vararg)
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));

    ::_exit(EXEC_FAILURE_EXIT_CODE);
}

} // namespace

Subprocess::Subprocess(std::string command, std::filesystem::path working_dir, OutputSink& sink)
    : command_{std::move(command)}
    , working_dir_{std::move(working_dir)}
    , sink_{&sink} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed
    if (child_pid_ == 0) {
        close_pipe();
        return;
    }

    if (is_alive_) {
        LOG_DEBUG("Subprocess {} still alive on destruction; killing", child_pid_);
        kill();
    }

    close_pipe();
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess started twice");

    start_time_ = std::chrono::steady_clock::now();

    if (auto res = create(); !res) {
        LOG_WARN("Failed to launch {:?} in {:?}: {}", command_, working_dir_.string(), res.error());

        // no-op unless the child was already forked
        kill();
        close_pipe();
        is_alive_ = false;
        if (!end_time_) {
            end_time_ = start_time_;
        }

        return res;
    }

    LOG_DEBUG("Launched {:?} in {:?} (pid {})", command_, working_dir_.string(), child_pid_);

    return {};
}

Result<void> Subprocess::create() {
    auto output_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdout_fd_ = output_pipe.read_fd;

    auto fork_res = linux::fork();

    if (!fork_res) {
        std::ignore = linux::close(output_pipe.write_fd);
        return ErrorKind::SpawnFailure;
    }

    // Child process
    if (fork_res->which == linux::Fork::Child) {
        exec_child(command_, working_dir_, output_pipe);
    }

    // Parent process
    child_pid_ = fork_res->pid;
    is_alive_ = true;

    // Also set in the child; whichever runs first wins. Failure here just means the child already exec'd.
    ::setpgid(child_pid_, child_pid_);

    // Close the write end being used in the child proc
    TRYE(linux::close(output_pipe.write_fd), SyscallFailure);

    return init_parent();
}

Result<void> Subprocess::init_parent() {
    // Make reading from stdout non-blocking
    int pre_flags = TRYE(linux::fcntl(stdout_fd_, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(stdout_fd_, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
         SyscallFailure);

    return {};
}

PollResult Subprocess::poll(std::chrono::milliseconds timeout) {
    if (!is_alive_) {
        return Terminated{};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    OutputReceived received;

    if (stdout_fd_ != -1) {
        pollfd poll_struct = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};

        if (auto res = linux::poll(&poll_struct, 1, timeout); !res) {
            LOG_WARN("Error polling for output of pid {}: '{}'", child_pid_, res.error().message());
            std::this_thread::sleep_until(deadline);
        } else if (*res > 0) {
            drain_output(received.lines);
        }
    }

    // Once the output is closed the child is exiting (or has detached its output); wait for it for
    // the rest of the timeout instead of spinning
    bool exited = (stdout_fd_ == -1) ? wait_for_exit_until(deadline) : try_reap();

    if (exited) {
        drain_output(received.lines);
        flush_partial_line(received.lines);
        close_pipe();
        return Terminated{};
    }

    if (!received.lines.empty()) {
        return received;
    }

    return NoNewOutput{};
}

void Subprocess::drain_output(std::vector<std::string>& lines) {
    while (stdout_fd_ != -1) {
        auto res = linux::read(stdout_fd_, READ_CHUNK_SIZE);

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again ||
                res.error() == std::errc::operation_would_block) {
                return;
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }

            LOG_WARN("Error reading output of pid {}: '{}'", child_pid_, res.error().message());
            close_pipe();
            return;
        }

        // EOF
        if (res->empty()) {
            LOG_TRACE("Output pipe of pid {} closed", child_pid_);
            close_pipe();
            return;
        }

        partial_line_ += *res;

        std::size_t line_end = 0;
        while ((line_end = partial_line_.find('\n')) != std::string::npos) {
            std::string line = partial_line_.substr(0, line_end);
            partial_line_.erase(0, line_end + 1);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            sink_->write_line(line);
            lines.push_back(std::move(line));
        }
    }
}

void Subprocess::flush_partial_line(std::vector<std::string>& lines) {
    if (partial_line_.empty()) {
        return;
    }

    sink_->write_line(partial_line_);
    lines.push_back(std::exchange(partial_line_, {}));
}

bool Subprocess::try_reap() {
    auto res = linux::waitpid(child_pid_, WNOHANG);

    if (!res) {
        // ECHILD: somebody else reaped it; either way it is gone
        LOG_WARN("waitpid for pid {} failed ('{}'); treating the process as exited", child_pid_,
                 res.error().message());
        is_alive_ = false;
        end_time_ = std::chrono::steady_clock::now();
        return true;
    }

    if (!res->changed()) {
        return false;
    }

    mark_exited(res->status);

    return true;
}

bool Subprocess::wait_for_exit_until(std::chrono::steady_clock::time_point deadline) {
    while (true) {
        if (try_reap()) {
            return true;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }

        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(EXIT_CHECK_INTERVAL, deadline - now));
    }
}

void Subprocess::mark_exited(int wait_status) {
    end_time_ = std::chrono::steady_clock::now();
    is_alive_ = false;

    if (WIFEXITED(wait_status)) {
        exit_code_ = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        exit_code_ = SIGNAL_EXIT_CODE_BASE + WTERMSIG(wait_status);
    }

    LOG_DEBUG("pid {} exited with code {} after {}", child_pid_, exit_code_.value_or(-1),
              std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()));
}

bool Subprocess::is_alive() const {
    return is_alive_;
}

std::chrono::steady_clock::duration Subprocess::elapsed() const {
    return end_time_.value_or(std::chrono::steady_clock::now()) - start_time_;
}

std::optional<int> Subprocess::get_exit_code() const {
    return exit_code_;
}

void Subprocess::kill() noexcept {
    if (!is_alive_ || child_pid_ == 0) {
        return;
    }

    // Signal the whole group so that programs started by the shell die too
    if (!linux::kill(-child_pid_, SIGKILL)) {
        std::ignore = linux::kill(child_pid_, SIGKILL);
    }

    if (auto res = linux::waitpid(child_pid_); res && res->changed()) {
        mark_exited(res->status);
    } else {
        is_alive_ = false;
        end_time_ = std::chrono::steady_clock::now();
    }

    close_pipe();

    LOG_DEBUG("Killed pid {}", child_pid_);
}

void Subprocess::close_pipe() noexcept {
    if (stdout_fd_ == -1) {
        return;
    }

    std::ignore = linux::close(stdout_fd_);
    stdout_fd_ = -1;
}

} // namespace labmarker
