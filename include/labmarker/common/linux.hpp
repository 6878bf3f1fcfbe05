#pragma once

#include <labmarker/common/expected.hpp>
#include <labmarker/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace labmarker::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// reads fromm a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see kill(2). A negative ``pid`` signals the whole process group.
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{res};
}

/// Result of a non-blocking ``waitpid``. ``pid == 0`` means the child has not changed state.
struct WaitStatus
{
    pid_t pid;
    int status;

    bool changed() const { return pid != 0; }
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = ::waitpid(pid, &status, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid(pid={}) failed: '{}'", pid, err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see poll(2)
/// Returns the number of ready descriptors; 0 on timeout. Interrupted calls are reported as a timeout.
inline Expected<int> poll(pollfd* fds, nfds_t nfds, std::chrono::milliseconds timeout) {
    int res = ::poll(fds, nfds, static_cast<int>(timeout.count()));

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err == std::errc::interrupted) {
            return 0;
        }

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

} // namespace labmarker::linux
