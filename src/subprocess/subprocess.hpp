#pragma once

#include "subprocess/process.hpp"

#include <labmarker/common/error_types.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace labmarker {

class OutputSink;

/// A child process started as `/bin/sh -c <command>` in its own process group.
/// stdout and stderr are merged into a single non-blocking pipe; stdin is /dev/null.
class Subprocess final : public Process
{
public:
    Subprocess(std::string command, std::filesystem::path working_dir, OutputSink& sink);

    /// Kills the child if it is still running
    ~Subprocess() override;

    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    /// Fork and exec the child. On failure the handle stays not-alive.
    Result<void> start();

    PollResult poll(std::chrono::milliseconds timeout) override;
    bool is_alive() const override;
    std::chrono::steady_clock::duration elapsed() const override;
    void kill() noexcept override;

    /// Exit code of the child once reaped. Death by signal N is reported as 128 + N, like a shell would.
    std::optional<int> get_exit_code() const;

private:
    Result<void> create();
    Result<void> init_parent();

    /// Read everything currently available from the pipe, forwarding complete lines.
    /// Closes the pipe on EOF.
    void drain_output(std::vector<std::string>& lines);

    /// Non-blocking check for the child's exit; records it if it happened
    bool try_reap();

    /// Checks for exit repeatedly until `deadline`
    bool wait_for_exit_until(std::chrono::steady_clock::time_point deadline);

    void mark_exited(int wait_status);
    void flush_partial_line(std::vector<std::string>& lines);
    void close_pipe() noexcept;

    static constexpr std::size_t READ_CHUNK_SIZE = 4096;
    static constexpr auto EXIT_CHECK_INTERVAL = std::chrono::milliseconds{5};

    std::string command_;
    std::filesystem::path working_dir_;
    OutputSink* sink_;

    pid_t child_pid_ = 0;
    bool is_alive_ = false;
    int stdout_fd_ = -1;

    std::string partial_line_;
    std::optional<int> exit_code_;

    std::chrono::steady_clock::time_point start_time_{};
    std::optional<std::chrono::steady_clock::time_point> end_time_;
};

} // namespace labmarker
