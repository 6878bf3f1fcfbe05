#pragma once

#include <labmarker/common/class_traits.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace labmarker {

class OutputSink;

/// The poll timed out without any new output
struct NoNewOutput
{
};

/// New complete lines arrived (they have already been forwarded to the sink)
struct OutputReceived
{
    std::vector<std::string> lines;
};

/// The child has ended; liveness is now false
struct Terminated
{
};

using PollResult = std::variant<NoNewOutput, OutputReceived, Terminated>;

/// Handle on one spawned child process
class Process : NonCopyable
{
public:
    virtual ~Process() = default;

    /// Wait at most `timeout` for new output. Never blocks longer than that.
    virtual PollResult poll(std::chrono::milliseconds timeout) = 0;

    /// Liveness as of the most recent poll
    virtual bool is_alive() const = 0;

    /// Time since spawn; stops advancing once the exit or kill has been observed
    virtual std::chrono::steady_clock::duration elapsed() const = 0;

    /// Forcibly terminate. Idempotent; never fails from the caller's perspective.
    virtual void kill() noexcept = 0;
};

/// Creates processes for the classifier
class ProcessLauncher
{
public:
    virtual ~ProcessLauncher() = default;

    /// Launch `command` through the shell in `working_dir`, capturing stdout and stderr into `sink`.
    /// A launch failure yields a handle that reports not-alive on its first poll.
    virtual std::unique_ptr<Process> spawn(const std::string& command, const std::filesystem::path& working_dir,
                                           OutputSink& sink) = 0;

    /// Run `command` to completion (bounded by `timeout`), forwarding its output to `sink`.
    /// The exit status is only logged.
    virtual void run_unchecked(const std::string& command, const std::filesystem::path& working_dir,
                               OutputSink& sink, std::chrono::milliseconds timeout) = 0;
};

} // namespace labmarker
