#pragma once

#include "grader/launch_config.hpp"
#include "subprocess/process.hpp"

#include <labmarker/exec_status.hpp>
#include <labmarker/submission.hpp>

#include <chrono>
#include <string_view>

namespace labmarker {

class OutputSink;

/// Timing policy for a classification
struct ClassifierConfig
{
    /// Upper bound on how long one poll blocks
    std::chrono::milliseconds poll_interval{100};

    /// Polls after the initial liveness check before the process is force-killed
    int max_polls = 150;

    /// Minimum survival time; an exit before this is an unexpected termination
    std::chrono::milliseconds grace_period{2000};

    /// Upper bound for a language's build step
    std::chrono::milliseconds build_timeout{60000};
};

/// Drives one submission's process through a bounded polling loop and classifies the outcome.
///
/// States: Starting -> Running -> {NaturalExit, TimedOut}
///
///   - not alive after the first poll          => ExecutionFailed
///   - exited before `grace_period`             => UnexpectedTermination
///   - exited at or after `grace_period`        => Ok
///   - still alive after `max_polls` loop polls => killed once, Timeout
///
/// Languages without a run command (C) are not run at all: a manual-review message is written and the
/// result is Ok.
class ExecutionClassifier
{
public:
    enum class State { Starting, Running, NaturalExit, TimedOut };

    static constexpr std::string_view MANUAL_REVIEW_MSG_FMT = "Code implemented in {}, Please check manually!";

    ExecutionClassifier(ProcessLauncher& launcher, LaunchConfig launch_config, ClassifierConfig config = {});

    ExecStatus classify(const SubmissionRecord& record, OutputSink& sink) const;

    const LaunchConfig& get_launch_config() const { return launch_config_; }
    const ClassifierConfig& get_config() const { return config_; }

private:
    ExecStatus drive(Process& proc) const;

    ProcessLauncher* launcher_;
    LaunchConfig launch_config_;
    ClassifierConfig config_;
};

constexpr std::string_view to_string(ExecutionClassifier::State state) {
    using enum ExecutionClassifier::State;

    switch (state) {
    case Starting:
        return "Starting";
    case Running:
        return "Running";
    case NaturalExit:
        return "NaturalExit";
    case TimedOut:
        return "TimedOut";
    }
    return "<unknown>";
}

} // namespace labmarker
