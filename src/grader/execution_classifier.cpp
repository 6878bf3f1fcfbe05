#include "grader/execution_classifier.hpp"

#include "grader/launch_config.hpp"
#include "output/sink.hpp"
#include "subprocess/process.hpp"

#include <labmarker/common/overloaded.hpp>
#include <labmarker/exec_status.hpp>
#include <labmarker/logging.hpp>
#include <labmarker/submission.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace labmarker {

namespace {

void transition(ExecutionClassifier::State& state, ExecutionClassifier::State next) {
    LOG_DEBUG("Classifier state {} -> {}", to_string(state), to_string(next));
    state = next;
}

} // namespace

ExecutionClassifier::ExecutionClassifier(ProcessLauncher& launcher, LaunchConfig launch_config,
                                         ClassifierConfig config)
    : launcher_{&launcher}
    , launch_config_{std::move(launch_config)}
    , config_{config} {
    ASSERT(config_.max_polls >= 0, "Negative poll ceiling", config_.max_polls);
    ASSERT(config_.poll_interval.count() > 0, "Poll interval must be positive");
}

ExecStatus ExecutionClassifier::classify(const SubmissionRecord& record, OutputSink& sink) const {
    std::optional<std::string> run_command = launch_config_.run_command(record.language);

    if (!run_command) {
        LOG_WARN("There is no current implementation for {} files, skipping evaluation of {:?}", record.language,
                 record.folder_path.string());
        sink.write_message(fmt::format(fmt::runtime(MANUAL_REVIEW_MSG_FMT), record.language));
        return ExecStatus::Ok;
    }

    // Fire-and-forget: a failed build simply leaves nothing to run, which shows up as ExecutionFailed
    if (std::optional build_command = launch_config_.build_command(record.language)) {
        LOG_DEBUG("Building with {:?} in {:?}", *build_command, record.folder_path.string());
        launcher_->run_unchecked(*build_command, record.folder_path, sink, config_.build_timeout);
    }

    LOG_DEBUG("Running {:?} in {:?}", *run_command, record.folder_path.string());

    std::unique_ptr<Process> proc = launcher_->spawn(*run_command, record.folder_path, sink);
    ASSERT(proc != nullptr);

    ExecStatus status = drive(*proc);

    LOG_DEBUG("Classified {:?} as {} after {}", record.folder_path.string(), status,
              std::chrono::duration_cast<std::chrono::milliseconds>(proc->elapsed()));

    return status;
}

ExecStatus ExecutionClassifier::drive(Process& proc) const {
    using enum State;

    State state = Starting;

    // A process that does not survive the first poll interval crashed or never launched at all.
    // Output ends a poll early, so keep polling until the whole interval has passed.
    while (proc.is_alive() && proc.elapsed() < config_.poll_interval) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(config_.poll_interval - proc.elapsed());

        if (std::holds_alternative<Terminated>(proc.poll(remaining))) {
            break;
        }
    }

    if (!proc.is_alive()) {
        LOG_DEBUG("Process was not alive at the first liveness check");
        return ExecStatus::ExecutionFailed;
    }

    transition(state, Running);

    for (int poll_count = 1;; ++poll_count) {
        if (poll_count > config_.max_polls) {
            transition(state, TimedOut);
            proc.kill();
            return ExecStatus::Timeout;
        }

        PollResult res = proc.poll(config_.poll_interval);

        bool terminated = std::visit(Overloaded{
                                         [](const NoNewOutput& /*unused*/) { return false; },
                                         [](const OutputReceived& received) {
                                             LOG_TRACE("Received {} lines of output", received.lines.size());
                                             return false;
                                         },
                                         [](const Terminated& /*unused*/) { return true; },
                                     },
                                     res);

        if (terminated) {
            transition(state, NaturalExit);

            if (proc.elapsed() < config_.grace_period) {
                return ExecStatus::UnexpectedTermination;
            }

            return ExecStatus::Ok;
        }
    }
}

} // namespace labmarker
