#include "marking/batch_marker.hpp"

#include "grader/submission_runner.hpp"
#include "marking/failure_ledger.hpp"
#include "output/reporter.hpp"
#include "output/sink.hpp"
#include "user/selection_provider.hpp"

#include <labmarker/exec_status.hpp>
#include <labmarker/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace labmarker {

BatchMarker::BatchMarker(SubmissionRunner& runner, SelectionProvider& selector, Reporter& reporter,
                         SinkFactory sink_factory)
    : runner_{&runner}
    , selector_{&selector}
    , reporter_{&reporter}
    , sink_factory_{std::move(sink_factory)} {
    ASSERT(sink_factory_ != nullptr);
}

std::vector<std::string> BatchMarker::list_submissions(const std::filesystem::path& class_path) {
    namespace fs = std::filesystem;

    std::vector<std::string> submissions;
    std::error_code err;

    for (fs::directory_iterator iter{class_path, err}; !err && iter != fs::directory_iterator{}; iter.increment(err)) {
        std::string name = iter->path().filename().string();

        if (name.starts_with('.')) {
            continue;
        }

        std::error_code entry_err;
        if (!iter->is_directory(entry_err)) {
            LOG_DEBUG("Skipping {:?}: not a directory", name);
            continue;
        }

        submissions.push_back(std::move(name));
    }

    if (err) {
        LOG_ERROR("Error listing submissions in {:?}: {}", class_path.string(), err.message());
    }

    ranges::sort(submissions);

    return submissions;
}

ExecStatus BatchMarker::run_one(const std::filesystem::path& class_path, const std::string& submission,
                                bool terminal_out) {
    std::unique_ptr<OutputSink> sink;

    try {
        sink = sink_factory_(submission, terminal_out);
    } catch (const std::exception& ex) {
        LOG_ERROR("Could not open output for submission {}: {}", submission, ex.what());
        return ExecStatus::ExecutionFailed;
    }

    ASSERT(sink != nullptr, "Sink factory returned null", submission);

    auto close_sink = gsl::finally([&sink] { sink->close(); });

    try {
        return runner_->run(class_path / submission, *sink);
    } catch (const std::exception& ex) {
        // One broken submission must not take the whole batch down
        LOG_ERROR("Error while running submission {}: {}", submission, ex.what());
        sink->write_message(fmt::format("Error while running submission: {}", ex.what()), /*echo=*/false);
        return ExecStatus::ExecutionFailed;
    }
}

MarkingSummary BatchMarker::mark_all(const std::filesystem::path& class_path) {
    MarkingSummary summary;

    const std::vector<std::string> submissions = list_submissions(class_path);

    reporter_->on_marking_begin("automatically", submissions.size());

    for (std::size_t i = 0; i < submissions.size(); ++i) {
        const std::string& submission = submissions[i];

        reporter_->on_submission_begin(submission, i + 1, submissions.size());

        ExecStatus status = run_one(class_path, submission, /*terminal_out=*/false);

        LOG_INFO("{}: {:d}", submission, status);
        reporter_->on_submission_result(submission, status);

        summary.num_marked++;

        if (is_success(status)) {
            summary.num_passed++;
        } else {
            summary.failures.record(submission, std::string{exec_status_description(status)});
        }
    }

    reporter_->on_failure_summary(summary.failures);

    if (!summary.failures.empty()) {
        std::optional decision = selector_->choose(RETRY_PROMPT, "yn");

        if (decision == 'y') {
            retry(class_path, summary.failures);
        }
    }

    reporter_->on_marking_end(summary.num_marked, summary.num_passed, summary.failures.size());

    return summary;
}

void BatchMarker::mark_manually(const std::filesystem::path& class_path) {
    const std::vector<std::string> submissions = list_submissions(class_path);

    reporter_->on_marking_begin("manually", submissions.size());

    while (true) {
        std::optional selection = selector_->select(SELECT_PROMPT, submissions);

        if (!selection) {
            LOG_DEBUG("Manual marking stopped by operator");
            return;
        }

        if (*selection >= submissions.size()) {
            LOG_WARN("Ignoring out of range selection {}", *selection);
            continue;
        }

        const std::string& submission = submissions[*selection];

        reporter_->on_submission_begin(submission, 0, 0);

        ExecStatus status = run_one(class_path, submission, /*terminal_out=*/true);

        LOG_DEBUG("{}: {:d}", submission, status);
        reporter_->on_submission_result(submission, status);
    }
}

void BatchMarker::retry(const std::filesystem::path& class_path, FailureLedger& ledger) {
    while (!ledger.empty()) {
        reporter_->on_retry_list(ledger);

        const std::vector<std::string> remaining = ledger.submissions();
        std::optional selection = selector_->select(SELECT_PROMPT, remaining);

        if (!selection) {
            LOG_DEBUG("Retry loop stopped by operator with {} submissions outstanding", ledger.size());
            return;
        }

        if (*selection >= remaining.size()) {
            LOG_WARN("Ignoring out of range selection {}", *selection);
            continue;
        }

        const std::string& submission = remaining[*selection];

        reporter_->on_submission_begin(submission, 0, 0);

        ExecStatus status = run_one(class_path, submission, /*terminal_out=*/true);

        reporter_->on_submission_result(submission, status);

        if (is_success(status)) {
            ledger.remove(submission);
            reporter_->on_retry_removed(submission, /*automatically=*/true);
            continue;
        }

        // Keep the reason in line with the latest run
        ledger.record(submission, std::string{exec_status_description(status)});

        std::optional decision = selector_->choose(RETRY_DECISION_PROMPT, "rc");

        if (!decision) {
            return;
        }

        if (*decision == 'r') {
            ledger.remove(submission);
            reporter_->on_retry_removed(submission, /*automatically=*/false);
        }
    }
}

} // namespace labmarker
