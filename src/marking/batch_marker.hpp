#pragma once

#include "grader/submission_runner.hpp"
#include "marking/failure_ledger.hpp"
#include "output/reporter.hpp"
#include "output/sink.hpp"
#include "user/selection_provider.hpp"

#include <labmarker/exec_status.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace labmarker {

/// Creates the output sink for one run of a submission.
/// `terminal_out` requests that captured output is echoed to the terminal too.
using SinkFactory = std::function<std::unique_ptr<OutputSink>(std::string_view submission, bool terminal_out)>;

struct MarkingSummary
{
    std::size_t num_marked = 0;
    std::size_t num_passed = 0;

    /// Failures still outstanding after any retries
    FailureLedger failures;
};

/// Runs the submissions of one class, automatically or one at a time, and drives the retry loop
class BatchMarker
{
public:
    static constexpr std::string_view SELECT_PROMPT = "Please select lab to continue";
    static constexpr std::string_view RETRY_PROMPT = "[y]es/[n]o:";
    static constexpr std::string_view RETRY_DECISION_PROMPT = "[R]emove, [C]ontinue:";

    BatchMarker(SubmissionRunner& runner, SelectionProvider& selector, Reporter& reporter, SinkFactory sink_factory);

    /// Runs every submission with output going only to its sink, then offers the retry loop for the failures
    MarkingSummary mark_all(const std::filesystem::path& class_path);

    /// The operator repeatedly picks a submission to run, until the selection provider stops
    void mark_manually(const std::filesystem::path& class_path);

    /// Re-runs failures picked by the operator until `ledger` is empty or the operator stops.
    /// Successful runs are removed automatically; failed ones may be removed by the operator.
    void retry(const std::filesystem::path& class_path, FailureLedger& ledger);

    /// Submission directories in `class_path`, sorted, skipping hidden entries
    static std::vector<std::string> list_submissions(const std::filesystem::path& class_path);

private:
    /// Runs one submission with a fresh sink, closed on every path
    ExecStatus run_one(const std::filesystem::path& class_path, const std::string& submission, bool terminal_out);

    SubmissionRunner* runner_;
    SelectionProvider* selector_;
    Reporter* reporter_;
    SinkFactory sink_factory_;
};

} // namespace labmarker
