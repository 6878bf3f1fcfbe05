#pragma once

#include "grader/execution_classifier.hpp"
#include "user/submission_locator.hpp"

#include <labmarker/exec_status.hpp>

#include <filesystem>
#include <string_view>

namespace labmarker {

class OutputSink;

/// Classifies one submission directory
class SubmissionRunner
{
public:
    virtual ~SubmissionRunner() = default;

    virtual ExecStatus run(const std::filesystem::path& submission_path, OutputSink& sink) = 0;
};

/// Locates the client source file, then hands it to the classifier.
/// A submission without a source file is never run.
class LabSubmissionRunner final : public SubmissionRunner
{
public:
    static constexpr std::string_view FILE_NOT_FOUND_MSG = "File not found";

    LabSubmissionRunner(const SubmissionLocator& locator, const ExecutionClassifier& classifier);

    ExecStatus run(const std::filesystem::path& submission_path, OutputSink& sink) override;

private:
    const SubmissionLocator* locator_;
    const ExecutionClassifier* classifier_;
};

} // namespace labmarker
