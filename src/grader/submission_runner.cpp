#include "grader/submission_runner.hpp"

#include "grader/execution_classifier.hpp"
#include "output/sink.hpp"
#include "user/submission_locator.hpp"

#include <labmarker/exec_status.hpp>
#include <labmarker/logging.hpp>

#include <filesystem>

namespace labmarker {

LabSubmissionRunner::LabSubmissionRunner(const SubmissionLocator& locator, const ExecutionClassifier& classifier)
    : locator_{&locator}
    , classifier_{&classifier} {}

ExecStatus LabSubmissionRunner::run(const std::filesystem::path& submission_path, OutputSink& sink) {
    const auto& target_name = classifier_->get_launch_config().target_name;

    auto record = locator_->locate(submission_path, target_name);

    if (!record) {
        LOG_DEBUG("{} not found in {:?}", target_name, submission_path.string());
        sink.write_message(FILE_NOT_FOUND_MSG, /*echo=*/false);
        return ExecStatus::FileNotFound;
    }

    return classifier_->classify(*record, sink);
}

} // namespace labmarker
