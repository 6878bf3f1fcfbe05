#include "app/marker_app.hpp"

#include "grader/execution_classifier.hpp"
#include "grader/submission_runner.hpp"
#include "marking/batch_marker.hpp"
#include "output/plaintext_reporter.hpp"
#include "output/stream_sink.hpp"
#include "subprocess/subprocess_launcher.hpp"
#include "user/program_options.hpp"
#include "user/submission_locator.hpp"
#include "user/terminal_selection_provider.hpp"

#include <labmarker/logging.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace labmarker {

std::filesystem::path MarkerApp::output_file_for(const std::filesystem::path& output_dir,
                                                 std::string_view submission) {
    return output_dir / fmt::format("{}_output.txt", submission);
}

SinkFactory MarkerApp::make_sink_factory() const {
    return [output_dir = OPTS.output_path](std::string_view submission,
                                           bool terminal_out) -> std::unique_ptr<OutputSink> {
        return std::make_unique<StreamSink>(output_file_for(output_dir, submission), terminal_out);
    };
}

int MarkerApp::run_impl() {
    // Throws std::filesystem::filesystem_error if the directory can't be made
    std::filesystem::create_directories(OPTS.output_path);

    LOG_DEBUG("Writing submission output to {:?}", OPTS.output_path.string());

    SubprocessLauncher launcher;
    SubmissionLocator locator;
    ExecutionClassifier classifier{launcher, OPTS.launch, OPTS.classifier};
    LabSubmissionRunner runner{locator, classifier};

    bool colorize = PlainTextReporter::process_colorize_opt(OPTS.colorize_option);
    TerminalSelectionProvider selector{std::cin, std::cout, colorize};
    PlainTextReporter reporter{std::cout, OPTS.colorize_option};

    BatchMarker marker{runner, selector, reporter, make_sink_factory()};

    switch (OPTS.mode) {
    case ProgramOptions::Mode::Automatic: {
        MarkingSummary summary = DEBUG_TIME(marker.mark_all(OPTS.class_path));
        LOG_INFO("Marked {} submissions, {} passed, {} outstanding", summary.num_marked, summary.num_passed,
                 summary.failures.size());
        break;
    }
    case ProgramOptions::Mode::Manual:
        marker.mark_manually(OPTS.class_path);
        break;
    }

    return EXIT_SUCCESS;
}

} // namespace labmarker
