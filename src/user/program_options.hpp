#pragma once

#include "grader/execution_classifier.hpp"
#include "grader/launch_config.hpp"

#include <labmarker/common/error_types.hpp>
#include <labmarker/common/expected.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace labmarker {

struct ProgramOptions
{

    // ###### Argument fields

    enum class Mode { Automatic, Manual } mode = Mode::Automatic;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Directory holding one subdirectory per submission
    std::filesystem::path class_path;

    /// Where the per-submission output files go. Created if absent.
    std::filesystem::path output_path = DEFAULT_OUTPUT_PATH;

    LaunchConfig launch;
    ClassifierConfig classifier;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_OUTPUT_PATH = "lab2_output";

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        TRY(ensure_is_directory(class_path, "Class path {:?}"));

        if (std::filesystem::exists(output_path) && !std::filesystem::is_directory(output_path)) {
            return fmt::format("Output path {:?} exists and is not a directory", output_path.string());
        }

        if (launch.target_name.empty()) {
            return std::string{"Target file name must not be empty"};
        }

        if (launch.port == 0) {
            return std::string{"Port must be in the range [1, 65535]"};
        }

        if (classifier.poll_interval.count() <= 0) {
            return fmt::format("Poll interval must be positive (got {}ms)", classifier.poll_interval.count());
        }

        if (classifier.max_polls <= 0) {
            return fmt::format("Maximum number of polls must be positive (got {})", classifier.max_polls);
        }

        if (classifier.grace_period.count() < 0) {
            return fmt::format("Grace period must not be negative (got {}ms)", classifier.grace_period.count());
        }

        return {};
    }
};

} // namespace labmarker

template <>
struct fmt::formatter<::labmarker::ProgramOptions> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const ::labmarker::ProgramOptions& from, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{mode={}, color_opt={}, class_path={:?}, output_path={:?}, host={}, port={}, "
                              "target={}, python={}, java={}, javac={}, poll_interval={}ms, max_polls={}, grace={}ms}}",
                              fmt::underlying(from.mode), fmt::underlying(from.colorize_option),
                              from.class_path.string(), from.output_path.string(), from.launch.host, from.launch.port,
                              from.launch.target_name, from.launch.python, from.launch.java, from.launch.javac,
                              from.classifier.poll_interval.count(), from.classifier.max_polls,
                              from.classifier.grace_period.count());
    }
};
