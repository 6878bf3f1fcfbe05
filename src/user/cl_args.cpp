#include "user/cl_args.hpp"

#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <labmarker/common/expected.hpp>
#include <labmarker/logging.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <sys/ioctl.h>
#include <unistd.h>

namespace labmarker {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), LABMARKER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

template <typename IntT>
IntT parse_int(std::string_view opt, std::string_view arg_name, IntT min = std::numeric_limits<IntT>::min(),
               IntT max = std::numeric_limits<IntT>::max()) {
    IntT value{};
    const char* last = opt.data() + opt.size();
    auto [ptr, err] = std::from_chars(opt.data(), last, value);

    if (err != std::errc{} || ptr != last) {
        throw std::invalid_argument(fmt::format("{} expects an integer, got {:?}", arg_name, opt));
    }

    if (value < min || value > max) {
        throw std::invalid_argument(fmt::format("{} must be in the range [{}, {}], got {}", arg_name, min, max, value));
    }

    return value;
}

std::size_t get_terminal_width() {
    winsize term_sz{};

    if (in_terminal(stdout) && ::ioctl(STDOUT_FILENO, TIOCGWINSZ, &term_sz) == 0 && term_sz.ws_col > 0) {
        return term_sz.ws_col;
    }

    constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
    return DEFAULT_MAX_WIDTH;
}

} // namespace

void CommandLineArgs::setup_parser() {
    arg_parser_.set_usage_max_line_width(get_terminal_width() * 3 / 4);

    arg_parser_.add_description(fmt::format("LabMarker v{}\nRuns every submission's client against the reference "
                                            "server and classifies how it behaved.",
                                            LABMARKER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("class-path")
        .metavar("CLASS_PATH")
        .action([this] (const std::string& opt) {
                opts_buffer_.class_path = opt;
        })
        .help("Directory containing one subdirectory per submission");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", LABMARKER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-m", "--manual")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.mode = ProgramOptions::Mode::Manual;
        })
        .help("Select submissions to run one at a time, instead of running all of them");

    arg_parser_.add_argument("-o", "--output")
        .default_value(std::string{ProgramOptions::DEFAULT_OUTPUT_PATH})
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) {
                opts_buffer_.output_path = opt;
        })
        .help("Directory for per-submission output files. Created if it does not exist.");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    arg_parser_.add_argument("--host")
        .default_value(std::string{LaunchConfig::DEFAULT_HOST})
        .nargs(1)
        .metavar("HOST")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.host = opt;
        })
        .help("Hostname of the reference server passed to each client");

    arg_parser_.add_argument("-p", "--port")
        .default_value(std::string{fmt::format("{}", LaunchConfig::DEFAULT_PORT)})
        .nargs(1)
        .metavar("PORT")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.port = parse_int<std::uint16_t>(opt, "--port", 1);
        })
        .help("Port of the reference server passed to each client");

    arg_parser_.add_argument("--target")
        .default_value(std::string{LaunchConfig::DEFAULT_TARGET_NAME})
        .nargs(1)
        .metavar("NAME")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.target_name = opt;
        })
        .help("Base name of the client source file to search for");

    arg_parser_.add_argument("--python")
        .default_value(opts_buffer_.launch.python)
        .nargs(1)
        .metavar("CMD")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.python = opt;
        })
        .help("Python interpreter command");

    arg_parser_.add_argument("--java")
        .default_value(opts_buffer_.launch.java)
        .nargs(1)
        .metavar("CMD")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.java = opt;
        })
        .help("Java runtime command");

    arg_parser_.add_argument("--javac")
        .default_value(opts_buffer_.launch.javac)
        .nargs(1)
        .metavar("CMD")
        .action([this] (const std::string& opt) {
                opts_buffer_.launch.javac = opt;
        })
        .help("Java compiler command, run before every Java submission");

    arg_parser_.add_argument("--poll-interval")
        .default_value(std::string{fmt::format("{}", opts_buffer_.classifier.poll_interval.count())})
        .nargs(1)
        .metavar("MS")
        .action([this] (const std::string& opt) {
                opts_buffer_.classifier.poll_interval = std::chrono::milliseconds{parse_int<int>(opt, "--poll-interval", 1)};
        })
        .help("Longest time a single output poll may block, in milliseconds");

    arg_parser_.add_argument("--max-polls")
        .default_value(std::string{fmt::format("{}", opts_buffer_.classifier.max_polls)})
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) {
                opts_buffer_.classifier.max_polls = parse_int<int>(opt, "--max-polls", 1);
        })
        .help("Polls after start-up before a still-running client is killed");

    arg_parser_.add_argument("--grace")
        .default_value(std::string{fmt::format("{}", opts_buffer_.classifier.grace_period.count())})
        .nargs(1)
        .metavar("MS")
        .action([this] (const std::string& opt) {
                opts_buffer_.classifier.grace_period = std::chrono::milliseconds{parse_int<int>(opt, "--grace", 0)};
        })
        .help("Minimum run time, in milliseconds, for an exit to count as normal");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print("{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace labmarker
