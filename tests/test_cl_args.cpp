#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <span>
#include <string>

using labmarker::CommandLineArgs;
using labmarker::ProgramOptions;

namespace {

const std::string CLASS_DIR = (std::filesystem::path{RESOURCES_DIR} / "class").string();

template <std::size_t N>
auto parse(std::array<const char*, N> args) {
    CommandLineArgs cl_args{std::span<const char*>{args}};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Defaults with only a class path") {
    auto res = parse(std::array{"labmarker", CLASS_DIR.c_str()});

    REQUIRE(res.has_value());

    const ProgramOptions& opts = res.value();
    REQUIRE(opts.class_path.string() == CLASS_DIR);
    REQUIRE(opts.output_path.string() == ProgramOptions::DEFAULT_OUTPUT_PATH);
    REQUIRE(opts.mode == ProgramOptions::Mode::Automatic);
    REQUIRE(opts.colorize_option == ProgramOptions::ColorizeOpt::Auto);

    REQUIRE(opts.launch.host == "localhost");
    REQUIRE(opts.launch.port == 12000);
    REQUIRE(opts.launch.target_name == "PingClient");
    REQUIRE(opts.launch.python == "python3");

    REQUIRE(opts.classifier.poll_interval == std::chrono::milliseconds{100});
    REQUIRE(opts.classifier.max_polls == 150);
    REQUIRE(opts.classifier.grace_period == std::chrono::milliseconds{2000});
}

TEST_CASE("Every option is applied") {
    auto res = parse(std::array{"labmarker", CLASS_DIR.c_str(), "--manual", "-o", "/tmp/labmarker-out", "--color",
                                "never", "--host", "10.1.1.1", "--port", "8081", "--target", "UDPClient", "--python",
                                "pypy3", "--java", "java21", "--javac", "javac21", "--poll-interval", "20",
                                "--max-polls", "10", "--grace", "500"});

    REQUIRE(res.has_value());

    const ProgramOptions& opts = res.value();
    REQUIRE(opts.mode == ProgramOptions::Mode::Manual);
    REQUIRE(opts.output_path.string() == "/tmp/labmarker-out");
    REQUIRE(opts.colorize_option == ProgramOptions::ColorizeOpt::Never);
    REQUIRE(opts.launch.host == "10.1.1.1");
    REQUIRE(opts.launch.port == 8081);
    REQUIRE(opts.launch.target_name == "UDPClient");
    REQUIRE(opts.launch.python == "pypy3");
    REQUIRE(opts.launch.java == "java21");
    REQUIRE(opts.launch.javac == "javac21");
    REQUIRE(opts.classifier.poll_interval == std::chrono::milliseconds{20});
    REQUIRE(opts.classifier.max_polls == 10);
    REQUIRE(opts.classifier.grace_period == std::chrono::milliseconds{500});
}

TEST_CASE("Missing class path is an error") {
    REQUIRE(!parse(std::array{"labmarker"}).has_value());
}

TEST_CASE("Nonexistent class path is an error") {
    auto res = parse(std::array{"labmarker", "/nonexistent/labmarker/class"});

    REQUIRE(!res.has_value());
    REQUIRE(res.error().find("does not exist") != std::string::npos);
}

TEST_CASE("Malformed numbers are errors") {
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--port", "twelve"}).has_value());
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--port", "0"}).has_value());
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--port", "70000"}).has_value());
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--max-polls", "0"}).has_value());
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--poll-interval", "-5"}).has_value());
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--grace", "2s"}).has_value());
}

TEST_CASE("Unknown color choice is an error") {
    REQUIRE(!parse(std::array{"labmarker", CLASS_DIR.c_str(), "--color", "sometimes"}).has_value());
}

TEST_CASE("Help message lists the options") {
    std::array args{"labmarker"};
    CommandLineArgs cl_args{std::span<const char*>{args}};

    std::string help = cl_args.help_message();

    REQUIRE(help.find("--manual") != std::string::npos);
    REQUIRE(help.find("--poll-interval") != std::string::npos);
    REQUIRE(help.find("CLASS_PATH") != std::string::npos);
}
