#include "fakes.hpp"

#include "grader/execution_classifier.hpp"
#include "grader/launch_config.hpp"

#include <labmarker/exec_status.hpp>
#include <labmarker/submission.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

using labmarker::ClassifierConfig;
using labmarker::ExecStatus;
using labmarker::ExecutionClassifier;
using labmarker::Language;
using labmarker::LaunchConfig;
using labmarker::SubmissionRecord;
using labmarker::test::FakeLauncher;
using labmarker::test::FakeProcessScript;
using labmarker::test::MemorySink;

namespace {

SubmissionRecord python_record() {
    return {.folder_path = "/submissions/z1234567", .extension = ".py", .language = Language::Python};
}

ExecStatus classify_with(FakeLauncher& launcher, const SubmissionRecord& record = python_record(),
                         ClassifierConfig config = {}) {
    ExecutionClassifier classifier{launcher, LaunchConfig{}, config};
    MemorySink sink;
    return classifier.classify(record, sink);
}

} // namespace

TEST_CASE("Process dead at the first liveness check is an execution failure") {
    FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 1, .exit_elapsed = 5ms}};

    REQUIRE(classify_with(launcher) == ExecStatus::ExecutionFailed);
    REQUIRE(launcher.stats->polls == 1);
    REQUIRE(launcher.stats->kills == 0);
}

TEST_CASE("Output during start-up does not cut the first liveness check short") {
    // Each poll returns early with output, so the first interval spans several polls
    FakeLauncher launcher{FakeProcessScript{
        .exits_on_poll = 3, .exit_elapsed = 60ms, .time_per_poll = 30ms, .output_per_poll = {"Traceback"}}};

    MemorySink sink;
    ExecutionClassifier classifier{launcher, LaunchConfig{}};

    REQUIRE(classifier.classify(python_record(), sink) == ExecStatus::ExecutionFailed);
    REQUIRE(launcher.stats->polls == 3);
    REQUIRE(sink.lines == std::vector<std::string>{"Traceback", "Traceback"});
}

TEST_CASE("Process alive for the whole first interval is running") {
    FakeLauncher launcher{FakeProcessScript{
        .exits_on_poll = 5, .exit_elapsed = 120ms, .time_per_poll = 30ms, .output_per_poll = {"Traceback"}}};

    // Four polls cover the first 100ms, the fifth sees the exit
    REQUIRE(classify_with(launcher) == ExecStatus::UnexpectedTermination);
    REQUIRE(launcher.stats->polls == 5);
}

TEST_CASE("Exit before the grace period is an unexpected termination") {
    FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 5, .exit_elapsed = 500ms}};

    REQUIRE(classify_with(launcher) == ExecStatus::UnexpectedTermination);
    REQUIRE(launcher.stats->kills == 0);
}

TEST_CASE("Grace period boundary is inclusive") {
    SECTION("Exactly at the grace period") {
        FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 21, .exit_elapsed = 2000ms}};
        REQUIRE(classify_with(launcher) == ExecStatus::Ok);
    }

    SECTION("Just before the grace period") {
        FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 21, .exit_elapsed = 1999ms}};
        REQUIRE(classify_with(launcher) == ExecStatus::UnexpectedTermination);
    }

    SECTION("Well after the grace period") {
        FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 40, .exit_elapsed = 4000ms}};
        REQUIRE(classify_with(launcher) == ExecStatus::Ok);
    }
}

TEST_CASE("Process that never exits is killed exactly once and times out") {
    FakeLauncher launcher{FakeProcessScript{}};

    REQUIRE(classify_with(launcher) == ExecStatus::Timeout);

    // The initial liveness check plus the loop ceiling
    REQUIRE(launcher.stats->polls == 1 + 150);
    REQUIRE(launcher.stats->kills == 1);
}

TEST_CASE("Output does not reset the poll ceiling") {
    FakeLauncher launcher{FakeProcessScript{.output_per_poll = {"PING 1 rtt=0.1ms"}}};

    ExecutionClassifier classifier{launcher, LaunchConfig{}};
    MemorySink sink;

    REQUIRE(classifier.classify(python_record(), sink) == ExecStatus::Timeout);
    REQUIRE(launcher.stats->polls == 151);
    REQUIRE(launcher.stats->kills == 1);

    // Every poll forwarded its line to the sink
    REQUIRE(sink.lines.size() == 151);
}

TEST_CASE("Exit on the last allowed poll is still a natural exit") {
    SECTION("On the final loop poll") {
        FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 151, .exit_elapsed = 15000ms}};

        REQUIRE(classify_with(launcher) == ExecStatus::Ok);
        REQUIRE(launcher.stats->kills == 0);
    }

    SECTION("One poll too late") {
        FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 152, .exit_elapsed = 15100ms}};

        REQUIRE(classify_with(launcher) == ExecStatus::Timeout);
        REQUIRE(launcher.stats->polls == 151);
        REQUIRE(launcher.stats->kills == 1);
    }
}

TEST_CASE("Poll ceiling follows the configuration") {
    FakeLauncher launcher{FakeProcessScript{}};

    ClassifierConfig config{.poll_interval = 10ms, .max_polls = 3, .grace_period = 100ms};

    REQUIRE(classify_with(launcher, python_record(), config) == ExecStatus::Timeout);
    REQUIRE(launcher.stats->polls == 4);
    REQUIRE(launcher.stats->kills == 1);
}

TEST_CASE("Python submission is run with the interpreter, host and port") {
    FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 30, .exit_elapsed = 3s}};

    REQUIRE(classify_with(launcher) == ExecStatus::Ok);

    REQUIRE(launcher.built.empty());
    REQUIRE(launcher.spawned.size() == 1);
    REQUIRE(launcher.spawned[0].command == "python3 PingClient.py localhost 12000");
    REQUIRE(launcher.spawned[0].working_dir.string() == "/submissions/z1234567");
}

TEST_CASE("Java submission is compiled before it is run") {
    FakeLauncher launcher{FakeProcessScript{.exits_on_poll = 30, .exit_elapsed = 3s}};

    SubmissionRecord record{.folder_path = "/submissions/z7654321/lab2", .extension = ".java",
                            .language = Language::Java};

    REQUIRE(classify_with(launcher, record) == ExecStatus::Ok);

    REQUIRE(launcher.built.size() == 1);
    REQUIRE(launcher.built[0].command == "javac PingClient.java");
    REQUIRE(launcher.built[0].working_dir.string() == "/submissions/z7654321/lab2");

    REQUIRE(launcher.spawned.size() == 1);
    REQUIRE(launcher.spawned[0].command == "java PingClient localhost 12000");
}

TEST_CASE("C submission is not run and is flagged for manual review") {
    FakeLauncher launcher;
    ExecutionClassifier classifier{launcher, LaunchConfig{}};
    MemorySink sink;

    SubmissionRecord record{.folder_path = "/submissions/z1111111", .extension = ".c", .language = Language::C};

    REQUIRE(classifier.classify(record, sink) == ExecStatus::Ok);

    REQUIRE(launcher.spawned.empty());
    REQUIRE(launcher.built.empty());
    REQUIRE(launcher.stats->polls == 0);

    REQUIRE(sink.messages.size() == 1);
    REQUIRE(sink.messages[0].text == "Code implemented in C, Please check manually!");
    REQUIRE(sink.messages[0].echo);
}

TEST_CASE("Classifier state names") {
    using State = ExecutionClassifier::State;

    REQUIRE(labmarker::to_string(State::Starting) == "Starting");
    REQUIRE(labmarker::to_string(State::Running) == "Running");
    REQUIRE(labmarker::to_string(State::NaturalExit) == "NaturalExit");
    REQUIRE(labmarker::to_string(State::TimedOut) == "TimedOut");
}
