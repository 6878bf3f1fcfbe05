#include "fakes.hpp"

#include "marking/batch_marker.hpp"
#include "marking/failure_ledger.hpp"

#include <labmarker/exec_status.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using labmarker::BatchMarker;
using labmarker::ExecStatus;
using labmarker::FailureLedger;
using labmarker::MarkingSummary;
using labmarker::OutputSink;
using labmarker::test::MemorySink;
using labmarker::test::RecordingReporter;
using labmarker::test::ScriptedRunner;
using labmarker::test::ScriptedSelectionProvider;
using labmarker::test::TempDir;

namespace {

/// Forwards to a MemorySink that outlives it, since the marker destroys the sinks it creates
class ForwardingSink final : public OutputSink
{
public:
    explicit ForwardingSink(std::shared_ptr<MemorySink> inner)
        : inner_{std::move(inner)} {}

    void write_line(std::string_view line) override { inner_->write_line(line); }
    void write_message(std::string_view msg, bool echo) override { inner_->write_message(msg, echo); }
    void close() override { inner_->close(); }

private:
    std::shared_ptr<MemorySink> inner_;
};

/// Keeps every sink it hands out so that tests can inspect them afterwards
struct SinkLog
{
    struct Entry
    {
        std::string submission;
        bool terminal_out;
        std::shared_ptr<MemorySink> sink;
    };

    labmarker::SinkFactory factory() {
        return [this](std::string_view submission, bool terminal_out) -> std::unique_ptr<OutputSink> {
            auto sink = std::make_shared<MemorySink>();
            entries.push_back({std::string{submission}, terminal_out, sink});
            return std::make_unique<ForwardingSink>(sink);
        };
    }

    std::vector<Entry> entries;
};

/// A class directory with submissions z1, z2, z3 (plus entries that must be ignored)
struct ClassFixture
{
    ClassFixture()
        : dir{"batch-marker"} {
        dir.make_dir("z2");
        dir.make_dir("z1");
        dir.make_dir("z3");
        dir.make_dir(".git");
        dir.write_file("roster.csv", "z1,z2,z3\n");
    }

    TempDir dir;
    ScriptedRunner runner;
    ScriptedSelectionProvider selector;
    RecordingReporter reporter;
    SinkLog sinks;
};

} // namespace

TEST_CASE("Submissions are the sorted, visible subdirectories") {
    ClassFixture fixture;

    REQUIRE(BatchMarker::list_submissions(fixture.dir.path()) == std::vector<std::string>{"z1", "z2", "z3"});
    REQUIRE(BatchMarker::list_submissions(fixture.dir.path() / "missing").empty());
}

TEST_CASE("Automatic marking with every submission passing") {
    ClassFixture fixture;
    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};

    MarkingSummary summary = marker.mark_all(fixture.dir.path());

    REQUIRE(summary.num_marked == 3);
    REQUIRE(summary.num_passed == 3);
    REQUIRE(summary.failures.empty());

    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z1", "z2", "z3"});

    // No failures, so no retry prompt
    REQUIRE(fixture.selector.choose_prompts.empty());
    REQUIRE(fixture.selector.select_prompts.empty());

    REQUIRE(fixture.sinks.entries.size() == 3);
    for (const auto& entry : fixture.sinks.entries) {
        REQUIRE(!entry.terminal_out);
        REQUIRE(entry.sink->close_count == 1);
    }

    REQUIRE(fixture.reporter.events.front() == "begin automatically 3");
    REQUIRE(fixture.reporter.events.back() == "end 3 3 0");
}

TEST_CASE("Automatic marking records failures and the operator declines to retry") {
    ClassFixture fixture;
    fixture.runner.statuses["z2"] = {ExecStatus::Timeout};
    fixture.runner.statuses["z3"] = {ExecStatus::FileNotFound};
    fixture.selector.choices = {'n'};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    MarkingSummary summary = marker.mark_all(fixture.dir.path());

    REQUIRE(summary.num_marked == 3);
    REQUIRE(summary.num_passed == 1);
    REQUIRE(summary.failures.submissions() == std::vector<std::string>{"z2", "z3"});
    REQUIRE(summary.failures.reason("z2") == "Timeout");
    REQUIRE(summary.failures.reason("z3") == "File not found");

    REQUIRE(fixture.selector.choose_prompts == std::vector<std::string>{std::string{BatchMarker::RETRY_PROMPT}});
    REQUIRE(fixture.selector.select_prompts.empty());
    REQUIRE(fixture.runner.runs.size() == 3);

    REQUIRE(fixture.reporter.events.back() == "end 3 1 2");
}

TEST_CASE("Retry removes submissions that now pass") {
    ClassFixture fixture;
    fixture.runner.statuses["z1"] = {ExecStatus::UnexpectedTermination, ExecStatus::Ok};
    fixture.runner.statuses["z3"] = {ExecStatus::Timeout, ExecStatus::Ok};

    // Retry; z1 (index 0 of {z1, z3}); then z3 (index 0 of {z3})
    fixture.selector.choices = {'y'};
    fixture.selector.selections = {0, 0};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    MarkingSummary summary = marker.mark_all(fixture.dir.path());

    REQUIRE(summary.failures.empty());
    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z1", "z2", "z3", "z1", "z3"});

    REQUIRE(fixture.selector.offered.size() == 2);
    REQUIRE(fixture.selector.offered[0] == std::vector<std::string>{"z1", "z3"});
    REQUIRE(fixture.selector.offered[1] == std::vector<std::string>{"z3"});

    // Retries echo to the terminal
    REQUIRE(fixture.sinks.entries.size() == 5);
    REQUIRE(fixture.sinks.entries[3].terminal_out);
    REQUIRE(fixture.sinks.entries[4].terminal_out);

    REQUIRE(fixture.reporter.events.back() == "end 3 1 0");
}

TEST_CASE("A failed retry is kept or removed by the operator") {
    ClassFixture fixture;
    FailureLedger ledger;
    ledger.record("z1", "Timeout");
    ledger.record("z2", "Execution failed");

    fixture.runner.statuses["z1"] = {ExecStatus::UnexpectedTermination};
    fixture.runner.statuses["z2"] = {ExecStatus::Timeout};

    // z1 fails again: continue (kept). z2 fails again: remove.
    fixture.selector.selections = {0, 1};
    fixture.selector.choices = {'c', 'r'};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    marker.retry(fixture.dir.path(), ledger);

    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z1", "z2"});
    REQUIRE(ledger.submissions() == std::vector<std::string>{"z1"});

    // Reason follows the latest run
    REQUIRE(ledger.reason("z1") == "Unexpected termination");

    REQUIRE(fixture.selector.choose_prompts ==
            std::vector<std::string>{std::string{BatchMarker::RETRY_DECISION_PROMPT},
                                     std::string{BatchMarker::RETRY_DECISION_PROMPT}});
}

TEST_CASE("Retry stops when the operator is done") {
    ClassFixture fixture;
    FailureLedger ledger;
    ledger.record("z1", "Timeout");

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    marker.retry(fixture.dir.path(), ledger);

    REQUIRE(fixture.runner.runs.empty());
    REQUIRE(ledger.size() == 1);
}

TEST_CASE("Retry never changes the ledger for submissions that were not picked") {
    ClassFixture fixture;
    FailureLedger ledger;
    ledger.record("z1", "Timeout");
    ledger.record("z2", "Timeout");
    ledger.record("z3", "Timeout");

    fixture.runner.statuses["z2"] = {ExecStatus::Ok};
    fixture.selector.selections = {1};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    marker.retry(fixture.dir.path(), ledger);

    REQUIRE(ledger.submissions() == std::vector<std::string>{"z1", "z3"});
    REQUIRE(ledger.reason("z1") == "Timeout");
    REQUIRE(ledger.reason("z3") == "Timeout");
}

TEST_CASE("Manual marking runs each picked submission with terminal output") {
    ClassFixture fixture;
    fixture.selector.selections = {2, 0, 2};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    marker.mark_manually(fixture.dir.path());

    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z3", "z1", "z3"});
    REQUIRE(fixture.selector.select_prompts.size() == 4);
    REQUIRE(fixture.selector.select_prompts.front() == BatchMarker::SELECT_PROMPT);

    for (const auto& entry : fixture.sinks.entries) {
        REQUIRE(entry.terminal_out);
        REQUIRE(entry.sink->close_count == 1);
    }
}

TEST_CASE("Out of range selections are ignored") {
    ClassFixture fixture;
    fixture.selector.selections = {7, 1};

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    marker.mark_manually(fixture.dir.path());

    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z2"});
}

namespace {

class ThrowingRunner final : public labmarker::SubmissionRunner
{
public:
    ExecStatus run(const std::filesystem::path& /*submission_path*/, OutputSink& /*sink*/) override {
        throw std::runtime_error("launcher exploded");
    }
};

} // namespace

TEST_CASE("A runner error fails only that submission and still closes its sink") {
    ClassFixture fixture;
    ThrowingRunner runner;
    fixture.selector.choices = {'n'};

    BatchMarker marker{runner, fixture.selector, fixture.reporter, fixture.sinks.factory()};
    MarkingSummary summary = marker.mark_all(fixture.dir.path());

    REQUIRE(summary.num_marked == 3);
    REQUIRE(summary.num_passed == 0);
    REQUIRE(summary.failures.size() == 3);
    REQUIRE(summary.failures.reason("z1") == "Execution failed");

    REQUIRE(fixture.sinks.entries.size() == 3);
    for (const auto& entry : fixture.sinks.entries) {
        REQUIRE(entry.sink->close_count == 1);
        REQUIRE(entry.sink->messages.size() == 1);
    }
}

TEST_CASE("A sink that cannot be opened fails only that submission") {
    ClassFixture fixture;
    fixture.selector.choices = {'n'};

    labmarker::SinkFactory inner = fixture.sinks.factory();
    labmarker::SinkFactory factory = [&inner](std::string_view submission,
                                              bool terminal_out) -> std::unique_ptr<OutputSink> {
        if (submission == "z2") {
            throw std::system_error(std::make_error_code(std::errc::permission_denied), "z2.txt");
        }
        return inner(submission, terminal_out);
    };

    BatchMarker marker{fixture.runner, fixture.selector, fixture.reporter, std::move(factory)};
    MarkingSummary summary = marker.mark_all(fixture.dir.path());

    REQUIRE(summary.num_marked == 3);
    REQUIRE(summary.num_passed == 2);
    REQUIRE(summary.failures.submissions() == std::vector<std::string>{"z2"});
    REQUIRE(summary.failures.reason("z2") == "Execution failed");

    // Nothing runs without somewhere to put its output
    REQUIRE(fixture.runner.runs == std::vector<std::string>{"z1", "z3"});
    REQUIRE(fixture.sinks.entries.size() == 2);

    REQUIRE(fixture.reporter.events.back() == "end 3 2 1");
}
