#include "output/plaintext_reporter.hpp"

#include "common/terminal_checks.hpp"
#include "marking/failure_ledger.hpp"
#include "user/program_options.hpp"

#include <labmarker/exec_status.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>

namespace labmarker {

PlainTextReporter::PlainTextReporter(std::ostream& out, ProgramOptions::ColorizeOpt colorize_option)
    : out_{&out}
    , do_colorize_{process_colorize_opt(colorize_option)} {}

bool PlainTextReporter::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    switch (colorize_option) {
    case Always:
        return true;
    case Never:
        return false;
    case Auto:
        return is_color_terminal() && in_terminal(stdout);
    }

    return false;
}

std::string PlainTextReporter::style_str(std::string_view str, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{str};
    }

    return fmt::format(style, "{}", str);
}

void PlainTextReporter::on_marking_begin(std::string_view mode, std::size_t num_submissions) {
    fmt::print(*out_, "{}\n",
               style_str(fmt::format("Evaluating labs {} ({} submissions)", mode, num_submissions), SUCCESS_STYLE));
}

void PlainTextReporter::on_submission_begin(std::string_view submission, std::size_t index, std::size_t total) {
    if (total == 0) {
        fmt::print(*out_, "Running code for submission {}....\n", style_str(submission, VALUE_STYLE));
        return;
    }

    fmt::print(*out_, "[{:>{}}/{}] Running code for submission {}....\n", index, fmt::formatted_size("{}", total),
               total, style_str(submission, VALUE_STYLE));
}

void PlainTextReporter::on_submission_result(std::string_view /*submission*/, ExecStatus status) {
    if (is_success(status)) {
        fmt::print(*out_, "{}\n", style_str("Done", SUCCESS_STYLE));
        return;
    }

    fmt::print(*out_, "{}\n", style_str(exec_status_description(status), ERROR_STYLE));
}

void PlainTextReporter::write_ledger_table(const FailureLedger& ledger) {
    fmt::print(*out_, "{:<{}} {}\n", "zID", ID_COLUMN_WIDTH, "Reason");

    for (const auto& [submission, reason] : ledger) {
        // pad before styling, so escape codes don't count towards the width
        std::string padded_id = fmt::format("{:<{}}", submission, ID_COLUMN_WIDTH);
        fmt::print(*out_, "{} {}\n", style_str(padded_id, VALUE_STYLE), style_str(reason, ERROR_STYLE));
    }

    fmt::print(*out_, "\n");
}

void PlainTextReporter::on_failure_summary(const FailureLedger& ledger) {
    if (ledger.empty()) {
        fmt::print(*out_, "\n{}\n", style_str("All submissions executed properly.", SUCCESS_STYLE));
        return;
    }

    fmt::print(*out_, "\n{}\n",
               style_str("The following submissions did not execute properly. Would you like to manually mark them?",
                         WARNING_STYLE));
    write_ledger_table(ledger);
}

void PlainTextReporter::on_retry_list(const FailureLedger& ledger) {
    fmt::print(*out_, "\n{}\n", style_str("Remaining submissions for remarking", WARNING_STYLE));
    write_ledger_table(ledger);
}

void PlainTextReporter::on_retry_removed(std::string_view submission, bool automatically) {
    if (automatically) {
        fmt::print(*out_, "{}\n",
                   style_str(fmt::format("Detected successful execution, removing {} from retry list", submission),
                             SUCCESS_STYLE));
        return;
    }

    fmt::print(*out_, "Removed {} from retry list\n", style_str(submission, VALUE_STYLE));
}

void PlainTextReporter::on_marking_end(std::size_t num_marked, std::size_t num_passed, std::size_t num_outstanding) {
    fmt::print(*out_, "Marked {} submissions: {} passed, {} outstanding\n", num_marked,
               style_str(fmt::format("{}", num_passed), SUCCESS_STYLE),
               style_str(fmt::format("{}", num_outstanding), num_outstanding == 0 ? SUCCESS_STYLE : ERROR_STYLE));
}

} // namespace labmarker
