#pragma once

#include "marking/failure_ledger.hpp"
#include "output/reporter.hpp"
#include "user/program_options.hpp"

#include <labmarker/exec_status.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace labmarker {

class PlainTextReporter : public Reporter
{
public:
    PlainTextReporter(std::ostream& out, ProgramOptions::ColorizeOpt colorize_option);

    void on_marking_begin(std::string_view mode, std::size_t num_submissions) override;
    void on_submission_begin(std::string_view submission, std::size_t index, std::size_t total) override;
    void on_submission_result(std::string_view submission, ExecStatus status) override;
    void on_failure_summary(const FailureLedger& ledger) override;
    void on_retry_list(const FailureLedger& ledger) override;
    void on_retry_removed(std::string_view submission, bool automatically) override;
    void on_marking_end(std::size_t num_marked, std::size_t num_passed, std::size_t num_outstanding) override;

    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);

private:
    void write_ledger_table(const FailureLedger& ledger);

    std::string style_str(std::string_view str, fmt::text_style style) const;

    // Basic styles for different kinds of output:
    //   error    - failure descriptions
    //   warning  - section headers about failures
    //   success  - "Done" messages
    //   value    - submission identifiers
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::steel_blue);

    static constexpr std::size_t ID_COLUMN_WIDTH = 16;

    std::ostream* out_;
    bool do_colorize_;
};

} // namespace labmarker
