#pragma once

#include "marking/failure_ledger.hpp"

#include <labmarker/common/class_traits.hpp>
#include <labmarker/exec_status.hpp>

#include <cstddef>
#include <string_view>

namespace labmarker {

/// Operator-facing progress and result output of the marking modes
class Reporter : NonCopyable
{
public:
    virtual ~Reporter() = default;

    virtual void on_marking_begin(std::string_view mode, std::size_t num_submissions) = 0;

    /// `total == 0` when the submission was picked interactively
    virtual void on_submission_begin(std::string_view submission, std::size_t index, std::size_t total) = 0;
    virtual void on_submission_result(std::string_view submission, ExecStatus status) = 0;

    /// Failures left after an automatic pass
    virtual void on_failure_summary(const FailureLedger& ledger) = 0;

    /// Failures still awaiting a retry
    virtual void on_retry_list(const FailureLedger& ledger) = 0;
    virtual void on_retry_removed(std::string_view submission, bool automatically) = 0;

    virtual void on_marking_end(std::size_t num_marked, std::size_t num_passed, std::size_t num_outstanding) = 0;
};

} // namespace labmarker
