/// \file
/// Outcome taxonomy for a single submission's classification
#pragma once

#include <fmt/format.h>

#include <array>
#include <string_view>

namespace labmarker {

/// Result of classifying one submission. Every value carries a fixed integer code; 0 is success.
enum class ExecStatus {
    Ok = 0,                     ///< Ran past the grace period and exited on its own
    ExecutionFailed = -1,       ///< Not alive at the very first liveness check
    FileNotFound = -2,          ///< No candidate source file located
    UnexpectedTermination = -3, ///< Exited after the first check, but before the grace period
    Timeout = -4,               ///< Still alive at the polling ceiling; force-killed
};

/// All statuses, in code order (0, -1, -2, ...)
inline constexpr std::array ALL_EXEC_STATUSES = {ExecStatus::Ok, ExecStatus::ExecutionFailed, ExecStatus::FileNotFound,
                                                 ExecStatus::UnexpectedTermination, ExecStatus::Timeout};

constexpr int to_code(ExecStatus status) noexcept {
    return static_cast<int>(status);
}

constexpr bool is_success(ExecStatus status) noexcept {
    return status == ExecStatus::Ok;
}

/// Human readable description of a status code. Unknown codes yield "Unknown status".
std::string_view exec_status_description(int code) noexcept;

inline std::string_view exec_status_description(ExecStatus status) noexcept {
    return exec_status_description(to_code(status));
}

/// Enumerator name, e.g. "UnexpectedTermination"
std::string_view exec_status_name(ExecStatus status) noexcept;

} // namespace labmarker

/// Formats as the enumerator name; the `d` presentation type formats the description instead.
///   fmt::format("{}", ExecStatus::Timeout)   => "Timeout"
///   fmt::format("{:d}", ExecStatus::Timeout) => "Timeout (code -4)"
template <>
struct fmt::formatter<::labmarker::ExecStatus>
{
    bool describe = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto iter = ctx.begin();
        if (iter != ctx.end() && *iter == 'd') {
            describe = true;
            ++iter;
        }
        if (iter != ctx.end() && *iter != '}') {
            throw fmt::format_error("invalid format specifier for ExecStatus");
        }
        return iter;
    }

    template <typename FormatContext>
    auto format(::labmarker::ExecStatus from, FormatContext& ctx) const {
        if (describe) {
            return fmt::format_to(ctx.out(), "{} (code {})", ::labmarker::exec_status_description(from),
                                  ::labmarker::to_code(from));
        }
        return fmt::format_to(ctx.out(), "{}", ::labmarker::exec_status_name(from));
    }
};
