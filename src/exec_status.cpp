#include <labmarker/exec_status.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <string_view>

namespace labmarker {

namespace {

struct StatusEntry
{
    ExecStatus status;
    std::string_view name;
    std::string_view description;
};

constexpr std::array STATUS_TABLE = {
    StatusEntry{ExecStatus::Ok, "Ok", "Success"},
    StatusEntry{ExecStatus::ExecutionFailed, "ExecutionFailed", "Execution failed"},
    StatusEntry{ExecStatus::FileNotFound, "FileNotFound", "File not found"},
    StatusEntry{ExecStatus::UnexpectedTermination, "UnexpectedTermination", "Unexpected termination"},
    StatusEntry{ExecStatus::Timeout, "Timeout", "Timeout"},
};

static_assert(STATUS_TABLE.size() == ALL_EXEC_STATUSES.size());

} // namespace

std::string_view exec_status_description(int code) noexcept {
    auto iter =
        ranges::find_if(STATUS_TABLE, [code](const StatusEntry& entry) { return to_code(entry.status) == code; });

    if (iter == STATUS_TABLE.end()) {
        return "Unknown status";
    }

    return iter->description;
}

std::string_view exec_status_name(ExecStatus status) noexcept {
    auto iter = ranges::find_if(STATUS_TABLE, [status](const StatusEntry& entry) { return entry.status == status; });

    if (iter == STATUS_TABLE.end()) {
        return "<unknown>";
    }

    return iter->name;
}

} // namespace labmarker
