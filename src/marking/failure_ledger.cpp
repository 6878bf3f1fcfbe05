#include "marking/failure_ledger.hpp"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace labmarker {

void FailureLedger::record(std::string submission, std::string reason) {
    entries_.insert_or_assign(std::move(submission), std::move(reason));
}

bool FailureLedger::remove(std::string_view submission) {
    auto iter = entries_.find(submission);

    if (iter == entries_.end()) {
        return false;
    }

    entries_.erase(iter);
    return true;
}

bool FailureLedger::contains(std::string_view submission) const {
    return entries_.find(submission) != entries_.end();
}

std::optional<std::string_view> FailureLedger::reason(std::string_view submission) const {
    auto iter = entries_.find(submission);

    if (iter == entries_.end()) {
        return std::nullopt;
    }

    return iter->second;
}

std::vector<std::string> FailureLedger::submissions() const {
    return entries_ | ranges::views::keys | ranges::to<std::vector<std::string>>();
}

} // namespace labmarker
