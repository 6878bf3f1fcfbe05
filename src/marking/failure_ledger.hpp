#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labmarker {

/// Submissions whose most recent classification failed, each with the reason.
/// Ordered by submission name.
class FailureLedger
{
public:
    using Container = std::map<std::string, std::string, std::less<>>;

    /// Inserts `submission`, or replaces its reason if already present
    void record(std::string submission, std::string reason);

    /// Returns whether `submission` was present
    bool remove(std::string_view submission);

    bool contains(std::string_view submission) const;

    std::optional<std::string_view> reason(std::string_view submission) const;

    std::vector<std::string> submissions() const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    Container::const_iterator begin() const noexcept { return entries_.begin(); }
    Container::const_iterator end() const noexcept { return entries_.end(); }

private:
    Container entries_;
};

} // namespace labmarker
