#pragma once

#include <labmarker/submission.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace labmarker {

/// Finds a submission's candidate source file (`<base_name>.py`, `.java` or `.c`) somewhere below a root directory
class SubmissionLocator
{
public:
    static constexpr auto DEFAULT_SEARCH_DEPTH = 10;

    explicit SubmissionLocator(int max_depth = DEFAULT_SEARCH_DEPTH);

    /// Files directly inside a directory are checked before any of its subdirectories; subdirectories
    /// are searched depth-first in name order. The first match wins.
    /// If one directory holds several candidates, Python is preferred over Java, and Java over C.
    std::optional<SubmissionRecord> locate(const std::filesystem::path& search_root, std::string_view base_name) const;

private:
    std::optional<SubmissionRecord> locate_impl(const std::filesystem::path& dir, std::string_view base_name,
                                                int depth) const;

    int max_depth_;
};

} // namespace labmarker
