#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labmarker {

/// Source of operator decisions for the interactive marking modes
class SelectionProvider
{
public:
    virtual ~SelectionProvider() = default;

    /// Pick one of `options`. std::nullopt means the operator is done (e.g., end of input).
    virtual std::optional<std::size_t> select(std::string_view prompt, const std::vector<std::string>& options) = 0;

    /// Pick one of the characters in `choices` (lowercase). std::nullopt means the operator is done.
    virtual std::optional<char> choose(std::string_view prompt, std::string_view choices) = 0;
};

} // namespace labmarker
