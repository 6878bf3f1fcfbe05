#pragma once

#include "user/selection_provider.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labmarker {

/// Prompts on a terminal-like stream pair. Invalid answers are re-prompted; end of input or `q` stops.
class TerminalSelectionProvider final : public SelectionProvider
{
public:
    TerminalSelectionProvider(std::istream& input, std::ostream& output, bool colorize);

    std::optional<std::size_t> select(std::string_view prompt, const std::vector<std::string>& options) override;
    std::optional<char> choose(std::string_view prompt, std::string_view choices) override;

private:
    std::optional<std::string> read_answer();

    std::istream* input_;
    std::ostream* output_;
    bool colorize_;
};

} // namespace labmarker
