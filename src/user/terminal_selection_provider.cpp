#include "user/terminal_selection_provider.hpp"

#include <labmarker/logging.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <charconv>
#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace labmarker {

namespace {

constexpr auto OPTION_STYLE = fmt::fg(fmt::color::steel_blue);
constexpr auto PROMPT_STYLE = fmt::fg(fmt::color::lime_green);
constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;

constexpr std::string_view QUIT_ANSWER = "q";

} // namespace

TerminalSelectionProvider::TerminalSelectionProvider(std::istream& input, std::ostream& output, bool colorize)
    : input_{&input}
    , output_{&output}
    , colorize_{colorize} {}

std::optional<std::string> TerminalSelectionProvider::read_answer() {
    std::string line;

    if (!std::getline(*input_, line)) {
        LOG_DEBUG("End of input while waiting for a selection");
        return std::nullopt;
    }

    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line));
}

std::optional<std::size_t> TerminalSelectionProvider::select(std::string_view prompt,
                                                             const std::vector<std::string>& options) {
    auto styled = [this](std::string_view str, fmt::text_style style) {
        return colorize_ ? fmt::format(style, "{}", str) : std::string{str};
    };

    if (options.empty()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < options.size(); ++i) {
        fmt::print(*output_, "[{:>3}] {}\n", i, styled(options[i], OPTION_STYLE));
    }

    while (true) {
        std::string full_prompt = fmt::format("{} [0-{}, q to quit]:", prompt, options.size() - 1);
        fmt::print(*output_, "{} ", styled(full_prompt, PROMPT_STYLE));
        output_->flush();

        std::optional answer = read_answer();

        if (!answer || *answer == QUIT_ANSWER) {
            return std::nullopt;
        }

        std::size_t index = 0;
        const char* last = answer->data() + answer->size();
        auto [ptr, err] = std::from_chars(answer->data(), last, index);

        if (err == std::errc{} && ptr == last && index < options.size()) {
            return index;
        }

        fmt::print(*output_, "{}\n", styled(fmt::format("Invalid selection {:?}", *answer), ERROR_STYLE));
    }
}

std::optional<char> TerminalSelectionProvider::choose(std::string_view prompt, std::string_view choices) {
    while (true) {
        fmt::print(*output_, "{} ", prompt);
        output_->flush();

        std::optional answer = read_answer();

        if (!answer) {
            return std::nullopt;
        }

        if (answer->size() == 1 && choices.find(answer->front()) != std::string_view::npos) {
            return answer->front();
        }

        fmt::print(*output_, "Please answer one of: {}\n", fmt::join(choices, "/"));
    }
}

} // namespace labmarker
