#include "grader/launch_config.hpp"

#include <labmarker/submission.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>

namespace labmarker {

std::optional<std::string> LaunchConfig::run_command(Language lang) const {
    switch (lang) {
    case Language::Python:
        return fmt::format("{} {}.py {} {}", python, target_name, host, port);
    case Language::Java:
        return fmt::format("{} {} {} {}", java, target_name, host, port);
    case Language::C:
        // No build/run integration for C
        return std::nullopt;
    }

    return std::nullopt;
}

std::optional<std::string> LaunchConfig::build_command(Language lang) const {
    if (lang == Language::Java) {
        return fmt::format("{} {}.java", javac, target_name);
    }

    return std::nullopt;
}

} // namespace labmarker
