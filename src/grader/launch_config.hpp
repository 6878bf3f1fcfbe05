#pragma once

#include <labmarker/submission.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace labmarker {

/// How each language is built and launched against the reference server
struct LaunchConfig
{
    static constexpr std::string_view DEFAULT_HOST = "localhost";
    static constexpr std::uint16_t DEFAULT_PORT = 12000;
    static constexpr std::string_view DEFAULT_TARGET_NAME = "PingClient";

    std::string host = std::string{DEFAULT_HOST};
    std::uint16_t port = DEFAULT_PORT;

    /// Base name (no extension) of the client source file, also the Java class name
    std::string target_name = std::string{DEFAULT_TARGET_NAME};

    std::string python = "python3";
    std::string java = "java";
    std::string javac = "javac";

    /// Shell command that runs the client, or std::nullopt if `lang` cannot be run automatically
    std::optional<std::string> run_command(Language lang) const;

    /// Shell command to run before `run_command`, if `lang` needs a separate build step
    std::optional<std::string> build_command(Language lang) const;
};

} // namespace labmarker
