#pragma once

#include "subprocess/process.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace labmarker {

/// Launches real child processes through `Subprocess`
class SubprocessLauncher final : public ProcessLauncher
{
public:
    std::unique_ptr<Process> spawn(const std::string& command, const std::filesystem::path& working_dir,
                                   OutputSink& sink) override;

    void run_unchecked(const std::string& command, const std::filesystem::path& working_dir, OutputSink& sink,
                       std::chrono::milliseconds timeout) override;

private:
    static constexpr auto RUN_POLL_INTERVAL = std::chrono::milliseconds{100};
};

} // namespace labmarker
