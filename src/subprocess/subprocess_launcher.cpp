#include "subprocess/subprocess_launcher.hpp"

#include "subprocess/process.hpp"
#include "subprocess/subprocess.hpp"

#include <labmarker/logging.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <tuple>
#include <variant>

namespace labmarker {

std::unique_ptr<Process> SubprocessLauncher::spawn(const std::string& command,
                                                   const std::filesystem::path& working_dir, OutputSink& sink) {
    auto proc = std::make_unique<Subprocess>(command, working_dir, sink);

    // A failed start leaves the handle not-alive, which the caller observes on its first poll
    std::ignore = proc->start();

    return proc;
}

void SubprocessLauncher::run_unchecked(const std::string& command, const std::filesystem::path& working_dir,
                                       OutputSink& sink, std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    Subprocess proc{command, working_dir, sink};

    if (!proc.start()) {
        return;
    }

    const auto deadline = steady_clock::now() + timeout;

    while (!std::holds_alternative<Terminated>(proc.poll(RUN_POLL_INTERVAL))) {
        if (steady_clock::now() >= deadline) {
            LOG_WARN("{:?} did not finish within {}; killing it", command, timeout);
            proc.kill();
            return;
        }
    }

    LOG_DEBUG("{:?} finished with exit code {}", command, proc.get_exit_code().value_or(-1));
}

} // namespace labmarker
