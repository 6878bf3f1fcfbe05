#pragma once

#include "output/sink.hpp"

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string_view>

namespace labmarker {

/// Writes to a per-submission log file, optionally echoing to a terminal stream as well
class StreamSink : public OutputSink
{
public:
    /// Throws std::system_error if `file_path` cannot be opened for writing
    StreamSink(const std::filesystem::path& file_path, bool terminal_out);

    /// For testing; echo goes to `terminal` instead of stdout
    StreamSink(const std::filesystem::path& file_path, bool terminal_out, std::ostream& terminal);

    ~StreamSink() override;

    void write_line(std::string_view line) override;
    void write_message(std::string_view msg, bool echo) override;
    using OutputSink::write_message;

    void close() override;

    bool is_closed() const;

private:
    void write_impl(std::string_view text, bool to_terminal);

    std::filesystem::path file_path_;
    std::ofstream file_;
    bool terminal_out_;
    std::ostream* terminal_;
    bool closed_ = false;

    mutable std::mutex mutex_;
};

} // namespace labmarker
