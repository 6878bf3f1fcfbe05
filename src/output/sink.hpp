#pragma once

#include <labmarker/common/class_traits.hpp>

#include <string_view>

namespace labmarker {

/// Destination for everything observed while classifying one submission.
///
/// Implementations must not interleave a captured line and a synthetic message mid-line.
class OutputSink : NonCopyable
{
public:
    virtual ~OutputSink() = default;

    /// A line of output captured from the child process, without its trailing newline
    virtual void write_line(std::string_view line) = 0;

    /// A synthetic status message (not produced by the child).
    /// `echo = false` keeps the message out of the terminal, even for sinks that echo.
    virtual void write_message(std::string_view msg, bool echo) = 0;

    void write_message(std::string_view msg) { write_message(msg, /*echo=*/true); }

    /// Flush and release the destination. Safe to call more than once.
    virtual void close() = 0;
};

} // namespace labmarker
