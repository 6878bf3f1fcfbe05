#include "output/stream_sink.hpp"

#include <labmarker/logging.hpp>

#include <cerrno>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string_view>
#include <system_error>

namespace labmarker {

StreamSink::StreamSink(const std::filesystem::path& file_path, bool terminal_out)
    : StreamSink{file_path, terminal_out, std::cout} {}

StreamSink::StreamSink(const std::filesystem::path& file_path, bool terminal_out, std::ostream& terminal)
    : file_path_{file_path}
    , file_{file_path, std::ios::out | std::ios::trunc}
    , terminal_out_{terminal_out}
    , terminal_{&terminal} {
    if (!file_.is_open()) {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("Failed to open output file {:?}", file_path.string()));
    }

    LOG_DEBUG("Opened output file {:?} (terminal echo: {})", file_path_.string(), terminal_out_);
}

StreamSink::~StreamSink() {
    close();
}

void StreamSink::write_line(std::string_view line) {
    write_impl(line, terminal_out_);
}

void StreamSink::write_message(std::string_view msg, bool echo) {
    write_impl(msg, terminal_out_ && echo);
}

void StreamSink::write_impl(std::string_view text, bool to_terminal) {
    std::scoped_lock lock{mutex_};

    if (closed_) {
        LOG_WARN("Discarding write to closed output file {:?}: {:?}", file_path_.string(), text);
        return;
    }

    file_ << text << '\n';

    if (to_terminal) {
        *terminal_ << text << '\n';
    }
}

void StreamSink::close() {
    std::scoped_lock lock{mutex_};

    if (closed_) {
        return;
    }

    closed_ = true;
    file_.flush();
    file_.close();
    terminal_->flush();

    LOG_DEBUG("Closed output file {:?}", file_path_.string());
}

bool StreamSink::is_closed() const {
    std::scoped_lock lock{mutex_};
    return closed_;
}

} // namespace labmarker
