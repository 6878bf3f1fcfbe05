#include "fakes.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace labmarker::test {

TempDir::TempDir(std::string_view name)
    : path_{std::filesystem::temp_directory_path() / fmt::format("labmarker-{}-{}", name, ::getpid())} {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code err;
    std::filesystem::remove_all(path_, err);
}

std::filesystem::path TempDir::write_file(const std::filesystem::path& relative, std::string_view contents) const {
    std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());

    std::ofstream file{full, std::ios::out | std::ios::trunc};
    file << contents;

    return full;
}

std::filesystem::path TempDir::make_dir(const std::filesystem::path& relative) const {
    std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full);
    return full;
}

} // namespace labmarker::test
