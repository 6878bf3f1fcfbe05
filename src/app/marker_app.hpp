#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "marking/batch_marker.hpp"

#include <filesystem>
#include <string_view>

namespace labmarker {

/// Marks one class of submissions in the mode chosen on the command line
class MarkerApp final : public App
{
public:
    using App::App;

    /// Name of the output file of `submission` inside the output directory
    static std::filesystem::path output_file_for(const std::filesystem::path& output_dir, std::string_view submission);

private:
    int run_impl() override;

    SinkFactory make_sink_factory() const;
};

} // namespace labmarker
