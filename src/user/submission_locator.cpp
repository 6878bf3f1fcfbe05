#include "user/submission_locator.hpp"

#include <labmarker/logging.hpp>
#include <labmarker/submission.hpp>

#include <range/v3/algorithm/min_element.hpp>
#include <range/v3/algorithm/sort.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace labmarker {

namespace {

/// Lower is preferred
constexpr int language_priority(Language lang) {
    switch (lang) {
    case Language::Python:
        return 0;
    case Language::Java:
        return 1;
    case Language::C:
        return 2;
    }
    return 3;
}

} // namespace

SubmissionLocator::SubmissionLocator(int max_depth)
    : max_depth_{max_depth} {}

std::optional<SubmissionRecord> SubmissionLocator::locate(const std::filesystem::path& search_root,
                                                          std::string_view base_name) const {
    LOG_DEBUG("Searching for {}.{{py,java,c}} in {:?}", base_name, search_root.string());

    auto res = locate_impl(search_root, base_name, 0);

    if (res) {
        LOG_DEBUG("Found {}", *res);
    } else {
        LOG_DEBUG("No {} source file found in {:?}", base_name, search_root.string());
    }

    return res;
}

std::optional<SubmissionRecord> SubmissionLocator::locate_impl(const std::filesystem::path& dir,
                                                               std::string_view base_name, int depth) const {
    namespace fs = std::filesystem;

    std::error_code err;
    std::vector<fs::path> entries;

    for (fs::directory_iterator iter{dir, err}; !err && iter != fs::directory_iterator{}; iter.increment(err)) {
        entries.push_back(iter->path());
    }

    if (err) {
        LOG_WARN("Could not list {:?}: {}", dir.string(), err.message());
        // Whatever was listed before the error is still searched
    }

    ranges::sort(entries);

    std::vector<SubmissionRecord> candidates;
    std::vector<fs::path> subdirectories;

    for (const fs::path& entry : entries) {
        std::error_code entry_err;
        const bool is_dir = fs::is_directory(entry, entry_err);

        if (!is_dir && entry.stem().string() == base_name) {
            std::string ext = entry.extension().string();

            if (auto lang = language_from_extension(ext)) {
                candidates.push_back({.folder_path = dir, .extension = std::move(ext), .language = *lang});
            }
            continue;
        }

        if (is_dir) {
            subdirectories.push_back(entry);
        }
    }

    if (!candidates.empty()) {
        return *ranges::min_element(candidates, {}, [](const SubmissionRecord& rec) {
            return language_priority(rec.language);
        });
    }

    if (depth >= max_depth_) {
        return std::nullopt;
    }

    for (const fs::path& subdir : subdirectories) {
        if (auto res = locate_impl(subdir, base_name, depth + 1)) {
            return res;
        }
    }

    return std::nullopt;
}

} // namespace labmarker
