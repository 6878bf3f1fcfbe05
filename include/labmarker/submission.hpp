/// \file
/// Data describing one located submission
#pragma once

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace labmarker {

/// Languages a submission can be written in. Closed set, keyed by source file extension.
enum class Language { Python, Java, C };

constexpr std::string_view to_string(Language lang) {
    switch (lang) {
    case Language::Python:
        return "Python";
    case Language::Java:
        return "Java";
    case Language::C:
        return "C";
    }
    return "<unknown>";
}

/// ".py" -> Python, ".java" -> Java, ".c" -> C
constexpr std::optional<Language> language_from_extension(std::string_view ext) {
    if (ext == ".py") {
        return Language::Python;
    }
    if (ext == ".java") {
        return Language::Java;
    }
    if (ext == ".c") {
        return Language::C;
    }
    return std::nullopt;
}

/// Where a submission's candidate source file lives. Immutable once located.
struct SubmissionRecord
{
    std::filesystem::path folder_path;
    std::string extension;
    Language language;

    bool operator==(const SubmissionRecord&) const = default;
};

} // namespace labmarker

template <>
struct fmt::formatter<::labmarker::Language> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(::labmarker::Language from, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(::labmarker::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::labmarker::SubmissionRecord> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const ::labmarker::SubmissionRecord& from, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "SubmissionRecord{{folder_path={:?}, extension={:?}, language={}}}",
                              from.folder_path.string(), from.extension, from.language);
    }
};
