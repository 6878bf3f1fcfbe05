#pragma once

#include <labmarker/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace labmarker {

enum class ErrorKind {
    SyscallFailure, ///< A Linux syscall failed
    SpawnFailure,   ///< A child process could not be started
    UnknownError,   ///< As named; use this as little as possible
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::SpawnFailure:
        return "SpawnFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    }
    return "<unknown>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace labmarker

template <>
struct fmt::formatter<::labmarker::ErrorKind> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(::labmarker::ErrorKind from, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(::labmarker::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::labmarker::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
