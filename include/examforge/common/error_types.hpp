#pragma once

#include <examforge/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace examforge {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Process / operation surpassed its maximum timeout
    SyscallFailure, ///< A Linux syscall failed
    SpawnFailure,   ///< A child process could not be created or could not exec its program
    UnknownError,   ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view to_string(ErrorKind error) {
    switch (error) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::SpawnFailure:
        return "SpawnFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    default:
        return "<unknown>";
    }
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace examforge

template <>
struct fmt::formatter<::examforge::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::examforge::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::examforge::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::examforge::ErrorKind;                                                                         \
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
