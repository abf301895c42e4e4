#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>

namespace codekata {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,        ///< A worker did not finish before its deadline
    SyscallFailure,  ///< A Linux syscall failed
    MalformedReport, ///< A worker's result report could not be decoded
    OutputLimit,     ///< A worker wrote more output than it was allowed
    UnknownError,    ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::ErrorKind, TimedOut, SyscallFailure, MalformedReport, OutputLimit, UnknownError,
                   MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::codekata::ErrorKind;                                                                          \
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

