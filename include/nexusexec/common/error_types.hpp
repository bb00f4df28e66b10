#pragma once

#include <nexusexec/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <utility>

namespace nexusexec {

// NOLINTNEXTLINE
enum class ErrorKind {
    UnsupportedLanguage,    ///< Request names a language that is not in the registry
    InvalidRequest,         ///< Malformed request (bad file name, missing main file, bad limit override)
    CompileError,           ///< The compile step of a compiled language failed
    DependencyInstallError, ///< Manifest generation or package installation failed
    RuntimeError,           ///< User program failed at runtime
    Timeout,                ///< Program / operation surpassed its wall-clock timeout
    ResourceLimit,          ///< Memory, process count or output ceiling was hit
    Cancelled,              ///< Session was cancelled by the caller, a disconnect or the idle reaper
    SessionNotFound,        ///< No live session with the given identifier
    DuplicateSession,       ///< A live session already uses the given identifier
    InternalSandboxError,   ///< Infrastructure failure; details are logged, never shown to the user
    SyscallFailure,         ///< A Linux syscall failed

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view format_as(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedLanguage:
        return "UnsupportedLanguage";
    case ErrorKind::InvalidRequest:
        return "InvalidRequest";
    case ErrorKind::CompileError:
        return "CompileError";
    case ErrorKind::DependencyInstallError:
        return "DependencyInstallError";
    case ErrorKind::RuntimeError:
        return "RuntimeError";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::ResourceLimit:
        return "ResourceLimit";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::SessionNotFound:
        return "SessionNotFound";
    case ErrorKind::DuplicateSession:
        return "DuplicateSession";
    case ErrorKind::InternalSandboxError:
        return "InternalSandboxError";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::MaxErrorNum:
        break;
    }
    return "<unknown error>";
}

/// Error value carried by every engine operation that can fail.
///
/// ``message`` is safe to show to the submitter. ``detail`` holds supplementary
/// diagnostics (compiler output, package manager log) that callers may surface.
struct Error
{
    Error(ErrorKind error_kind) // NOLINT(*-explicit-*)
        : kind{error_kind}
        , message{format_as(error_kind)} {}

    Error(ErrorKind error_kind, std::string msg, std::string extra_detail = {})
        : kind{error_kind}
        , message{std::move(msg)}
        , detail{std::move(extra_detail)} {}

    ErrorKind kind;
    std::string message;
    std::string detail;
};

inline std::string format_as(const Error& err) {
    if (err.message.empty() || err.message == format_as(err.kind)) {
        return std::string{format_as(err.kind)};
    }
    return fmt::format("{}: {}", format_as(err.kind), err.message);
}

template <typename T>
using Result = Expected<T, Error>;

} // namespace nexusexec

/// If the supplied argument is an error (unexpected) type, then propagate the error `e` up
/// the call stack. Otherwise, continue execution as normal, yielding the contained value.
///
/// `e` may name an ErrorKind enumerator directly (e.g. ``TRYE(res, SyscallFailure)``).
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::nexusexec::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
