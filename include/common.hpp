//! # Common Definitions
//!
//! This module provides common types and utilities used throughout kmake.
//!
//! ## Overview
//!
//! - **Version Information**: kmake version constants
//! - **Result Type**: Error handling without exceptions
//! - **BuildError**: The error value carried by every fallible stage
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Configuration**: Stages receive configuration by const reference,
//!   never through globals

#ifndef KMAKE_COMMON_HPP
#define KMAKE_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kmake {

// ============================================================================
// Version Information
// ============================================================================

/// The kmake version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Exit Codes
// ============================================================================

/// Exit code for a configuration error (missing parameter, bad manifest).
constexpr int EXIT_CONFIG_ERROR = 2;

/// Exit code for internal failures that are not subprocess failures.
constexpr int EXIT_FAILURE_GENERIC = 1;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<std::string, BuildError> tag = probe_version(runner, cfg);
/// if (is_err(tag)) {
///     return unwrap_err(tag);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Unit success value for operations that return nothing on success.
using Unit = std::monostate;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Build Errors
// ============================================================================

/// Category of a build failure.
enum class ErrorKind {
    Configuration,      ///< Missing parameter, malformed manifest, unknown target
    ToolchainDiscovery, ///< Auto-detect mode could not locate the toolchain
    Subprocess,         ///< An external tool exited non-zero
    Io,                 ///< Filesystem operation failed
    InvalidState        ///< Pipeline stage invoked out of order
};

/// Returns a short name for an error kind (e.g., "configuration").
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::ToolchainDiscovery:
        return "toolchain";
    case ErrorKind::Subprocess:
        return "subprocess";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::InvalidState:
        return "state";
    }
    return "unknown";
}

/// A failure carried out of any pipeline stage.
///
/// `exit_code` is what the process should exit with. For subprocess failures
/// it is the failing tool's own status.
struct BuildError {
    ErrorKind kind = ErrorKind::Configuration;
    std::string message;
    int exit_code = EXIT_FAILURE_GENERIC;

    [[nodiscard]] static auto configuration(std::string msg) -> BuildError {
        return {ErrorKind::Configuration, std::move(msg), EXIT_CONFIG_ERROR};
    }

    [[nodiscard]] static auto discovery(std::string msg) -> BuildError {
        return {ErrorKind::ToolchainDiscovery, std::move(msg), EXIT_FAILURE_GENERIC};
    }

    [[nodiscard]] static auto subprocess(std::string msg, int code) -> BuildError {
        return {ErrorKind::Subprocess, std::move(msg), code > 0 ? code : EXIT_FAILURE_GENERIC};
    }

    [[nodiscard]] static auto io(std::string msg) -> BuildError {
        return {ErrorKind::Io, std::move(msg), EXIT_FAILURE_GENERIC};
    }

    [[nodiscard]] static auto invalid_state(std::string msg) -> BuildError {
        return {ErrorKind::InvalidState, std::move(msg), EXIT_FAILURE_GENERIC};
    }
};

/// Shorthand for the result type used by every pipeline stage.
template <typename T> using BuildResult = Result<T, BuildError>;

// ============================================================================
// String Helpers
// ============================================================================

/// Trims ASCII whitespace from both ends.
inline std::string trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

} // namespace kmake

#endif // KMAKE_COMMON_HPP
