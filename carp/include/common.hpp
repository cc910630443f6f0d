//! # Common Definitions
//!
//! This module provides the types, utilities and runtime-wide settings shared
//! by every part of the CARP client runtime.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Runtime version constants
//! - **Runtime Options**: Global settings consulted by the wire layer
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions for runtime failures**: remote and resolution failures
//!   are returned via `Result<T, E>`
//! - **Wiring defects throw**: a malformed binding or contract misuse throws
//!   `std::runtime_error` and is never caught by the runtime
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef CARP_COMMON_HPP
#define CARP_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace carp {

// ============================================================================
// Version Information
// ============================================================================

/// The runtime version string.
constexpr const char* VERSION = "0.4.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Runtime Options
// ============================================================================

/// Global runtime settings.
///
/// These are read when messages are built and when certificates are
/// fingerprinted. They are process-wide and expected to be set once during
/// start-up.
///
/// # Example
///
/// ```cpp
/// RuntimeOptions::fingerprint_algorithm = "SHA-512";
/// ```
struct RuntimeOptions {
    /// Digest used by `Fingerprint::of_certificate` when none is given.
    static inline std::string fingerprint_algorithm = "SHA-256";

    /// Media type of request and response bodies.
    static inline std::string content_type = "application/json";

    /// Log each outgoing request and incoming response body at Trace level.
    static inline bool trace_bodies = false;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<int, std::string> parse_port(std::string_view s);
///
/// auto result = parse_port("8080");
/// if (is_ok(result)) {
///     int value = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

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
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace carp

#endif // CARP_COMMON_HPP
