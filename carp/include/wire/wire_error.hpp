//! # Wire Parse Errors
//!
//! Error type produced when a message body is not well-formed JSON. Carries
//! the source location so protocol diagnostics can point at the offending
//! byte.

#pragma once

#include <cstddef>
#include <string>

namespace carp::wire {

/// An error encountered while parsing a wire body.
///
/// `line` and `column` are 1-based; zero means unknown.
struct WireError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg) -> WireError {
        return WireError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> WireError {
        return WireError{std::move(msg), line, column, offset};
    }

    /// Formats as `"line X, column Y: message"` when the location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace carp::wire
