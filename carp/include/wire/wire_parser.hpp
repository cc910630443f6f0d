//! # Wire Parser
//!
//! Recursive descent parser turning a response body into a `WireValue`.
//!
//! - Depth limited to `MAX_DEPTH` nested containers
//! - Numbers without decimal point or exponent keep integer precision
//! - `\uXXXX` escapes, including surrogate pairs, are decoded to UTF-8
//! - Trailing content after the top-level value is an error

#pragma once

#include "common.hpp"
#include "wire/wire_error.hpp"
#include "wire/wire_value.hpp"

#include <string_view>

namespace carp::wire {

/// Parses one complete document.
///
/// # Example
///
/// ```cpp
/// WireParser parser(R"({"rsp-type":"ok","rsp":{}})");
/// auto result = parser.parse();
/// if (is_ok(result)) {
///     auto& body = unwrap(result);
/// }
/// ```
class WireParser {
public:
    explicit WireParser(std::string_view input);

    [[nodiscard]] auto parse() -> Result<WireValue, WireError>;

    static constexpr size_t MAX_DEPTH = 1000;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto error(const std::string& msg) const -> WireError;

    auto parse_value() -> Result<WireValue, WireError>;
    auto parse_object() -> Result<WireValue, WireError>;
    auto parse_array() -> Result<WireValue, WireError>;
    auto parse_string() -> Result<std::string, WireError>;
    auto parse_number() -> Result<WireValue, WireError>;
    auto parse_keyword() -> Result<WireValue, WireError>;
    auto parse_hex4() -> Result<uint32_t, WireError>;
};

/// Convenience wrapper around `WireParser`.
[[nodiscard]] auto parse_wire(std::string_view input) -> Result<WireValue, WireError>;

} // namespace carp::wire
