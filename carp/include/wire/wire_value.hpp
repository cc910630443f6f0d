//! # Wire Values
//!
//! The JSON-like tree exchanged with remote peers. Request and response
//! envelopes, encoded arguments and fingerprint tables are all `WireValue`s.
//!
//! ## Number Handling
//!
//! | Input | Storage | Reason |
//! |-------|---------|--------|
//! | `42` | `Int64` | No decimal point |
//! | `18446744073709551615` | `Uint64` | Too large for int64 |
//! | `3.14` | `Double` | Has decimal point |
//! | `1e10` | `Double` | Has exponent |
//!
//! Integer precision matters here: fingerprint bytes and ports must survive
//! a round trip exactly.
//!
//! ## Example
//!
//! ```cpp
//! WireValue req(WireObject{});
//! req.set("req-type", WireValue("say"));
//! req.set("prints", WireValue(WireArray{}));
//! auto text = req.to_string(); // {"prints":[],"req-type":"say"}
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace carp::wire {

struct WireValue;

/// Ordered sequence of values.
using WireArray = std::vector<WireValue>;

/// Key-value pairs, ordered by key.
using WireObject = std::map<std::string, WireValue>;

// ============================================================================
// WireNumber
// ============================================================================

/// A number stored in its most precise representation.
struct WireNumber {
    enum class Kind : uint8_t { Int64, Uint64, Double };

    Kind kind;

    union {
        int64_t i64;
        uint64_t u64;
        double f64;
    };

    explicit WireNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit WireNumber(uint64_t value) : kind(Kind::Uint64), u64(value) {}
    explicit WireNumber(double value) : kind(Kind::Double), f64(value) {}
    WireNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind != Kind::Double;
    }

    [[nodiscard]] auto is_float() const -> bool {
        return kind == Kind::Double;
    }

    /// The value as `int64_t` if the conversion is lossless.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        switch (kind) {
        case Kind::Int64:
            return i64;
        case Kind::Uint64:
            if (u64 <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u64);
            }
            return std::nullopt;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// The value as `uint64_t` if the conversion is lossless.
    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        switch (kind) {
        case Kind::Int64:
            if (i64 >= 0) {
                return static_cast<uint64_t>(i64);
            }
            return std::nullopt;
        case Kind::Uint64:
            return u64;
        case Kind::Double:
            return std::nullopt;
        }
        return std::nullopt;
    }

    /// Always succeeds; integers above 2^53 may lose precision.
    [[nodiscard]] auto as_f64() const -> double {
        switch (kind) {
        case Kind::Int64:
            return static_cast<double>(i64);
        case Kind::Uint64:
            return static_cast<double>(u64);
        case Kind::Double:
            return f64;
        }
        return 0.0;
    }

    /// Numbers of different kinds compare as doubles.
    [[nodiscard]] auto operator==(const WireNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        switch (kind) {
        case Kind::Int64:
            return i64 == other.i64;
        case Kind::Uint64:
            return u64 == other.u64;
        case Kind::Double:
            return f64 == other.f64;
        }
        return false;
    }
};

// ============================================================================
// WireValue
// ============================================================================

/// Any wire value: null, boolean, number, string, array or object.
///
/// Arrays and objects are boxed, which makes `WireValue` move-only; use
/// `clone()` for an explicit deep copy.
struct WireValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, WireNumber, std::string, Box<WireArray>, Box<WireObject>>;

    ValueVariant data;

    WireValue() : data(Null{}) {}
    explicit WireValue(std::nullptr_t) : data(Null{}) {}
    explicit WireValue(bool value) : data(value) {}
    explicit WireValue(int value) : data(WireNumber(static_cast<int64_t>(value))) {}
    explicit WireValue(int64_t value) : data(WireNumber(value)) {}
    explicit WireValue(uint64_t value) : data(WireNumber(value)) {}
    explicit WireValue(double value) : data(WireNumber(value)) {}
    explicit WireValue(const char* value) : data(std::string(value)) {}
    explicit WireValue(std::string value) : data(std::move(value)) {}
    explicit WireValue(std::string_view value) : data(std::string(value)) {}
    explicit WireValue(WireArray value) : data(make_box<WireArray>(std::move(value))) {}
    explicit WireValue(WireObject value) : data(make_box<WireObject>(std::move(value))) {}
    explicit WireValue(WireNumber value) : data(value) {}

    WireValue(WireValue&&) noexcept = default;
    auto operator=(WireValue&&) noexcept -> WireValue& = default;
    WireValue(const WireValue&) = delete;
    auto operator=(const WireValue&) -> WireValue& = delete;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<WireNumber>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<WireArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<WireObject>>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        auto* num = std::get_if<WireNumber>(&data);
        return num != nullptr && num->is_integer();
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    /// # Panics
    ///
    /// The `as_*` accessors throw `std::bad_variant_access` on a type mismatch.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const WireNumber& {
        return std::get<WireNumber>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const WireArray& {
        return *std::get<Box<WireArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const WireObject& {
        return *std::get<Box<WireObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> WireArray& {
        return *std::get<Box<WireArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> WireObject& {
        return *std::get<Box<WireObject>>(data);
    }

    /// Returns `std::nullopt` unless this is an integer that fits.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<WireNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    [[nodiscard]] auto try_as_u64() const -> std::optional<uint64_t> {
        if (auto* num = std::get_if<WireNumber>(&data)) {
            return num->try_as_u64();
        }
        return std::nullopt;
    }

    /// Throws `std::runtime_error` if this is not an integer in range.
    [[nodiscard]] auto as_i64() const -> int64_t {
        auto opt = as_number().try_as_i64();
        if (!opt) {
            throw std::runtime_error("wire number cannot be converted to int64_t");
        }
        return *opt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    // ========================================================================
    // Object and Array Access
    // ========================================================================

    /// Member lookup. `nullptr` if this is not an object or lacks `key`.
    [[nodiscard]] auto get(const std::string& key) const -> const WireValue*;

    [[nodiscard]] auto get_mut(const std::string& key) -> WireValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Inserts or replaces a member.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    void set(const std::string& key, WireValue value);

    /// Appends to an array.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    void push(WireValue value);

    /// Element count for arrays and objects, zero otherwise.
    [[nodiscard]] auto size() const -> size_t;

    /// Deep copy.
    [[nodiscard]] auto clone() const -> WireValue;

    /// Structural equality.
    [[nodiscard]] auto operator==(const WireValue& other) const -> bool;

    /// Compact serialization, no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Name of the held type ("null", "boolean", "number", ...).
    [[nodiscard]] auto type_name() const -> const char*;
};

/// Escapes a string for inclusion in a JSON document (quotes not included).
[[nodiscard]] auto escape_string(std::string_view input) -> std::string;

} // namespace carp::wire
