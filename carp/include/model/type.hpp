//! # Schema Types
//!
//! The type model a compiled module descriptor describes. Types are
//! immutable after loading and shared between the definitions that refer
//! to them.
//!
//! | Kind | Payload | Needs a native form |
//! |------|---------|---------------------|
//! | `Builtin` | `string`, `integer`, `real`, `boolean`, `uuid` | no |
//! | `Sequence` | element type | no |
//! | `Set` | element type | no |
//! | `Map` | key and value types | no |
//! | `Structure` | ordered members | yes |
//! | `Enumeration` | ordered constants | yes |
//! | `Interface` | calls with parameters and response variants | yes |
//! | `Reference` | name of another type | no |
//!
//! An `integer` builtin may carry inclusive bounds; either end may be open.

#ifndef CARP_MODEL_TYPE_HPP
#define CARP_MODEL_TYPE_HPP

#include "common.hpp"
#include "name/external_name.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace carp::model {

enum class Builtin { String, Integer, Real, Boolean, Uuid };

/// Schema name of a builtin ("string", "integer", ...).
auto builtin_name(Builtin builtin) -> const char*;

/// Inverse of `builtin_name`.
auto parse_builtin(std::string_view name) -> std::optional<Builtin>;

struct Type;

/// A named, typed slot: a structure member, call parameter or response field.
struct Field {
    ExternalName name;
    Rc<const Type> type;
    bool optional = false;
};

/// One response variant of a call.
struct ResponseSpec {
    std::vector<Field> fields;
};

struct CallSpec {
    std::vector<Field> params;
    std::map<ExternalName, ResponseSpec> responses;
};

struct Type {
    enum class Kind { Builtin, Sequence, Set, Map, Structure, Enumeration, Interface, Reference };

    Kind kind = Kind::Builtin;

    Builtin builtin = Builtin::String;            ///< Builtin
    std::optional<int64_t> min;                   ///< Builtin integer lower bound
    std::optional<int64_t> max;                   ///< Builtin integer upper bound
    Rc<const Type> key;                           ///< Map
    Rc<const Type> element;                       ///< Sequence, Set, Map value
    std::vector<Field> members;                   ///< Structure
    std::vector<ExternalName> constants;          ///< Enumeration
    std::map<ExternalName, CallSpec> calls;       ///< Interface
    std::optional<ExternalName> target;           ///< Reference

    static auto of_builtin(Builtin builtin) -> Rc<const Type>;
    static auto bounded_integer(std::optional<int64_t> min, std::optional<int64_t> max)
        -> Rc<const Type>;
    static auto sequence_of(Rc<const Type> element) -> Rc<const Type>;
    static auto set_of(Rc<const Type> element) -> Rc<const Type>;
    static auto map_of(Rc<const Type> key, Rc<const Type> value) -> Rc<const Type>;
    static auto reference_to(ExternalName target) -> Rc<const Type>;

    /// True for kinds that map onto a generated native declaration.
    [[nodiscard]] auto must_be_native() const -> bool {
        return kind == Kind::Structure || kind == Kind::Enumeration || kind == Kind::Interface;
    }

    /// True if `value` lies within the integer bounds. Unbounded types
    /// accept every value.
    [[nodiscard]] auto in_range(int64_t value) const -> bool {
        return (!min || value >= *min) && (!max || value <= *max);
    }

    /// Short human-readable form, e.g. `sequence<string>`.
    [[nodiscard]] auto describe() const -> std::string;

    /// Integer bounds as `[min,max]`, with `-inf`/`inf` for open ends.
    [[nodiscard]] auto range_text() const -> std::string;
};

} // namespace carp::model

#endif // CARP_MODEL_TYPE_HPP
