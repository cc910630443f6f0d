//! # Native Bindings
//!
//! Declarations generated for an interface, describing how its calls map
//! onto native code. The call translator checks them against the schema
//! model and builds its plan from both.
//!
//! ## Response Construction
//!
//! A response variant is built from the fields present on the wire:
//!
//! - no field present: `init_done()` yields the value directly
//! - first present field: its `init_setter` starts a `ResponseBuilder`
//! - every later present field: its `setter` updates the builder
//! - finally `complete()` yields the value
//!
//! A variant with no fields, or whose fields are all absent, therefore
//! never allocates a builder.

#ifndef CARP_RUNTIME_BINDING_HPP
#define CARP_RUNTIME_BINDING_HPP

#include "codec/codec.hpp"
#include "common.hpp"
#include "name/external_name.hpp"
#include "scope/native_module.hpp"

#include <any>
#include <functional>
#include <vector>

namespace carp::runtime {

/// Accumulates the fields of one response value.
class ResponseBuilder {
public:
    virtual ~ResponseBuilder() = default;

    /// Yields the finished value. Called once.
    virtual auto complete() -> std::any = 0;
};

struct FieldBinding {
    ExternalName name;
    std::function<Box<ResponseBuilder>(std::any)> init_setter;
    std::function<void(ResponseBuilder&, std::any)> setter;
};

struct ResponseBinding {
    ExternalName name;
    std::function<std::any()> init_done;
    std::vector<FieldBinding> fields;
};

struct CallBinding {
    ExternalName name;
    std::vector<ExternalName> arguments; ///< in the order the native method takes them
    std::vector<ResponseBinding> responses;
};

/// A decoded response: the variant's name and its native value.
struct CallResponse {
    ExternalName variant;
    std::any value;
};

/// The generated declaration of an interface type.
struct InterfaceBinding : public scope::NativeType {
    InterfaceBinding(ExternalName type_name, std::vector<CallBinding> calls)
        : scope::NativeType(std::move(type_name)), calls(std::move(calls)) {}

    std::vector<CallBinding> calls;

    /// Binding of a call, or `nullptr`.
    [[nodiscard]] auto find(const ExternalName& call) const -> const CallBinding*;
};

/// A response binding whose value is a `codec::Record` holding the present
/// fields. Used where no dedicated response type was generated.
auto record_response(ExternalName variant, const std::vector<ExternalName>& fields)
    -> ResponseBinding;

} // namespace carp::runtime

#endif // CARP_RUNTIME_BINDING_HPP
