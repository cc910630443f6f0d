//! # Module Definitions
//!
//! A module is a named group of type definitions, loaded from the compiled
//! descriptor `carp.module.json`. The descriptor also names the native
//! target the module's types were generated into.
//!
//! ## Descriptor Format
//!
//! ```json
//! {"module": "org.example.echo",
//!  "native-target": "org::example::echo",
//!  "types": {
//!    "echoer": {"interface": {"calls": {
//!        "say": {"params": [{"name": "msg", "type": "string"}],
//!                "responses": {"ok": [{"name": "echo", "type": "string"}]}}}}},
//!    "point": {"structure": [{"name": "x", "type": "integer", "optional": true}]},
//!    "colour": {"enumeration": ["red", "green"]},
//!    "names": {"sequence": "string"},
//!    "tags": {"set": "string"},
//!    "scores": {"map": {"key": "string", "value": "integer"}},
//!    "octet": {"integer": {"min": 0, "max": 255}},
//!    "alias": "org.example.echo.point"}}
//! ```
//!
//! A type expression is a builtin name, a type name (a leaf name is taken
//! relative to the module), or a single-key object naming a constructor.

#ifndef CARP_MODEL_MODULE_DEFINITION_HPP
#define CARP_MODEL_MODULE_DEFINITION_HPP

#include "errors/rpc_error.hpp"
#include "model/type.hpp"

#include <map>
#include <string>
#include <string_view>

namespace carp::model {

struct ModuleDefinition {
    ExternalName name;
    std::string native_target;
    std::map<ExternalName, Rc<const Type>> types; ///< keyed by full type name

    /// Definition of a fully qualified type name, or `nullptr`.
    [[nodiscard]] auto find(const ExternalName& type_name) const -> const Type*;
};

/// File name of the descriptor inside a module's directory.
constexpr const char* DESCRIPTOR_FILE_NAME = "carp.module.json";

/// Parses a module descriptor.
///
/// # Arguments
///
/// * `module` - The module the descriptor was found for
/// * `text` - The descriptor body
///
/// # Returns
///
/// The definition, or a `Resource` error if the text is malformed or
/// describes a different module.
auto load_module_descriptor(const ExternalName& module, std::string_view text)
    -> Result<ModuleDefinition, RpcError>;

} // namespace carp::model

#endif // CARP_MODEL_MODULE_DEFINITION_HPP
