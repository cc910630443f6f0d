//! # Type Resolver
//!
//! Maps a qualified type name, seen from a resolution scope, to its schema
//! model and the native declaration generated for it.
//!
//! ## Search Order
//!
//! A module is looked up root first. The resolver recurses to the parent
//! scope before doing any work at a scope, so ancestors are always settled
//! before a descendant is consulted, and a hit at an ancestor never touches
//! the descendants at all.
//!
//! ```text
//! resolve(m.foo, leaf)
//!   application(m, leaf)
//!     application(m, mid)
//!       application(m, root)   -> loads descriptor, memoized
//!     <- root's application
//!   <- root's application
//! ```
//!
//! ## Memoization
//!
//! Each (scope, module) pair owns one slot. The slot is filled at most once,
//! even when several threads ask for it together: the first caller loads
//! while the others wait on the slot. A scope that does not define the module
//! is remembered as absent for good. A descriptor that fails to load is not
//! remembered, so the next lookup reads it again.

#ifndef CARP_TYPES_TYPE_RESOLVER_HPP
#define CARP_TYPES_TYPE_RESOLVER_HPP

#include "common.hpp"
#include "errors/rpc_error.hpp"
#include "model/module_definition.hpp"
#include "scope/resolution_scope.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <utility>

namespace carp::types {

/// One scope's knowledge of a module.
struct ModuleApplication {
    model::ModuleDefinition definition;
    const scope::NativeModule* native = nullptr; ///< may be null
    scope::ScopeId scope = 0;
};

/// Result of resolving a type name.
struct TypeRecord {
    const model::Type* type = nullptr;
    const scope::NativeType* native = nullptr; ///< null if nothing was generated for it
    scope::ScopeId scope = 0;
    ExternalName name;
};

class TypeResolver {
public:
    explicit TypeResolver(const scope::ScopeArena& arena) : arena_(arena) {}

    TypeResolver(const TypeResolver&) = delete;
    auto operator=(const TypeResolver&) -> TypeResolver& = delete;

    /// Resolves a qualified type name.
    ///
    /// # Arguments
    ///
    /// * `type_name` - A non-leaf name; its parent is the module
    /// * `scope` - The scope the name is seen from
    ///
    /// # Returns
    ///
    /// The record, or an error:
    /// - `MissingType` with `module_missing` set if no scope defines the module
    /// - `MissingType` if the module lacks the type
    /// - `Resource` if a descriptor on the way could not be loaded
    auto resolve(const ExternalName& type_name, scope::ScopeId scope)
        -> Result<TypeRecord, RpcError>;

    /// The application of `module` visible from `scope`, or `nullptr` if no
    /// scope in the chain defines it.
    auto application(const ExternalName& module, scope::ScopeId scope)
        -> Result<const ModuleApplication*, RpcError>;

    /// Number of descriptors successfully loaded so far.
    [[nodiscard]] auto load_count() const -> size_t {
        return load_count_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto arena() const -> const scope::ScopeArena& {
        return arena_;
    }

private:
    struct Slot {
        enum class State { Unloaded, Loaded, Absent };

        std::mutex mutex;
        State state = State::Unloaded;
        Box<ModuleApplication> application;
    };

    auto slot(scope::ScopeId scope, const ExternalName& module) -> Slot&;
    auto load_here(Slot& slot, const ExternalName& module, scope::ScopeId scope)
        -> Result<const ModuleApplication*, RpcError>;

    const scope::ScopeArena& arena_;
    std::mutex slots_mutex_;
    std::map<std::pair<scope::ScopeId, ExternalName>, Box<Slot>> slots_;
    std::atomic<size_t> load_count_{0};
};

} // namespace carp::types

#endif // CARP_TYPES_TYPE_RESOLVER_HPP
