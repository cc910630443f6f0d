//! # Resolution Scopes
//!
//! An arena of scope nodes linked to their parents. Each scope may see
//! module descriptors of its own, and may host native modules generated for
//! them. A descriptor is visible only at the scope whose source yields it;
//! the search across ancestors is the resolver's job.
//!
//! ```text
//!   root  (system descriptors)
//!    └── plugin  (descriptors bundled with a plugin)
//!         └── session
//! ```
//!
//! Scopes are append-only: nodes are never removed, and a `ScopeId` stays
//! valid for the arena's lifetime.

#ifndef CARP_SCOPE_RESOLUTION_SCOPE_HPP
#define CARP_SCOPE_RESOLUTION_SCOPE_HPP

#include "common.hpp"
#include "errors/rpc_error.hpp"
#include "name/external_name.hpp"
#include "scope/native_module.hpp"

#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace carp::scope {

using ScopeId = size_t;

// ============================================================================
// Descriptor Sources
// ============================================================================

/// Supplies the descriptor text for modules visible at one scope.
class DescriptorSource {
public:
    virtual ~DescriptorSource() = default;

    /// # Returns
    ///
    /// The descriptor text, `std::nullopt` if this scope does not define the
    /// module, or a `Resource` error if it does but the text is unreadable.
    virtual auto find(const ExternalName& module) -> Result<std::optional<std::string>, RpcError> = 0;
};

/// Descriptors held in memory, keyed by module name.
class InMemoryDescriptorSource : public DescriptorSource {
public:
    void add(const ExternalName& module, std::string text);

    auto find(const ExternalName& module) -> Result<std::optional<std::string>, RpcError> override;

private:
    mutable std::shared_mutex mutex_;
    std::map<ExternalName, std::string> texts_;
};

/// Descriptors on disk at `<root>/<module path>/carp.module.json`, where
/// the module path is `as_path_elements()`.
class DirectoryDescriptorSource : public DescriptorSource {
public:
    explicit DirectoryDescriptorSource(std::filesystem::path root) : root_(std::move(root)) {}

    auto find(const ExternalName& module) -> Result<std::optional<std::string>, RpcError> override;

    [[nodiscard]] auto path_for(const ExternalName& module) const -> std::filesystem::path;

private:
    std::filesystem::path root_;
};

// ============================================================================
// Scope Arena
// ============================================================================

class ScopeArena {
public:
    /// Adds a scope with no parent.
    auto add_root(std::string name, Box<DescriptorSource> source) -> ScopeId;

    /// Adds a scope below `parent`.
    ///
    /// # Panics
    ///
    /// Throws `std::out_of_range` if `parent` is not a scope of this arena.
    auto add_child(ScopeId parent, std::string name, Box<DescriptorSource> source) -> ScopeId;

    [[nodiscard]] auto contains(ScopeId id) const -> bool;

    [[nodiscard]] auto parent(ScopeId id) const -> std::optional<ScopeId>;

    [[nodiscard]] auto name(ScopeId id) const -> std::string;

    /// `id` and its ancestors, root first.
    [[nodiscard]] auto chain(ScopeId id) const -> std::vector<ScopeId>;

    /// Source of descriptors visible at exactly this scope; may be null.
    [[nodiscard]] auto source(ScopeId id) const -> DescriptorSource*;

    /// Makes a native module available at `id` and its descendants.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if `id` already hosts the same target.
    void register_native(ScopeId id, Rc<const NativeModule> module);

    /// Native module for `target`, searched from `id` towards the root.
    [[nodiscard]] auto find_native(ScopeId id, const std::string& target) const
        -> const NativeModule*;

    [[nodiscard]] auto size() const -> size_t;

private:
    struct Node {
        std::string name;
        std::optional<ScopeId> parent;
        Box<DescriptorSource> source;
        std::map<std::string, Rc<const NativeModule>> natives;
    };

    auto node(ScopeId id) const -> const Node&;

    mutable std::shared_mutex mutex_;
    std::deque<Node> nodes_;
};

} // namespace carp::scope

#endif // CARP_SCOPE_RESOLUTION_SCOPE_HPP
