#include "scope/resolution_scope.hpp"

#include "log/log.hpp"
#include "model/module_definition.hpp"

#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace carp::scope {

// ============================================================================
// Descriptor Sources
// ============================================================================

void InMemoryDescriptorSource::add(const ExternalName& module, std::string text) {
    std::unique_lock lock(mutex_);
    texts_.insert_or_assign(module, std::move(text));
}

auto InMemoryDescriptorSource::find(const ExternalName& module)
    -> Result<std::optional<std::string>, RpcError> {
    std::shared_lock lock(mutex_);
    auto it = texts_.find(module);
    if (it == texts_.end()) {
        return std::optional<std::string>();
    }
    return std::optional<std::string>(it->second);
}

auto DirectoryDescriptorSource::path_for(const ExternalName& module) const
    -> std::filesystem::path {
    return root_ / module.as_path_elements() / model::DESCRIPTOR_FILE_NAME;
}

auto DirectoryDescriptorSource::find(const ExternalName& module)
    -> Result<std::optional<std::string>, RpcError> {
    auto path = path_for(module);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return RpcError::resource(module.to_string(), path.string() + ": " + ec.message());
        }
        return std::optional<std::string>();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return RpcError::resource(module.to_string(), "cannot open " + path.string());
    }
    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) {
        return RpcError::resource(module.to_string(), "cannot read " + path.string());
    }
    return std::optional<std::string>(text.str());
}

// ============================================================================
// ScopeArena
// ============================================================================

auto ScopeArena::add_root(std::string name, Box<DescriptorSource> source) -> ScopeId {
    std::unique_lock lock(mutex_);
    nodes_.push_back(Node{std::move(name), std::nullopt, std::move(source), {}});
    return nodes_.size() - 1;
}

auto ScopeArena::add_child(ScopeId parent, std::string name, Box<DescriptorSource> source)
    -> ScopeId {
    std::unique_lock lock(mutex_);
    if (parent >= nodes_.size()) {
        throw std::out_of_range("no scope " + std::to_string(parent));
    }
    nodes_.push_back(Node{std::move(name), parent, std::move(source), {}});
    return nodes_.size() - 1;
}

auto ScopeArena::node(ScopeId id) const -> const Node& {
    if (id >= nodes_.size()) {
        throw std::out_of_range("no scope " + std::to_string(id));
    }
    return nodes_[id];
}

auto ScopeArena::contains(ScopeId id) const -> bool {
    std::shared_lock lock(mutex_);
    return id < nodes_.size();
}

auto ScopeArena::parent(ScopeId id) const -> std::optional<ScopeId> {
    std::shared_lock lock(mutex_);
    return node(id).parent;
}

auto ScopeArena::name(ScopeId id) const -> std::string {
    std::shared_lock lock(mutex_);
    return node(id).name;
}

auto ScopeArena::chain(ScopeId id) const -> std::vector<ScopeId> {
    std::shared_lock lock(mutex_);
    std::vector<ScopeId> out;
    std::optional<ScopeId> cur = id;
    while (cur) {
        out.push_back(*cur);
        cur = node(*cur).parent;
    }
    return std::vector<ScopeId>(out.rbegin(), out.rend());
}

auto ScopeArena::source(ScopeId id) const -> DescriptorSource* {
    std::shared_lock lock(mutex_);
    return node(id).source.get();
}

void ScopeArena::register_native(ScopeId id, Rc<const NativeModule> module) {
    std::unique_lock lock(mutex_);
    if (id >= nodes_.size()) {
        throw std::out_of_range("no scope " + std::to_string(id));
    }
    CARP_LOG_DEBUG("resolver", "scope " << nodes_[id].name << " hosts native target "
                                        << module->target());
    auto target = module->target();
    if (!nodes_[id].natives.emplace(target, std::move(module)).second) {
        throw std::runtime_error("scope " + nodes_[id].name + " already hosts " + target);
    }
}

auto ScopeArena::find_native(ScopeId id, const std::string& target) const -> const NativeModule* {
    std::shared_lock lock(mutex_);
    std::optional<ScopeId> cur = id;
    while (cur) {
        const auto& n = node(*cur);
        auto it = n.natives.find(target);
        if (it != n.natives.end()) {
            return it->second.get();
        }
        cur = n.parent;
    }
    return nullptr;
}

auto ScopeArena::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

} // namespace carp::scope
