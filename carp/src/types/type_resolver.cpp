#include "types/type_resolver.hpp"

#include "log/log.hpp"

namespace carp::types {

auto TypeResolver::slot(scope::ScopeId scope, const ExternalName& module) -> Slot& {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& entry = slots_[{scope, module}];
    if (!entry) {
        entry = make_box<Slot>();
    }
    return *entry;
}

auto TypeResolver::load_here(Slot& slot, const ExternalName& module, scope::ScopeId scope)
    -> Result<const ModuleApplication*, RpcError> {
    std::lock_guard<std::mutex> lock(slot.mutex);
    switch (slot.state) {
    case Slot::State::Loaded:
        return static_cast<const ModuleApplication*>(slot.application.get());
    case Slot::State::Absent:
        return static_cast<const ModuleApplication*>(nullptr);
    case Slot::State::Unloaded:
        break;
    }

    scope::DescriptorSource* source = arena_.source(scope);
    if (source == nullptr) {
        slot.state = Slot::State::Absent;
        return static_cast<const ModuleApplication*>(nullptr);
    }

    auto text = source->find(module);
    if (is_err(text)) {
        CARP_LOG_WARN("resolver", "module " << module << " unreadable at scope "
                                            << arena_.name(scope) << ": "
                                            << unwrap_err(text).message);
        return unwrap_err(text);
    }
    if (!unwrap(text)) {
        slot.state = Slot::State::Absent;
        return static_cast<const ModuleApplication*>(nullptr);
    }

    auto definition = model::load_module_descriptor(module, *unwrap(text));
    if (is_err(definition)) {
        CARP_LOG_WARN("resolver", "module " << module << " malformed at scope "
                                            << arena_.name(scope) << ": "
                                            << unwrap_err(definition).message);
        return unwrap_err(definition);
    }

    const scope::NativeModule* native =
        arena_.find_native(scope, unwrap(definition).native_target);
    auto app = make_box<ModuleApplication>(
        ModuleApplication{std::move(unwrap(definition)), native, scope});
    if (app->native == nullptr) {
        CARP_LOG_DEBUG("resolver", "module " << module << " has no native target "
                                             << app->definition.native_target);
    }

    slot.application = std::move(app);
    slot.state = Slot::State::Loaded;
    load_count_.fetch_add(1, std::memory_order_relaxed);
    CARP_LOG_INFO("resolver", "module " << module << " applied at scope " << arena_.name(scope));
    return static_cast<const ModuleApplication*>(slot.application.get());
}

auto TypeResolver::application(const ExternalName& module, scope::ScopeId scope)
    -> Result<const ModuleApplication*, RpcError> {
    if (auto parent = arena_.parent(scope)) {
        auto inherited = application(module, *parent);
        if (is_err(inherited) || unwrap(inherited) != nullptr) {
            return inherited;
        }
    }
    return load_here(slot(scope, module), module, scope);
}

auto TypeResolver::resolve(const ExternalName& type_name, scope::ScopeId scope)
    -> Result<TypeRecord, RpcError> {
    auto module = type_name.parent();
    if (!module) {
        return RpcError::missing_module(type_name.to_string(), "");
    }

    auto app = application(*module, scope);
    if (is_err(app)) {
        return unwrap_err(app);
    }
    const ModuleApplication* found = unwrap(app);
    if (found == nullptr) {
        return RpcError::missing_module(type_name.to_string(), module->to_string());
    }

    const model::Type* type = found->definition.find(type_name);
    if (type == nullptr) {
        return RpcError::missing_type(type_name.to_string());
    }

    TypeRecord record{type, nullptr, found->scope, type_name};
    if (found->native != nullptr) {
        record.native = found->native->find(type_name);
    }
    return record;
}

} // namespace carp::types
