#include "scope/native_module.hpp"

#include <stdexcept>

namespace carp::scope {

void NativeModule::add(Rc<const NativeType> type) {
    auto key = type->type_name().as_native_class_name();
    if (!types_.emplace(key, std::move(type)).second) {
        throw std::runtime_error("native target " + target_ + " already declares " + key);
    }
}

auto NativeModule::find(const ExternalName& type_name) const -> const NativeType* {
    auto it = types_.find(type_name.as_native_class_name());
    if (it == types_.end() || !(it->second->type_name() == type_name)) {
        return nullptr;
    }
    return it->second.get();
}

} // namespace carp::scope
