//! # Native Modules
//!
//! Generated code registers its declarations here under the native target
//! its module descriptor names. The resolver pairs each schema type that
//! must be native with the declaration registered under the type's native
//! class name.

#ifndef CARP_SCOPE_NATIVE_MODULE_HPP
#define CARP_SCOPE_NATIVE_MODULE_HPP

#include "common.hpp"
#include "name/external_name.hpp"

#include <map>
#include <string>

namespace carp::scope {

/// Base of every generated native declaration.
class NativeType {
public:
    explicit NativeType(ExternalName type_name) : type_name_(std::move(type_name)) {}
    virtual ~NativeType() = default;

    /// The schema type this declaration implements.
    [[nodiscard]] auto type_name() const -> const ExternalName& {
        return type_name_;
    }

private:
    ExternalName type_name_;
};

/// The declarations generated for one native target.
class NativeModule {
public:
    explicit NativeModule(std::string target) : target_(std::move(target)) {}

    [[nodiscard]] auto target() const -> const std::string& {
        return target_;
    }

    /// Registers `type` under the class name of its schema type.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if the class name is already taken.
    void add(Rc<const NativeType> type);

    /// Declaration for a schema type, or `nullptr`.
    [[nodiscard]] auto find(const ExternalName& type_name) const -> const NativeType*;

    [[nodiscard]] auto size() const -> size_t {
        return types_.size();
    }

private:
    std::string target_;
    std::map<std::string, Rc<const NativeType>> types_;
};

} // namespace carp::scope

#endif // CARP_SCOPE_NATIVE_MODULE_HPP
