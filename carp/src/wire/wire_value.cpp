//! # Wire Value Operations
//!
//! Member access, deep copy and structural equality for `WireValue`.

#include "wire/wire_value.hpp"

namespace carp::wire {

auto WireValue::get(const std::string& key) const -> const WireValue* {
    if (auto* obj = std::get_if<Box<WireObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

auto WireValue::get_mut(const std::string& key) -> WireValue* {
    if (auto* obj = std::get_if<Box<WireObject>>(&data)) {
        auto it = (*obj)->find(key);
        if (it != (*obj)->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

void WireValue::set(const std::string& key, WireValue value) {
    as_object_mut().insert_or_assign(key, std::move(value));
}

void WireValue::push(WireValue value) {
    as_array_mut().push_back(std::move(value));
}

auto WireValue::size() const -> size_t {
    if (auto* arr = std::get_if<Box<WireArray>>(&data)) {
        return (*arr)->size();
    }
    if (auto* obj = std::get_if<Box<WireObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

auto WireValue::clone() const -> WireValue {
    if (is_array()) {
        WireArray copy;
        copy.reserve(as_array().size());
        for (const auto& item : as_array()) {
            copy.push_back(item.clone());
        }
        return WireValue(std::move(copy));
    }
    if (is_object()) {
        WireObject copy;
        for (const auto& [key, item] : as_object()) {
            copy.emplace(key, item.clone());
        }
        return WireValue(std::move(copy));
    }
    if (is_bool()) {
        return WireValue(as_bool());
    }
    if (is_number()) {
        return WireValue(as_number());
    }
    if (is_string()) {
        return WireValue(as_string());
    }
    return WireValue();
}

auto WireValue::operator==(const WireValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (!(lhs[i] == rhs[i])) {
                return false;
            }
        }
        return true;
    }
    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto it = rhs.begin();
    for (const auto& [key, value] : lhs) {
        if (key != it->first || !(value == it->second)) {
            return false;
        }
        ++it;
    }
    return true;
}

auto WireValue::type_name() const -> const char* {
    if (is_null())
        return "null";
    if (is_bool())
        return "boolean";
    if (is_number())
        return "number";
    if (is_string())
        return "string";
    if (is_array())
        return "array";
    return "object";
}

} // namespace carp::wire
