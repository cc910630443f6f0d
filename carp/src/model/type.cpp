#include "model/type.hpp"

namespace carp::model {

auto builtin_name(Builtin builtin) -> const char* {
    switch (builtin) {
    case Builtin::String:
        return "string";
    case Builtin::Integer:
        return "integer";
    case Builtin::Real:
        return "real";
    case Builtin::Boolean:
        return "boolean";
    case Builtin::Uuid:
        return "uuid";
    }
    return "string";
}

auto parse_builtin(std::string_view name) -> std::optional<Builtin> {
    if (name == "string") {
        return Builtin::String;
    }
    if (name == "integer") {
        return Builtin::Integer;
    }
    if (name == "real") {
        return Builtin::Real;
    }
    if (name == "boolean") {
        return Builtin::Boolean;
    }
    if (name == "uuid") {
        return Builtin::Uuid;
    }
    return std::nullopt;
}

auto Type::of_builtin(Builtin builtin) -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Builtin;
    type->builtin = builtin;
    return type;
}

auto Type::bounded_integer(std::optional<int64_t> min, std::optional<int64_t> max)
    -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Builtin;
    type->builtin = Builtin::Integer;
    type->min = min;
    type->max = max;
    return type;
}

auto Type::sequence_of(Rc<const Type> element) -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Sequence;
    type->element = std::move(element);
    return type;
}

auto Type::set_of(Rc<const Type> element) -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Set;
    type->element = std::move(element);
    return type;
}

auto Type::map_of(Rc<const Type> key, Rc<const Type> value) -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Map;
    type->key = std::move(key);
    type->element = std::move(value);
    return type;
}

auto Type::range_text() const -> std::string {
    return "[" + (min ? std::to_string(*min) : std::string("-inf")) + "," +
           (max ? std::to_string(*max) : std::string("inf")) + "]";
}

auto Type::reference_to(ExternalName target) -> Rc<const Type> {
    auto type = make_rc<Type>();
    type->kind = Kind::Reference;
    type->target = std::move(target);
    return type;
}

auto Type::describe() const -> std::string {
    switch (kind) {
    case Kind::Builtin:
        if (builtin == Builtin::Integer && (min || max)) {
            return "integer" + range_text();
        }
        return builtin_name(builtin);
    case Kind::Sequence:
        return "sequence<" + (element ? element->describe() : std::string("?")) + ">";
    case Kind::Set:
        return "set<" + (element ? element->describe() : std::string("?")) + ">";
    case Kind::Map:
        return "map<" + (key ? key->describe() : std::string("?")) + "," +
               (element ? element->describe() : std::string("?")) + ">";
    case Kind::Structure:
        return "structure(" + std::to_string(members.size()) + " members)";
    case Kind::Enumeration:
        return "enumeration(" + std::to_string(constants.size()) + " constants)";
    case Kind::Interface:
        return "interface(" + std::to_string(calls.size()) + " calls)";
    case Kind::Reference:
        return target->to_string();
    }
    return "?";
}

} // namespace carp::model
