//! # Module Descriptor Loading
//!
//! Turns the text of `carp.module.json` into a `ModuleDefinition`. Every
//! structural problem is reported as a `Resource` error naming the module.

#include "model/module_definition.hpp"

#include "log/log.hpp"
#include "wire/wire.hpp"

namespace carp::model {

auto ModuleDefinition::find(const ExternalName& type_name) const -> const Type* {
    auto it = types.find(type_name);
    return it == types.end() ? nullptr : it->second.get();
}

namespace {

using wire::WireValue;

/// Parses type expressions relative to one module.
class DescriptorReader {
public:
    explicit DescriptorReader(const ExternalName& module) : module_(module) {}

    auto type_expr(const WireValue& value, const std::string& where)
        -> Result<Rc<const Type>, std::string>;

private:
    const ExternalName& module_;

    auto name(const WireValue& value, const std::string& where) -> Result<ExternalName, std::string>;
    auto fields(const WireValue& value, const std::string& where)
        -> Result<std::vector<Field>, std::string>;
    auto interface_type(const WireValue& value, const std::string& where)
        -> Result<Rc<const Type>, std::string>;
    auto bounded_integer(const WireValue& value, const std::string& where)
        -> Result<Rc<const Type>, std::string>;
};

auto DescriptorReader::name(const WireValue& value, const std::string& where)
    -> Result<ExternalName, std::string> {
    if (!value.is_string()) {
        return where + ": expected a name, found " + value.type_name();
    }
    auto parsed = ExternalName::parse(value.as_string());
    if (is_err(parsed)) {
        return where + ": " + unwrap_err(parsed);
    }
    return std::move(unwrap(parsed));
}

auto DescriptorReader::fields(const WireValue& value, const std::string& where)
    -> Result<std::vector<Field>, std::string> {
    if (!value.is_array()) {
        return where + ": expected a field list";
    }
    std::vector<Field> out;
    for (const auto& item : value.as_array()) {
        const WireValue* fname = item.get("name");
        const WireValue* ftype = item.get("type");
        if (fname == nullptr || ftype == nullptr) {
            return where + ": field needs \"name\" and \"type\"";
        }
        auto parsed_name = name(*fname, where);
        if (is_err(parsed_name)) {
            return unwrap_err(parsed_name);
        }
        const auto& field_name = unwrap(parsed_name);
        auto parsed_type = type_expr(*ftype, where + "." + field_name.to_string());
        if (is_err(parsed_type)) {
            return unwrap_err(parsed_type);
        }
        bool optional = false;
        if (const WireValue* opt = item.get("optional")) {
            if (!opt->is_bool()) {
                return where + "." + field_name.to_string() + ": \"optional\" must be boolean";
            }
            optional = opt->as_bool();
        }
        out.push_back(Field{field_name, std::move(unwrap(parsed_type)), optional});
    }
    return out;
}

auto DescriptorReader::interface_type(const WireValue& value, const std::string& where)
    -> Result<Rc<const Type>, std::string> {
    const WireValue* calls = value.get("calls");
    if (calls == nullptr || !calls->is_object()) {
        return where + ": interface needs a \"calls\" object";
    }
    auto type = make_rc<Type>();
    type->kind = Type::Kind::Interface;

    for (const auto& [call_text, call_value] : calls->as_object()) {
        auto call_name = ExternalName::parse(call_text);
        if (is_err(call_name)) {
            return where + ": " + unwrap_err(call_name);
        }
        std::string call_where = where + "." + call_text;
        CallSpec spec;

        if (const WireValue* params = call_value.get("params")) {
            auto parsed = fields(*params, call_where);
            if (is_err(parsed)) {
                return unwrap_err(parsed);
            }
            spec.params = std::move(unwrap(parsed));
        }

        if (const WireValue* responses = call_value.get("responses")) {
            if (!responses->is_object()) {
                return call_where + ": \"responses\" must be an object";
            }
            for (const auto& [rsp_text, rsp_fields] : responses->as_object()) {
                auto rsp_name = ExternalName::parse(rsp_text);
                if (is_err(rsp_name)) {
                    return call_where + ": " + unwrap_err(rsp_name);
                }
                auto parsed = fields(rsp_fields, call_where + "." + rsp_text);
                if (is_err(parsed)) {
                    return unwrap_err(parsed);
                }
                spec.responses.emplace(std::move(unwrap(rsp_name)),
                                       ResponseSpec{std::move(unwrap(parsed))});
            }
        }

        type->calls.emplace(std::move(unwrap(call_name)), std::move(spec));
    }
    return Rc<const Type>(type);
}

auto DescriptorReader::bounded_integer(const WireValue& value, const std::string& where)
    -> Result<Rc<const Type>, std::string> {
    if (!value.is_object()) {
        return where + ": integer bounds must be an object";
    }
    std::optional<int64_t> bounds[2];
    const char* keys[2] = {"min", "max"};
    for (int i = 0; i < 2; ++i) {
        const WireValue* bound = value.get(keys[i]);
        if (bound == nullptr || bound->is_null()) {
            continue;
        }
        bounds[i] = bound->try_as_i64();
        if (!bounds[i]) {
            return where + ": \"" + keys[i] + "\" must be an integer";
        }
    }
    if (bounds[0] && bounds[1] && *bounds[0] > *bounds[1]) {
        return where + ": empty integer range";
    }
    return Type::bounded_integer(bounds[0], bounds[1]);
}

auto DescriptorReader::type_expr(const WireValue& value, const std::string& where)
    -> Result<Rc<const Type>, std::string> {
    if (value.is_string()) {
        if (auto builtin = parse_builtin(value.as_string())) {
            return Type::of_builtin(*builtin);
        }
        auto target = name(value, where);
        if (is_err(target)) {
            return unwrap_err(target);
        }
        auto& target_name = unwrap(target);
        if (target_name.is_leaf()) {
            return Type::reference_to(module_.resolve(target_name));
        }
        return Type::reference_to(std::move(target_name));
    }

    if (!value.is_object() || value.size() != 1) {
        return where + ": expected a type name or a single-key constructor object";
    }
    const auto& [ctor, arg] = *value.as_object().begin();

    if (ctor == "sequence") {
        auto element = type_expr(arg, where + "[]");
        if (is_err(element)) {
            return element;
        }
        return Type::sequence_of(std::move(unwrap(element)));
    }
    if (ctor == "set") {
        auto element = type_expr(arg, where + "{}");
        if (is_err(element)) {
            return element;
        }
        return Type::set_of(std::move(unwrap(element)));
    }
    if (ctor == "map") {
        const WireValue* key = arg.get("key");
        const WireValue* val = arg.get("value");
        if (key == nullptr || val == nullptr) {
            return where + ": map needs \"key\" and \"value\"";
        }
        auto key_type = type_expr(*key, where + ".key");
        if (is_err(key_type)) {
            return key_type;
        }
        auto value_type = type_expr(*val, where + ".value");
        if (is_err(value_type)) {
            return value_type;
        }
        return Type::map_of(std::move(unwrap(key_type)), std::move(unwrap(value_type)));
    }
    if (ctor == "integer") {
        return bounded_integer(arg, where);
    }
    if (ctor == "structure") {
        auto members = fields(arg, where);
        if (is_err(members)) {
            return unwrap_err(members);
        }
        auto type = make_rc<Type>();
        type->kind = Type::Kind::Structure;
        type->members = std::move(unwrap(members));
        return Rc<const Type>(type);
    }
    if (ctor == "enumeration") {
        if (!arg.is_array()) {
            return where + ": enumeration needs a list of constants";
        }
        auto type = make_rc<Type>();
        type->kind = Type::Kind::Enumeration;
        for (const auto& constant : arg.as_array()) {
            auto parsed = name(constant, where);
            if (is_err(parsed)) {
                return unwrap_err(parsed);
            }
            type->constants.push_back(std::move(unwrap(parsed)));
        }
        return Rc<const Type>(type);
    }
    if (ctor == "interface") {
        return interface_type(arg, where);
    }
    return where + ": unknown type constructor \"" + ctor + "\"";
}

} // namespace

auto load_module_descriptor(const ExternalName& module, std::string_view text)
    -> Result<ModuleDefinition, RpcError> {
    auto parsed = wire::parse_wire(text);
    if (is_err(parsed)) {
        return RpcError::resource(module.to_string(), unwrap_err(parsed).to_string());
    }
    const WireValue& root = unwrap(parsed);
    if (!root.is_object()) {
        return RpcError::resource(module.to_string(), "descriptor is not an object");
    }

    const WireValue* declared = root.get("module");
    if (declared == nullptr || !declared->is_string()) {
        return RpcError::resource(module.to_string(), "descriptor lacks \"module\"");
    }
    if (declared->as_string() != module.to_string()) {
        return RpcError::resource(module.to_string(),
                                  "descriptor describes " + declared->as_string());
    }

    ModuleDefinition def{module, {}, {}};
    if (const WireValue* target = root.get("native-target")) {
        if (!target->is_string()) {
            return RpcError::resource(module.to_string(), "\"native-target\" must be a string");
        }
        def.native_target = target->as_string();
    } else {
        def.native_target = module.as_native_namespace();
    }

    const WireValue* types = root.get("types");
    if (types == nullptr || !types->is_object()) {
        return RpcError::resource(module.to_string(), "descriptor lacks a \"types\" object");
    }

    DescriptorReader reader(module);
    for (const auto& [leaf_text, expr] : types->as_object()) {
        auto leaf = ExternalName::parse(leaf_text);
        if (is_err(leaf) || !unwrap(leaf).is_leaf()) {
            return RpcError::resource(module.to_string(), "bad type name \"" + leaf_text + "\"");
        }
        auto type = reader.type_expr(expr, leaf_text);
        if (is_err(type)) {
            return RpcError::resource(module.to_string(), unwrap_err(type));
        }
        def.types.emplace(module.resolve(unwrap(leaf)), std::move(unwrap(type)));
    }

    CARP_LOG_DEBUG("resolver", "loaded module " << module << " with " << def.types.size()
                                                << " types, target " << def.native_target);
    return def;
}

} // namespace carp::model
