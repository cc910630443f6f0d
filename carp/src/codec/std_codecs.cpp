#include "codec/std_codecs.hpp"

#include "log/log.hpp"
#include "runtime/binding.hpp"

#include <mutex>
#include <set>
#include <stdexcept>
#include <typeinfo>

namespace carp::codec {

using wire::WireValue;

namespace {

template <typename T> auto expect(const std::any& value, const char* what) -> const T& {
    const T* typed = std::any_cast<T>(&value);
    if (typed == nullptr) {
        throw std::invalid_argument(std::string("expected ") + what + " value, got " +
                                    value.type().name());
    }
    return *typed;
}

auto mismatch(const char* expected, const WireValue& found) -> RpcError {
    return RpcError::protocol(std::string("expected ") + expected + ", found " +
                              found.type_name());
}

// ============================================================================
// Builtins
// ============================================================================

class BuiltinCodec : public Encoder, public Decoder {
public:
    explicit BuiltinCodec(const model::Type& type) : type_(type), builtin_(type.builtin) {}

    auto encode(const std::any& value, EncodingContext&) const
        -> Result<WireValue, RpcError> override {
        switch (builtin_) {
        case model::Builtin::String:
            return WireValue(expect<std::string>(value, "string"));
        case model::Builtin::Integer: {
            int64_t i = expect<int64_t>(value, "integer");
            if (!type_.in_range(i)) {
                throw std::invalid_argument(out_of_range(i));
            }
            return WireValue(i);
        }
        case model::Builtin::Real:
            return WireValue(expect<double>(value, "real"));
        case model::Builtin::Boolean:
            return WireValue(expect<bool>(value, "boolean"));
        case model::Builtin::Uuid:
            return WireValue(expect<Uuid>(value, "uuid").to_string());
        }
        throw std::logic_error("unhandled builtin");
    }

    auto decode(const WireValue& value, DecodingContext&) const
        -> Result<std::any, RpcError> override {
        switch (builtin_) {
        case model::Builtin::String:
            if (!value.is_string()) {
                return mismatch("string", value);
            }
            return std::any(value.as_string());
        case model::Builtin::Integer: {
            auto i = value.try_as_i64();
            if (!i) {
                return mismatch("integer", value);
            }
            if (!type_.in_range(*i)) {
                return RpcError::protocol(out_of_range(*i));
            }
            return std::any(*i);
        }
        case model::Builtin::Real:
            if (!value.is_number()) {
                return mismatch("real", value);
            }
            return std::any(value.as_f64());
        case model::Builtin::Boolean:
            if (!value.is_bool()) {
                return mismatch("boolean", value);
            }
            return std::any(value.as_bool());
        case model::Builtin::Uuid: {
            if (!value.is_string()) {
                return mismatch("uuid", value);
            }
            auto id = Uuid::parse(value.as_string());
            if (is_err(id)) {
                return RpcError::protocol(unwrap_err(id));
            }
            return std::any(unwrap(id));
        }
        }
        throw std::logic_error("unhandled builtin");
    }

private:
    [[nodiscard]] auto out_of_range(int64_t value) const -> std::string {
        return std::to_string(value) + " out of range " + type_.range_text();
    }

    const model::Type& type_;
    model::Builtin builtin_;
};

// ============================================================================
// Sequences
// ============================================================================

class SequenceEncoder : public Encoder {
public:
    explicit SequenceEncoder(Rc<const Encoder> element) : element_(std::move(element)) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        const auto& items = expect<Sequence>(value, "sequence");
        WireValue out{wire::WireArray{}};
        for (const auto& item : items) {
            auto encoded = element_->encode(item, ctx);
            if (is_err(encoded)) {
                return encoded;
            }
            out.push(std::move(unwrap(encoded)));
        }
        return out;
    }

private:
    Rc<const Encoder> element_;
};

class SequenceDecoder : public Decoder {
public:
    explicit SequenceDecoder(Rc<const Decoder> element) : element_(std::move(element)) {}

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        if (!value.is_array()) {
            return mismatch("sequence", value);
        }
        Sequence items;
        items.reserve(value.size());
        for (const auto& item : value.as_array()) {
            auto decoded = element_->decode(item, ctx);
            if (is_err(decoded)) {
                return decoded;
            }
            items.push_back(std::move(unwrap(decoded)));
        }
        return std::any(std::move(items));
    }

private:
    Rc<const Decoder> element_;
};

// ============================================================================
// Sets and Maps
// ============================================================================

/// Collapses wire-equal elements, keeping the first occurrence.
class SetEncoder : public Encoder {
public:
    explicit SetEncoder(Rc<const Encoder> element) : element_(std::move(element)) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        const auto& items = expect<Set>(value, "set");
        WireValue out{wire::WireArray{}};
        std::set<std::string> seen;
        for (const auto& item : items) {
            auto encoded = element_->encode(item, ctx);
            if (is_err(encoded)) {
                return encoded;
            }
            if (seen.insert(unwrap(encoded).to_string()).second) {
                out.push(std::move(unwrap(encoded)));
            }
        }
        return out;
    }

private:
    Rc<const Encoder> element_;
};

class SetDecoder : public Decoder {
public:
    explicit SetDecoder(Rc<const Decoder> element) : element_(std::move(element)) {}

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        if (!value.is_array()) {
            return mismatch("set", value);
        }
        Set items;
        std::set<std::string> seen;
        for (const auto& item : value.as_array()) {
            if (!seen.insert(item.to_string()).second) {
                continue;
            }
            auto decoded = element_->decode(item, ctx);
            if (is_err(decoded)) {
                return decoded;
            }
            items.push_back(std::move(unwrap(decoded)));
        }
        return std::any(std::move(items));
    }

private:
    Rc<const Decoder> element_;
};

/// A map travels as an array of `[key, value]` pairs.
class MapEncoder : public Encoder {
public:
    MapEncoder(Rc<const Encoder> key, Rc<const Encoder> value)
        : key_(std::move(key)), value_(std::move(value)) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        const auto& entries = expect<Map>(value, "map");
        WireValue out{wire::WireArray{}};
        std::set<std::string> seen;
        for (const auto& [k, v] : entries) {
            auto key = key_->encode(k, ctx);
            if (is_err(key)) {
                return key;
            }
            if (!seen.insert(unwrap(key).to_string()).second) {
                throw std::invalid_argument("duplicate map key " + unwrap(key).to_string());
            }
            auto mapped = value_->encode(v, ctx);
            if (is_err(mapped)) {
                return mapped;
            }
            WireValue entry{wire::WireArray{}};
            entry.push(std::move(unwrap(key)));
            entry.push(std::move(unwrap(mapped)));
            out.push(std::move(entry));
        }
        return out;
    }

private:
    Rc<const Encoder> key_;
    Rc<const Encoder> value_;
};

/// A later entry replaces an earlier one with a wire-equal key.
class MapDecoder : public Decoder {
public:
    MapDecoder(Rc<const Decoder> key, Rc<const Decoder> value)
        : key_(std::move(key)), value_(std::move(value)) {}

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        if (!value.is_array()) {
            return mismatch("map", value);
        }
        Map entries;
        std::map<std::string, size_t> index;
        for (const auto& entry : value.as_array()) {
            if (!entry.is_array() || entry.size() != 2) {
                return RpcError::protocol("map entry must be a [key, value] pair, found " +
                                          entry.to_string());
            }
            const auto& pair = entry.as_array();
            auto key = key_->decode(pair[0], ctx);
            if (is_err(key)) {
                return key;
            }
            auto mapped = value_->decode(pair[1], ctx);
            if (is_err(mapped)) {
                return mapped;
            }
            auto [it, fresh] = index.emplace(pair[0].to_string(), entries.size());
            if (fresh) {
                entries.emplace_back(std::move(unwrap(key)), std::move(unwrap(mapped)));
            } else {
                entries[it->second].second = std::move(unwrap(mapped));
            }
        }
        return std::any(std::move(entries));
    }

private:
    Rc<const Decoder> key_;
    Rc<const Decoder> value_;
};

// ============================================================================
// Enumerations
// ============================================================================

class EnumerationCodec : public Encoder, public Decoder {
public:
    explicit EnumerationCodec(std::vector<ExternalName> constants)
        : constants_(std::move(constants)) {}

    auto encode(const std::any& value, EncodingContext&) const
        -> Result<WireValue, RpcError> override {
        const auto& text = expect<std::string>(value, "enumeration");
        if (!known(text)) {
            throw std::invalid_argument("no enumeration constant \"" + text + "\"");
        }
        return WireValue(text);
    }

    auto decode(const WireValue& value, DecodingContext&) const
        -> Result<std::any, RpcError> override {
        if (!value.is_string()) {
            return mismatch("enumeration constant", value);
        }
        if (!known(value.as_string())) {
            return RpcError::protocol("unknown enumeration constant \"" + value.as_string() +
                                      "\"");
        }
        return std::any(value.as_string());
    }

private:
    [[nodiscard]] auto known(const std::string& text) const -> bool {
        for (const auto& constant : constants_) {
            if (constant.to_string() == text) {
                return true;
            }
        }
        return false;
    }

    std::vector<ExternalName> constants_;
};

// ============================================================================
// Structures
// ============================================================================

template <typename Codec> struct Member {
    ExternalName name;
    bool optional;
    Rc<const Codec> codec;
};

class RecordEncoder : public Encoder {
public:
    explicit RecordEncoder(std::vector<Member<Encoder>> members) : members_(std::move(members)) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        const auto& record = expect<Record>(value, "structure");
        WireValue out{wire::WireObject{}};
        for (const auto& member : members_) {
            auto it = record.find(member.name);
            if (it == record.end()) {
                if (!member.optional) {
                    throw std::invalid_argument("structure lacks member " +
                                                member.name.to_string());
                }
                continue;
            }
            auto encoded = member.codec->encode(it->second, ctx);
            if (is_err(encoded)) {
                return encoded;
            }
            out.set(member.name.to_string(), std::move(unwrap(encoded)));
        }
        return out;
    }

private:
    std::vector<Member<Encoder>> members_;
};

class RecordDecoder : public Decoder {
public:
    explicit RecordDecoder(std::vector<Member<Decoder>> members) : members_(std::move(members)) {}

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        if (!value.is_object()) {
            return mismatch("structure", value);
        }
        Record record;
        for (const auto& member : members_) {
            const WireValue* field = value.get(member.name.to_string());
            if (field == nullptr || field->is_null()) {
                if (!member.optional) {
                    return RpcError::protocol("structure lacks member " +
                                              member.name.to_string());
                }
                continue;
            }
            auto decoded = member.codec->decode(*field, ctx);
            if (is_err(decoded)) {
                return decoded;
            }
            record.emplace(member.name, std::move(unwrap(decoded)));
        }
        return std::any(std::move(record));
    }

private:
    std::vector<Member<Decoder>> members_;
};

// ============================================================================
// Interface References
// ============================================================================

class InterfaceCodec : public Encoder, public Decoder {
public:
    explicit InterfaceCodec(const runtime::InterfaceBinding& binding) : binding_(binding) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        const auto& proxy = expect<Rc<runtime::Proxy>>(value, "interface");
        if (!proxy) {
            throw std::invalid_argument("null proxy for " + binding_.type_name().to_string());
        }
        auto endpoint = ctx.locate(binding_, proxy);
        if (is_err(endpoint)) {
            return unwrap_err(endpoint);
        }
        return WireValue(unwrap(endpoint).to_string());
    }

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        if (!value.is_string()) {
            return mismatch("endpoint", value);
        }
        auto endpoint = net::Endpoint::parse(value.as_string());
        if (is_err(endpoint)) {
            return RpcError::protocol("bad endpoint: " + unwrap_err(endpoint));
        }
        auto proxy = ctx.elaborate(binding_, unwrap(endpoint));
        if (is_err(proxy)) {
            return unwrap_err(proxy);
        }
        return std::any(std::move(unwrap(proxy)));
    }

private:
    const runtime::InterfaceBinding& binding_;
};

// ============================================================================
// Named References
// ============================================================================

/// Builds the codec of a resolved named type on first use.
template <typename Codec> class Deferred {
public:
    using Build = std::function<Result<Rc<const Codec>, RpcError>()>;

    explicit Deferred(Build build) : build_(std::move(build)) {}

    auto get() const -> Result<Rc<const Codec>, RpcError> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (codec_) {
            return codec_;
        }
        auto built = build_();
        if (is_ok(built)) {
            codec_ = unwrap(built);
        }
        return built;
    }

private:
    Build build_;
    mutable std::mutex mutex_;
    mutable Rc<const Codec> codec_;
};

class ReferenceEncoder : public Encoder {
public:
    explicit ReferenceEncoder(Deferred<Encoder>::Build build) : target_(std::move(build)) {}

    auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<WireValue, RpcError> override {
        auto codec = target_.get();
        if (is_err(codec)) {
            return unwrap_err(codec);
        }
        return unwrap(codec)->encode(value, ctx);
    }

private:
    Deferred<Encoder> target_;
};

class ReferenceDecoder : public Decoder {
public:
    explicit ReferenceDecoder(Deferred<Decoder>::Build build) : target_(std::move(build)) {}

    auto decode(const WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> override {
        auto codec = target_.get();
        if (is_err(codec)) {
            return unwrap_err(codec);
        }
        return unwrap(codec)->decode(value, ctx);
    }

private:
    Deferred<Decoder> target_;
};

auto interface_binding(const types::TypeRecord& record) -> const runtime::InterfaceBinding& {
    const auto* binding = dynamic_cast<const runtime::InterfaceBinding*>(record.native);
    if (binding == nullptr) {
        throw std::runtime_error("interface " + record.name.to_string() +
                                 " has no native binding");
    }
    return *binding;
}

} // namespace

void StandardCodecs::register_codec(const ExternalName& type_name, Rc<const Encoder> encoder,
                                    Rc<const Decoder> decoder) {
    std::unique_lock lock(mutex_);
    registered_.insert_or_assign(type_name, Pair{std::move(encoder), std::move(decoder)});
}

auto StandardCodecs::registered(const ExternalName& type_name) const -> std::optional<Pair> {
    std::shared_lock lock(mutex_);
    auto it = registered_.find(type_name);
    if (it == registered_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto StandardCodecs::check_reachable(const types::TypeRecord& target)
    -> Result<bool, RpcError> {
    Visited visited;
    visited.emplace(target.type, target.scope);
    return check_references(*target.type, target.scope, visited);
}

auto StandardCodecs::check_references(const model::Type& type, scope::ScopeId scope,
                                      Visited& visited) -> Result<bool, RpcError> {
    using Kind = model::Type::Kind;
    switch (type.kind) {
    case Kind::Builtin:
    case Kind::Enumeration:
    case Kind::Interface:
        return true;
    case Kind::Sequence:
    case Kind::Set:
        return check_references(*type.element, scope, visited);
    case Kind::Map: {
        auto key = check_references(*type.key, scope, visited);
        if (is_err(key)) {
            return key;
        }
        return check_references(*type.element, scope, visited);
    }
    case Kind::Structure:
        for (const auto& field : type.members) {
            auto member = check_references(*field.type, scope, visited);
            if (is_err(member)) {
                return member;
            }
        }
        return true;
    case Kind::Reference:
        break;
    }

    if (registered(*type.target)) {
        return true;
    }
    auto record = resolver_.resolve(*type.target, scope);
    if (is_err(record)) {
        return unwrap_err(record);
    }
    const auto& target = unwrap(record);
    if (target.type->kind == Kind::Interface) {
        interface_binding(target);
        return true;
    }
    if (!visited.emplace(target.type, target.scope).second) {
        return true;
    }
    return check_references(*target.type, target.scope, visited);
}

auto StandardCodecs::encoder_for(const model::Type& type, scope::ScopeId scope)
    -> Result<Rc<const Encoder>, RpcError> {
    using Kind = model::Type::Kind;
    switch (type.kind) {
    case Kind::Builtin:
        return Rc<const Encoder>(make_rc<BuiltinCodec>(type));
    case Kind::Sequence:
    case Kind::Set: {
        auto element = encoder_for(*type.element, scope);
        if (is_err(element)) {
            return element;
        }
        if (type.kind == Kind::Set) {
            return Rc<const Encoder>(make_rc<SetEncoder>(std::move(unwrap(element))));
        }
        return Rc<const Encoder>(make_rc<SequenceEncoder>(std::move(unwrap(element))));
    }
    case Kind::Map: {
        auto key = encoder_for(*type.key, scope);
        if (is_err(key)) {
            return key;
        }
        auto value = encoder_for(*type.element, scope);
        if (is_err(value)) {
            return value;
        }
        return Rc<const Encoder>(
            make_rc<MapEncoder>(std::move(unwrap(key)), std::move(unwrap(value))));
    }
    case Kind::Enumeration:
        return Rc<const Encoder>(make_rc<EnumerationCodec>(type.constants));
    case Kind::Structure: {
        std::vector<Member<Encoder>> members;
        for (const auto& field : type.members) {
            auto codec = encoder_for(*field.type, scope);
            if (is_err(codec)) {
                return codec;
            }
            members.push_back({field.name, field.optional, std::move(unwrap(codec))});
        }
        return Rc<const Encoder>(make_rc<RecordEncoder>(std::move(members)));
    }
    case Kind::Interface:
        throw std::runtime_error("an interface can only be passed by reference");
    case Kind::Reference:
        break;
    }

    if (auto custom = registered(*type.target)) {
        return custom->first;
    }
    auto record = resolver_.resolve(*type.target, scope);
    if (is_err(record)) {
        return unwrap_err(record);
    }
    const auto& target = unwrap(record);
    if (target.type->kind == Kind::Interface) {
        return Rc<const Encoder>(make_rc<InterfaceCodec>(interface_binding(target)));
    }
    auto reachable = check_reachable(target);
    if (is_err(reachable)) {
        return unwrap_err(reachable);
    }
    const model::Type* target_type = target.type;
    scope::ScopeId target_scope = target.scope;
    return Rc<const Encoder>(make_rc<ReferenceEncoder>(
        [this, target_type, target_scope] { return encoder_for(*target_type, target_scope); }));
}

auto StandardCodecs::decoder_for(const model::Type& type, scope::ScopeId scope)
    -> Result<Rc<const Decoder>, RpcError> {
    using Kind = model::Type::Kind;
    switch (type.kind) {
    case Kind::Builtin:
        return Rc<const Decoder>(make_rc<BuiltinCodec>(type));
    case Kind::Sequence:
    case Kind::Set: {
        auto element = decoder_for(*type.element, scope);
        if (is_err(element)) {
            return element;
        }
        if (type.kind == Kind::Set) {
            return Rc<const Decoder>(make_rc<SetDecoder>(std::move(unwrap(element))));
        }
        return Rc<const Decoder>(make_rc<SequenceDecoder>(std::move(unwrap(element))));
    }
    case Kind::Map: {
        auto key = decoder_for(*type.key, scope);
        if (is_err(key)) {
            return key;
        }
        auto value = decoder_for(*type.element, scope);
        if (is_err(value)) {
            return value;
        }
        return Rc<const Decoder>(
            make_rc<MapDecoder>(std::move(unwrap(key)), std::move(unwrap(value))));
    }
    case Kind::Enumeration:
        return Rc<const Decoder>(make_rc<EnumerationCodec>(type.constants));
    case Kind::Structure: {
        std::vector<Member<Decoder>> members;
        for (const auto& field : type.members) {
            auto codec = decoder_for(*field.type, scope);
            if (is_err(codec)) {
                return codec;
            }
            members.push_back({field.name, field.optional, std::move(unwrap(codec))});
        }
        return Rc<const Decoder>(make_rc<RecordDecoder>(std::move(members)));
    }
    case Kind::Interface:
        throw std::runtime_error("an interface can only be passed by reference");
    case Kind::Reference:
        break;
    }

    if (auto custom = registered(*type.target)) {
        return custom->second;
    }
    auto record = resolver_.resolve(*type.target, scope);
    if (is_err(record)) {
        return unwrap_err(record);
    }
    const auto& target = unwrap(record);
    if (target.type->kind == Kind::Interface) {
        return Rc<const Decoder>(make_rc<InterfaceCodec>(interface_binding(target)));
    }
    auto reachable = check_reachable(target);
    if (is_err(reachable)) {
        return unwrap_err(reachable);
    }
    const model::Type* target_type = target.type;
    scope::ScopeId target_scope = target.scope;
    return Rc<const Decoder>(make_rc<ReferenceDecoder>(
        [this, target_type, target_scope] { return decoder_for(*target_type, target_scope); }));
}

} // namespace carp::codec
