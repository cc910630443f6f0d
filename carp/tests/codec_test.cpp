//! # Codec Tests
//!
//! Conversion of native values to and from wire values through the
//! standard codec factory.

#include "codec/std_codecs.hpp"
#include "wire/wire.hpp"

#include <gtest/gtest.h>

using namespace carp;
using namespace carp::codec;
using carp::wire::WireValue;

namespace {

const char* SHAPES_DESCRIPTOR = R"({
  "module": "shapes",
  "types": {
    "point": {"structure": [
      {"name": "x", "type": "integer"},
      {"name": "label", "type": "string", "optional": true}]},
    "colour": {"enumeration": ["red", "dark-green"]},
    "path": {"sequence": "point"},
    "node": {"structure": [
      {"name": "value", "type": "real"},
      {"name": "next", "type": "node", "optional": true}]},
    "dangling": {"structure": [{"name": "to", "type": "shapes.nowhere"}]},
    "trail": {"sequence": "dangling"},
    "chain": {"structure": [
      {"name": "rest", "type": "links", "optional": true},
      {"name": "end", "type": "dangling", "optional": true}]},
    "links": {"sequence": "chain"},
    "tree": {"structure": [{"name": "children", "type": "forest"}]},
    "forest": {"map": {"key": "string", "value": "tree"}},
    "octet": {"integer": {"min": 0, "max": 255}},
    "tags": {"set": "colour"},
    "scores": {"map": {"key": "string", "value": "octet"}},
    "stamp": "uuid",
    "echoer": {"interface": {"calls": {}}}
  }
})";

class NoProxies : public EncodingContext, public DecodingContext {
public:
    explicit NoProxies(net::FingerprintTable& prints)
        : EncodingContext(prints), DecodingContext(prints) {}

    auto locate(const runtime::InterfaceBinding&, const Rc<runtime::Proxy>&)
        -> Result<net::Endpoint, RpcError> override {
        return RpcError::remote_invocation("no proxies here");
    }

    auto elaborate(const runtime::InterfaceBinding&, const net::Endpoint&)
        -> Result<Rc<runtime::Proxy>, RpcError> override {
        return RpcError::remote_invocation("no proxies here");
    }
};

auto named(const char* name) -> Rc<const model::Type> {
    return model::Type::reference_to(ExternalName::of(name));
}

/// Writes every integer as a decimal string.
class IntegerAsText : public Encoder, public Decoder {
public:
    auto encode(const std::any& value, EncodingContext&) const
        -> Result<WireValue, RpcError> override {
        return WireValue(std::to_string(std::any_cast<int64_t>(value)));
    }

    auto decode(const WireValue& value, DecodingContext&) const
        -> Result<std::any, RpcError> override {
        return std::any(static_cast<int64_t>(std::stoll(value.as_string())));
    }
};

} // namespace

class CodecTest : public ::testing::Test {
protected:
    CodecTest() : resolver(arena), codecs(resolver), ctx(prints) {
        auto source = std::make_unique<scope::InMemoryDescriptorSource>();
        source->add(ExternalName::of("shapes"), SHAPES_DESCRIPTOR);
        root = arena.add_root("root", std::move(source));
    }

    auto encode(const model::Type& type, const std::any& value) -> Result<WireValue, RpcError> {
        auto encoder = codecs.encoder_for(type, root);
        if (is_err(encoder)) {
            return unwrap_err(encoder);
        }
        return unwrap(encoder)->encode(value, ctx);
    }

    auto decode(const model::Type& type, std::string_view text) -> Result<std::any, RpcError> {
        auto decoder = codecs.decoder_for(type, root);
        if (is_err(decoder)) {
            return unwrap_err(decoder);
        }
        auto parsed = wire::parse_wire(text);
        EXPECT_TRUE(is_ok(parsed));
        return unwrap(decoder)->decode(unwrap(parsed), ctx);
    }

    scope::ScopeArena arena;
    types::TypeResolver resolver;
    StandardCodecs codecs;
    net::FingerprintTable prints;
    NoProxies ctx;
    scope::ScopeId root = 0;
};

// ============================================================================
// Builtins
// ============================================================================

TEST_F(CodecTest, BuiltinsEncode) {
    using model::Builtin;
    auto text = encode(*model::Type::of_builtin(Builtin::String), std::any(std::string("hi")));
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text).to_string(), "\"hi\"");

    auto number = encode(*model::Type::of_builtin(Builtin::Integer), std::any(int64_t{-7}));
    ASSERT_TRUE(is_ok(number));
    EXPECT_EQ(unwrap(number).as_i64(), -7);

    auto flag = encode(*model::Type::of_builtin(Builtin::Boolean), std::any(true));
    ASSERT_TRUE(is_ok(flag));
    EXPECT_TRUE(unwrap(flag).as_bool());
}

TEST_F(CodecTest, BuiltinsDecode) {
    using model::Builtin;
    auto real = decode(*model::Type::of_builtin(Builtin::Real), "2");
    ASSERT_TRUE(is_ok(real));
    EXPECT_DOUBLE_EQ(std::any_cast<double>(unwrap(real)), 2.0);

    auto id = decode(*named("shapes.stamp"), R"("123e4567-e89b-12d3-a456-426614174000")");
    ASSERT_TRUE(is_ok(id));
    EXPECT_EQ(std::any_cast<Uuid>(unwrap(id)).to_string(),
              "123e4567-e89b-12d3-a456-426614174000");
}

TEST_F(CodecTest, WrongWireShapeIsProtocolError) {
    using model::Builtin;
    auto number = decode(*model::Type::of_builtin(Builtin::Integer), "\"12\"");
    ASSERT_TRUE(is_err(number));
    EXPECT_TRUE(unwrap_err(number).is(RpcError::Kind::Protocol));

    auto fraction = decode(*model::Type::of_builtin(Builtin::Integer), "1.5");
    ASSERT_TRUE(is_err(fraction));

    auto id = decode(*model::Type::of_builtin(Builtin::Uuid), "\"not-a-uuid\"");
    ASSERT_TRUE(is_err(id));
    EXPECT_TRUE(unwrap_err(id).is(RpcError::Kind::Protocol));
}

TEST_F(CodecTest, WrongNativeTypeThrows) {
    EXPECT_THROW((void)encode(*model::Type::of_builtin(model::Builtin::String), std::any(42)),
                 std::invalid_argument);
}

// ============================================================================
// Composite Types
// ============================================================================

TEST_F(CodecTest, StructureWithOptionalMember) {
    Record point;
    point.emplace(ExternalName::of("x"), int64_t{3});
    auto encoded = encode(*named("shapes.point"), std::any(point));
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded).to_string(), R"({"x":3})");

    auto decoded = decode(*named("shapes.point"), R"({"x":4,"label":"far"})");
    ASSERT_TRUE(is_ok(decoded));
    const auto& record = std::any_cast<const Record&>(unwrap(decoded));
    EXPECT_EQ(std::any_cast<int64_t>(record.at(ExternalName::of("x"))), 4);
    EXPECT_EQ(std::any_cast<std::string>(record.at(ExternalName::of("label"))), "far");
}

TEST_F(CodecTest, StructureMissingRequiredMember) {
    auto decoded = decode(*named("shapes.point"), R"({"label":"far"})");
    ASSERT_TRUE(is_err(decoded));
    EXPECT_TRUE(unwrap_err(decoded).is(RpcError::Kind::Protocol));

    EXPECT_THROW((void)encode(*named("shapes.point"), std::any(Record{})), std::invalid_argument);
}

TEST_F(CodecTest, SequenceOfStructures) {
    auto decoded = decode(*named("shapes.path"), R"([{"x":1},{"x":2}])");
    ASSERT_TRUE(is_ok(decoded));
    const auto& items = std::any_cast<const Sequence&>(unwrap(decoded));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(std::any_cast<int64_t>(
                  std::any_cast<const Record&>(items[1]).at(ExternalName::of("x"))),
              2);

    auto wrong = decode(*named("shapes.path"), R"({"x":1})");
    ASSERT_TRUE(is_err(wrong));
}

TEST_F(CodecTest, Enumeration) {
    auto encoded = encode(*named("shapes.colour"), std::any(std::string("dark-green")));
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded).as_string(), "dark-green");

    auto unknown = decode(*named("shapes.colour"), "\"blue\"");
    ASSERT_TRUE(is_err(unknown));
    EXPECT_TRUE(unwrap_err(unknown).is(RpcError::Kind::Protocol));

    EXPECT_THROW((void)encode(*named("shapes.colour"), std::any(std::string("blue"))),
                 std::invalid_argument);
}

TEST_F(CodecTest, RecursiveStructure) {
    auto decoded = decode(*named("shapes.node"),
                          R"({"value":1,"next":{"value":2,"next":{"value":3}}})");
    ASSERT_TRUE(is_ok(decoded));

    const Record* node = &std::any_cast<const Record&>(unwrap(decoded));
    int depth = 1;
    while (node->count(ExternalName::of("next")) != 0) {
        node = &std::any_cast<const Record&>(node->at(ExternalName::of("next")));
        ++depth;
    }
    EXPECT_EQ(depth, 3);
    EXPECT_DOUBLE_EQ(std::any_cast<double>(node->at(ExternalName::of("value"))), 3.0);
}

TEST_F(CodecTest, BoundedInteger) {
    auto inside = decode(*named("shapes.octet"), "255");
    ASSERT_TRUE(is_ok(inside));
    EXPECT_EQ(std::any_cast<int64_t>(unwrap(inside)), 255);

    auto above = decode(*named("shapes.octet"), "256");
    ASSERT_TRUE(is_err(above));
    EXPECT_TRUE(unwrap_err(above).is(RpcError::Kind::Protocol));
    EXPECT_NE(unwrap_err(above).message.find("256 out of range [0,255]"), std::string::npos);

    EXPECT_THROW((void)encode(*named("shapes.octet"), std::any(int64_t{-1})),
                 std::invalid_argument);

    auto open_top = model::Type::bounded_integer(10, std::nullopt);
    auto large = encode(*open_top, std::any(int64_t{1} << 40));
    ASSERT_TRUE(is_ok(large));
    auto small = decode(*open_top, "9");
    ASSERT_TRUE(is_err(small));
    EXPECT_NE(unwrap_err(small).message.find("[10,inf]"), std::string::npos);
}

TEST_F(CodecTest, SetDropsDuplicates) {
    Set colours{std::string("red"), std::string("dark-green"), std::string("red")};
    auto encoded = encode(*named("shapes.tags"), std::any(colours));
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded).to_string(), R"(["red","dark-green"])");

    auto decoded = decode(*named("shapes.tags"), R"(["dark-green","dark-green","red"])");
    ASSERT_TRUE(is_ok(decoded));
    const auto& items = std::any_cast<const Set&>(unwrap(decoded));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(std::any_cast<std::string>(items[0]), "dark-green");

    auto unknown = decode(*named("shapes.tags"), R"(["blue"])");
    ASSERT_TRUE(is_err(unknown));
    EXPECT_TRUE(unwrap_err(unknown).is(RpcError::Kind::Protocol));
}

TEST_F(CodecTest, MapTravelsAsPairs) {
    Map scores;
    scores.emplace_back(std::string("ada"), int64_t{7});
    scores.emplace_back(std::string("bob"), int64_t{9});
    auto encoded = encode(*named("shapes.scores"), std::any(scores));
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded).to_string(), R"([["ada",7],["bob",9]])");

    auto decoded = decode(*named("shapes.scores"), R"([["ada",1],["bob",2],["ada",3]])");
    ASSERT_TRUE(is_ok(decoded));
    const auto& entries = std::any_cast<const Map&>(unwrap(decoded));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(std::any_cast<std::string>(entries[0].first), "ada");
    EXPECT_EQ(std::any_cast<int64_t>(entries[0].second), 3);

    scores.emplace_back(std::string("ada"), int64_t{1});
    EXPECT_THROW((void)encode(*named("shapes.scores"), std::any(scores)), std::invalid_argument);
}

TEST_F(CodecTest, MalformedMapEntriesAreProtocolErrors) {
    const char* bad[] = {R"({"ada":1})", R"([["ada"]])", R"([["ada",1,2]])", R"([["ada",300]])"};
    for (const char* text : bad) {
        auto decoded = decode(*named("shapes.scores"), text);
        ASSERT_TRUE(is_err(decoded)) << text;
        EXPECT_TRUE(unwrap_err(decoded).is(RpcError::Kind::Protocol)) << text;
    }
}

// ============================================================================
// Resolution
// ============================================================================

TEST_F(CodecTest, UndefinedReferenceFailsWhenBuilt) {
    auto encoder = codecs.encoder_for(*named("shapes.dangling"), root);
    ASSERT_TRUE(is_err(encoder));
    EXPECT_TRUE(unwrap_err(encoder).is(RpcError::Kind::MissingType));
    EXPECT_FALSE(unwrap_err(encoder).module_missing);

    auto decoder = codecs.decoder_for(*named("elsewhere.thing"), root);
    ASSERT_TRUE(is_err(decoder));
    EXPECT_TRUE(unwrap_err(decoder).module_missing);
}

TEST_F(CodecTest, UndefinedReferenceBehindOtherNamesFailsWhenBuilt) {
    auto trail = codecs.decoder_for(*named("shapes.trail"), root);
    ASSERT_TRUE(is_err(trail));
    EXPECT_TRUE(unwrap_err(trail).is(RpcError::Kind::MissingType));

    // Reached only through a cycle of named types
    auto chain = codecs.encoder_for(*model::Type::sequence_of(named("shapes.chain")), root);
    ASSERT_TRUE(is_err(chain));
    EXPECT_TRUE(unwrap_err(chain).is(RpcError::Kind::MissingType));
}

TEST_F(CodecTest, RecursiveTypesThroughMapsResolveCompletely) {
    auto encoder = codecs.encoder_for(*named("shapes.tree"), root);
    ASSERT_TRUE(is_ok(encoder));

    auto decoded = decode(*named("shapes.tree"),
                          R"({"children":[["a",{"children":[]}],["b",{"children":[]}]]})");
    ASSERT_TRUE(is_ok(decoded));
    const auto& tree = std::any_cast<const Record&>(unwrap(decoded));
    const auto& children = std::any_cast<const Map&>(tree.at(ExternalName::of("children")));
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(std::any_cast<std::string>(children[1].first), "b");
}

TEST_F(CodecTest, InterfaceWithoutBindingThrows) {
    EXPECT_THROW((void)codecs.encoder_for(*named("shapes.echoer"), root), std::runtime_error);
}

TEST_F(CodecTest, RegisteredCodecOverridesGenericForm) {
    auto custom = make_rc<IntegerAsText>();
    codecs.register_codec(ExternalName::of("shapes.point"), custom, custom);

    auto encoded = encode(*named("shapes.point"), std::any(int64_t{12}));
    ASSERT_TRUE(is_ok(encoded));
    EXPECT_EQ(unwrap(encoded).as_string(), "12");

    // Also applies where the type is reached through a sequence
    auto decoded = decode(*named("shapes.path"), R"(["5","6"])");
    ASSERT_TRUE(is_ok(decoded));
    const auto& items = std::any_cast<const Sequence&>(unwrap(decoded));
    EXPECT_EQ(std::any_cast<int64_t>(items[0]), 5);
}
