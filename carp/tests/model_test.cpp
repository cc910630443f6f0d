//! # Module Descriptor Tests
//!
//! Parsing of `carp.module.json` into a module definition.

#include "model/module_definition.hpp"

#include <gtest/gtest.h>

using namespace carp;
using namespace carp::model;

namespace {

const char* ECHO_DESCRIPTOR = R"({
  "module": "org.example.echo",
  "types": {
    "echoer": {"interface": {"calls": {
      "say": {"params": [{"name": "msg", "type": "string"}],
              "responses": {"ok": [{"name": "echo", "type": "string"}],
                            "busy": []}},
      "reset": {}}}},
    "point": {"structure": [{"name": "x", "type": "integer"},
                            {"name": "y", "type": "integer", "optional": true}]},
    "colour": {"enumeration": ["red", "dark-green"]},
    "names": {"sequence": "string"},
    "alias": "point",
    "elsewhere": "org.other.thing"}})";

auto load(const char* module, const char* text) -> Result<ModuleDefinition, RpcError> {
    return load_module_descriptor(ExternalName::of(module), text);
}

} // namespace

TEST(ModuleLoaderTest, LoadsEveryTypeKind) {
    auto loaded = load("org.example.echo", ECHO_DESCRIPTOR);
    ASSERT_TRUE(is_ok(loaded)) << unwrap_err(loaded);
    const auto& def = unwrap(loaded);

    EXPECT_EQ(def.native_target, "org::example::echo");
    EXPECT_EQ(def.types.size(), 6u);

    const Type* echoer = def.find(ExternalName::of("org.example.echo.echoer"));
    ASSERT_NE(echoer, nullptr);
    EXPECT_EQ(echoer->kind, Type::Kind::Interface);
    EXPECT_TRUE(echoer->must_be_native());
    const auto& say = echoer->calls.at(ExternalName::of("say"));
    ASSERT_EQ(say.params.size(), 1u);
    EXPECT_EQ(say.params[0].name.to_string(), "msg");
    EXPECT_EQ(say.params[0].type->describe(), "string");
    EXPECT_EQ(say.responses.size(), 2u);
    EXPECT_TRUE(say.responses.at(ExternalName::of("busy")).fields.empty());
    EXPECT_TRUE(echoer->calls.at(ExternalName::of("reset")).responses.empty());

    const Type* point = def.find(ExternalName::of("org.example.echo.point"));
    ASSERT_NE(point, nullptr);
    ASSERT_EQ(point->members.size(), 2u);
    EXPECT_FALSE(point->members[0].optional);
    EXPECT_TRUE(point->members[1].optional);

    const Type* colour = def.find(ExternalName::of("org.example.echo.colour"));
    ASSERT_NE(colour, nullptr);
    ASSERT_EQ(colour->constants.size(), 2u);
    EXPECT_EQ(colour->constants[1].as_native_constant_name(), "DARK_GREEN");

    const Type* names = def.find(ExternalName::of("org.example.echo.names"));
    ASSERT_NE(names, nullptr);
    EXPECT_EQ(names->describe(), "sequence<string>");
    EXPECT_FALSE(names->must_be_native());
}

TEST(ModuleLoaderTest, LeafReferencesAreModuleRelative) {
    auto loaded = load("org.example.echo", ECHO_DESCRIPTOR);
    ASSERT_TRUE(is_ok(loaded));
    const auto& def = unwrap(loaded);

    const Type* alias = def.find(ExternalName::of("org.example.echo.alias"));
    ASSERT_NE(alias, nullptr);
    EXPECT_EQ(alias->kind, Type::Kind::Reference);
    EXPECT_EQ(alias->target->to_string(), "org.example.echo.point");

    const Type* elsewhere = def.find(ExternalName::of("org.example.echo.elsewhere"));
    ASSERT_NE(elsewhere, nullptr);
    EXPECT_EQ(elsewhere->target->to_string(), "org.other.thing");
}

TEST(ModuleLoaderTest, CollectionsAndBoundedIntegers) {
    auto loaded = load("m", R"({"module":"m","types":{
        "tags": {"set": "string"},
        "scores": {"map": {"key": "string", "value": "octet"}},
        "octet": {"integer": {"min": 0, "max": 255}},
        "positive": {"integer": {"min": 1}},
        "any": {"integer": {}}}})");
    ASSERT_TRUE(is_ok(loaded)) << unwrap_err(loaded);
    const auto& def = unwrap(loaded);

    const Type* tags = def.find(ExternalName::of("m.tags"));
    ASSERT_NE(tags, nullptr);
    EXPECT_EQ(tags->kind, Type::Kind::Set);
    EXPECT_EQ(tags->describe(), "set<string>");
    EXPECT_FALSE(tags->must_be_native());

    const Type* scores = def.find(ExternalName::of("m.scores"));
    ASSERT_NE(scores, nullptr);
    EXPECT_EQ(scores->kind, Type::Kind::Map);
    EXPECT_EQ(scores->describe(), "map<string,m.octet>");

    const Type* octet = def.find(ExternalName::of("m.octet"));
    ASSERT_NE(octet, nullptr);
    EXPECT_EQ(octet->describe(), "integer[0,255]");
    EXPECT_TRUE(octet->in_range(0));
    EXPECT_FALSE(octet->in_range(256));

    const Type* positive = def.find(ExternalName::of("m.positive"));
    ASSERT_NE(positive, nullptr);
    EXPECT_EQ(positive->range_text(), "[1,inf]");
    EXPECT_FALSE(positive->in_range(0));

    EXPECT_EQ(def.find(ExternalName::of("m.any"))->describe(), "integer");
}

TEST(ModuleLoaderTest, ExplicitNativeTarget) {
    auto loaded = load("m", R"({"module":"m","native-target":"gen::m","types":{}})");
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).native_target, "gen::m");
}

TEST(ModuleLoaderTest, MalformedDescriptorsAreResourceErrors) {
    const char* bad[] = {
        "not json",
        "[]",
        R"({"types":{}})",
        R"({"module":"other","types":{}})",
        R"({"module":"m"})",
        R"({"module":"m","types":{"a.b":"string"}})",
        R"({"module":"m","types":{"t":{"tuple":[]}}})",
        R"({"module":"m","types":{"t":{"structure":[{"name":"x"}]}}})",
        R"({"module":"m","types":{"t":{"structure":[{"name":"x","type":"string","optional":1}]}}})",
        R"({"module":"m","types":{"t":{"interface":{}}}})",
        R"({"module":"m","types":{"t":{"map":{"key":"string"}}}})",
        R"({"module":"m","types":{"t":{"set":{"tuple":[]}}}})",
        R"({"module":"m","types":{"t":{"integer":{"min":"0"}}}})",
        R"({"module":"m","types":{"t":{"integer":{"min":5,"max":4}}}})",
        R"({"module":"m","types":{"t":{"integer":[0,4]}}})",
    };
    for (const char* text : bad) {
        auto loaded = load("m", text);
        ASSERT_TRUE(is_err(loaded)) << text;
        EXPECT_TRUE(unwrap_err(loaded).is(RpcError::Kind::Resource)) << text;
    }
}
