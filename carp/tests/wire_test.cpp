//! # Wire Value Tests
//!
//! Construction, parsing, serialization and error reporting of the wire
//! value tree.

#include "common.hpp"

#include "wire/wire.hpp"
#include <gtest/gtest.h>

using namespace carp;
using namespace carp::wire;

// ============================================================================
// Construction
// ============================================================================

TEST(WireValueTest, DefaultIsNull) {
    WireValue v;
    EXPECT_TRUE(v.is_null());
    EXPECT_STREQ(v.type_name(), "null");
}

TEST(WireValueTest, ObjectSetAndGet) {
    WireValue obj{WireObject{}};
    obj.set("host", WireValue("example.org"));
    obj.set("port", WireValue(static_cast<int64_t>(443)));

    ASSERT_NE(obj.get("host"), nullptr);
    EXPECT_EQ(obj.get("host")->as_string(), "example.org");
    EXPECT_EQ(obj.get("port")->as_i64(), 443);
    EXPECT_EQ(obj.get("missing"), nullptr);
    EXPECT_EQ(obj.size(), 2u);
}

TEST(WireValueTest, CloneIsDeepAndEqual) {
    WireValue arr{WireArray{}};
    arr.push(WireValue(1));
    arr.push(WireValue("two"));

    WireValue copy = arr.clone();
    EXPECT_TRUE(copy == arr);
    copy.push(WireValue(true));
    EXPECT_FALSE(copy == arr);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(WireParserTest, ParsesResponseEnvelope) {
    auto result = parse_wire(R"({"rsp-type":"ok","rsp":{"echo":"hi"},"prints":[]})");
    ASSERT_TRUE(is_ok(result));
    auto& body = unwrap(result);
    ASSERT_TRUE(body.is_object());
    EXPECT_EQ(body.get("rsp-type")->as_string(), "ok");
    EXPECT_EQ(body.get("rsp")->get("echo")->as_string(), "hi");
    EXPECT_TRUE(body.get("prints")->is_array());
    EXPECT_EQ(body.get("prints")->size(), 0u);
}

TEST(WireParserTest, KeepsIntegerPrecision) {
    auto result = parse_wire("[9007199254740993, 18446744073709551615, 2.5]");
    ASSERT_TRUE(is_ok(result));
    const auto& arr = unwrap(result).as_array();
    ASSERT_TRUE(arr[0].try_as_i64().has_value());
    EXPECT_EQ(*arr[0].try_as_i64(), 9007199254740993LL);
    ASSERT_TRUE(arr[1].try_as_u64().has_value());
    EXPECT_EQ(*arr[1].try_as_u64(), 18446744073709551615ULL);
    EXPECT_FALSE(arr[1].try_as_i64().has_value());
    EXPECT_DOUBLE_EQ(arr[2].as_f64(), 2.5);
    EXPECT_FALSE(arr[2].is_integer());
}

TEST(WireParserTest, DecodesUnicodeEscapes) {
    auto result = parse_wire(R"("café 😀")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "caf\xc3\xa9 \xf0\x9f\x98\x80");
}

TEST(WireParserTest, ReportsLineAndColumn) {
    auto result = parse_wire("{\n  \"a\": tru\n}");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).line, 2u);
}

TEST(WireParserTest, RejectsTrailingContent) {
    EXPECT_TRUE(is_err(parse_wire("{} {}")));
}

TEST(WireParserTest, RejectsExcessiveNesting) {
    std::string deep(WireParser::MAX_DEPTH + 1, '[');
    deep += std::string(WireParser::MAX_DEPTH + 1, ']');
    EXPECT_TRUE(is_err(parse_wire(deep)));
}

TEST(WireParserTest, RejectsMalformedBodies) {
    EXPECT_TRUE(is_err(parse_wire("")));
    EXPECT_TRUE(is_err(parse_wire("<html>")));
    EXPECT_TRUE(is_err(parse_wire(R"({"a":1,})")));
    EXPECT_TRUE(is_err(parse_wire(R"("unterminated)")));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(WireWriterTest, ObjectsSerializeInKeyOrder) {
    WireValue req{WireObject{}};
    req.set("req-type", WireValue("say"));
    req.set("prints", WireValue(WireArray{}));
    req.set("req", WireValue(WireObject{}));
    EXPECT_EQ(req.to_string(), R"({"prints":[],"req":{},"req-type":"say"})");
}

TEST(WireWriterTest, EscapesControlCharacters) {
    WireValue s("line\n\"quoted\"\t\x01");
    EXPECT_EQ(s.to_string(), R"("line\n\"quoted\"\t\u0001")");
}

TEST(WireWriterTest, ReparsesToEqualTree) {
    auto parsed = parse_wire(R"({"a":[1,2.5,true,null,"x"],"b":{"c":-7}})");
    ASSERT_TRUE(is_ok(parsed));
    auto again = parse_wire(unwrap(parsed).to_string());
    ASSERT_TRUE(is_ok(again));
    EXPECT_TRUE(unwrap(again) == unwrap(parsed));
}
