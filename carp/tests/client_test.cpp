//! # Client Tests
//!
//! Calls made through proxies of a client presence against a scripted
//! transport, covering request shape, response construction, the empty
//! body rule, error outcomes, interface references with their fingerprints,
//! and the proxy and translator caches.

#include "net/fingerprint_repository.hpp"
#include "runtime/client_presence.hpp"
#include "wire/wire.hpp"

#include <atomic>
#include <deque>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace carp;
using namespace carp::runtime;

namespace {

const char* ECHO_DESCRIPTOR = R"({
  "module": "org.example.echo",
  "types": {
    "echoer": {"interface": {"calls": {
      "say": {"params": [{"name": "msg", "type": "string"}],
              "responses": {"ok": [{"name": "echo", "type": "string"}]}},
      "peek": {"responses": {"seen": [{"name": "count", "type": "integer", "optional": true},
                                      {"name": "last", "type": "string", "optional": true}]}},
      "reset": {},
      "ping": {"responses": {"pong": []}},
      "choose": {"responses": {"left": [], "right": []}},
      "refer": {"params": [{"name": "other", "type": "echoer"}],
                "responses": {"ok": [{"name": "next", "type": "echoer"}]}}}}},
    "lister": {"interface": {"calls": {
      "list": {"params": [{"name": "items", "type": {"sequence": "entry"}}]}}}},
    "entry": {"structure": [{"name": "origin", "type": "org.example.echo.gone"}]}
  }
})";

// ============================================================================
// Scripted Transport
// ============================================================================

struct SentRequest {
    std::string endpoint;
    std::string content_type;
    std::string body;
};

class ScriptedTransport : public TransportClient {
public:
    void answer(int code, std::string body, std::string content_type = "application/json") {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(TransportResponse{code, std::move(content_type), std::move(body)});
    }

    void fail(std::string cause) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(cause));
    }

    auto post(const net::Endpoint& endpoint, const std::string& content_type,
              const std::string& body) -> Result<TransportResponse, std::string> override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(SentRequest{endpoint.to_string(), content_type, body});
        if (script_.empty()) {
            return std::string("no scripted answer");
        }
        auto next = std::move(script_.front());
        script_.pop_front();
        return next;
    }

    auto last() -> SentRequest {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.back();
    }

    auto last_request() -> wire::WireValue {
        auto parsed = wire::parse_wire(last().body);
        EXPECT_TRUE(is_ok(parsed));
        return std::move(unwrap(parsed));
    }

private:
    std::mutex mutex_;
    std::deque<Result<TransportResponse, std::string>> script_;
    std::vector<SentRequest> sent_;
};

// ============================================================================
// Generated-style Bindings
// ============================================================================

struct SayOk {
    std::string echo;
};

class SayOkBuilder : public ResponseBuilder {
public:
    explicit SayOkBuilder(std::string echo) {
        value_.echo = std::move(echo);
    }

    auto complete() -> std::any override {
        return value_;
    }

private:
    SayOk value_;
};

struct PeekSeen {
    std::optional<int64_t> count;
    std::optional<std::string> last;
};

/// Counts how each response value of `peek` was constructed.
struct PeekCounters {
    std::atomic<int> init_done{0};
    std::atomic<int> init_setter{0};
    std::atomic<int> setter{0};
};

class PeekSeenBuilder : public ResponseBuilder {
public:
    auto complete() -> std::any override {
        return value;
    }

    PeekSeen value;
};

auto peek_field(ExternalName name, PeekCounters& counters,
                std::function<void(PeekSeen&, std::any)> assign) -> FieldBinding {
    return FieldBinding{
        std::move(name),
        [&counters, assign](std::any value) -> Box<ResponseBuilder> {
            counters.init_setter++;
            auto builder = make_box<PeekSeenBuilder>();
            assign(builder->value, std::move(value));
            return builder;
        },
        [&counters, assign](ResponseBuilder& builder, std::any value) {
            counters.setter++;
            assign(static_cast<PeekSeenBuilder&>(builder).value, std::move(value));
        }};
}

auto echoer_binding(PeekCounters& counters) -> Rc<InterfaceBinding> {
    auto n = [](const char* text) { return ExternalName::of(text); };

    CallBinding say{n("say"), {n("msg")}, {}};
    say.responses.push_back(ResponseBinding{
        n("ok"),
        [] { return std::any(SayOk{}); },
        {FieldBinding{n("echo"),
                      [](std::any value) -> Box<ResponseBuilder> {
                          return make_box<SayOkBuilder>(std::any_cast<std::string>(value));
                      },
                      [](ResponseBuilder&, std::any) {}}}});

    CallBinding peek{n("peek"), {}, {}};
    peek.responses.push_back(ResponseBinding{
        n("seen"),
        [&counters] {
            counters.init_done++;
            return std::any(PeekSeen{});
        },
        {peek_field(n("count"), counters,
                    [](PeekSeen& seen, std::any v) { seen.count = std::any_cast<int64_t>(v); }),
         peek_field(n("last"), counters, [](PeekSeen& seen, std::any v) {
             seen.last = std::any_cast<std::string>(v);
         })}});

    CallBinding reset{n("reset"), {}, {}};

    CallBinding ping{n("ping"), {}, {}};
    ping.responses.push_back(record_response(n("pong"), {}));

    CallBinding choose{n("choose"), {}, {}};
    choose.responses.push_back(record_response(n("left"), {}));
    choose.responses.push_back(record_response(n("right"), {}));

    CallBinding refer{n("refer"), {n("other")}, {}};
    refer.responses.push_back(record_response(n("ok"), {n("next")}));

    return make_rc<InterfaceBinding>(
        n("org.example.echo.echoer"),
        std::vector<CallBinding>{say, peek, reset, ping, choose, refer});
}

auto at(const char* text) -> net::Endpoint {
    return unwrap(net::Endpoint::parse(text));
}

auto call(const Rc<Proxy>& proxy, const char* name, std::vector<std::any> args = {})
    -> CallResult {
    return proxy->invoke(ExternalName::of(name), std::move(args));
}

} // namespace

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto arena = make_rc<scope::ScopeArena>();
        auto source = std::make_unique<scope::InMemoryDescriptorSource>();
        source->add(ExternalName::of("org.example.echo"), ECHO_DESCRIPTOR);
        auto root = arena->add_root("app", std::move(source));

        echoer = echoer_binding(counters);
        auto native = make_rc<scope::NativeModule>("org::example::echo");
        native->add(echoer);
        arena->register_native(root, native);

        transport = make_rc<ScriptedTransport>();
        prints = make_rc<net::InMemoryFingerprintRepository>();

        ClientConfig config;
        config.transport = transport;
        config.arena = arena;
        config.scope = root;
        config.fingerprints = prints;
        auto created = ClientPresence::create(std::move(config));
        ASSERT_TRUE(is_ok(created)) << unwrap_err(created);
        presence = unwrap(created);
    }

    void TearDown() override {
        ReclaimDaemon::instance().flush();
    }

    auto proxy(const char* endpoint) -> Rc<Proxy> {
        auto elaborated = presence->elaborate(*echoer, at(endpoint));
        EXPECT_TRUE(is_ok(elaborated));
        return unwrap(elaborated);
    }

    PeekCounters counters;
    Rc<InterfaceBinding> echoer;
    Rc<ScriptedTransport> transport;
    Rc<net::InMemoryFingerprintRepository> prints;
    Rc<ClientPresence> presence;
};

// ============================================================================
// Calls
// ============================================================================

TEST_F(ClientTest, SayRoundTrip) {
    auto echo = proxy("https://a.example/echo");
    transport->answer(200, R"({"rsp-type":"ok","rsp":{"echo":"hi"},"prints":[]})");

    auto result = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    ASSERT_TRUE(unwrap(result).has_value());
    const CallResponse& rsp = *unwrap(result);
    EXPECT_EQ(rsp.variant.to_string(), "ok");
    EXPECT_EQ(std::any_cast<SayOk>(rsp.value).echo, "hi");

    auto sent = transport->last();
    EXPECT_EQ(sent.endpoint, "https://a.example/echo");
    EXPECT_EQ(sent.content_type, "application/json");
    EXPECT_EQ(sent.body, R"({"prints":[],"req":{"msg":"hi"},"req-type":"say"})");
}

TEST_F(ClientTest, AbsentOptionalFieldsUseEmptyForm) {
    auto echo = proxy("https://a.example/echo");

    transport->answer(200, R"({"rsp-type":"seen","rsp":{}})");
    auto empty = call(echo, "peek");
    ASSERT_TRUE(is_ok(empty));
    const auto& none = std::any_cast<const PeekSeen&>(unwrap(empty)->value);
    EXPECT_FALSE(none.count.has_value());
    EXPECT_EQ(counters.init_done.load(), 1);
    EXPECT_EQ(counters.init_setter.load(), 0);
    EXPECT_EQ(counters.setter.load(), 0);

    transport->answer(200, R"({"rsp-type":"seen","rsp":{"last":"x"}})");
    auto one = call(echo, "peek");
    ASSERT_TRUE(is_ok(one));
    const auto& last_only = std::any_cast<const PeekSeen&>(unwrap(one)->value);
    ASSERT_TRUE(last_only.last.has_value());
    EXPECT_EQ(*last_only.last, "x");
    EXPECT_FALSE(last_only.count.has_value());
    EXPECT_EQ(counters.init_setter.load(), 1);
    EXPECT_EQ(counters.setter.load(), 0);

    transport->answer(200, R"({"rsp-type":"seen","rsp":{"count":2,"last":"y"}})");
    auto both = call(echo, "peek");
    ASSERT_TRUE(is_ok(both));
    const auto& seen = std::any_cast<const PeekSeen&>(unwrap(both)->value);
    ASSERT_TRUE(seen.count.has_value() && seen.last.has_value());
    EXPECT_EQ(*seen.count, 2);
    EXPECT_EQ(*seen.last, "y");
    EXPECT_EQ(counters.init_setter.load(), 2);
    EXPECT_EQ(counters.setter.load(), 1);
    EXPECT_EQ(counters.init_done.load(), 1);
}

TEST_F(ClientTest, EmptyBodyRule) {
    auto echo = proxy("https://a.example/echo");

    transport->answer(204, "", "");
    auto reset = call(echo, "reset");
    ASSERT_TRUE(is_ok(reset));
    EXPECT_FALSE(unwrap(reset).has_value());

    transport->answer(204, "", "");
    auto ping = call(echo, "ping");
    ASSERT_TRUE(is_ok(ping));
    ASSERT_TRUE(unwrap(ping).has_value());
    EXPECT_EQ(unwrap(ping)->variant.to_string(), "pong");

    transport->answer(204, "", "");
    auto choose = call(echo, "choose");
    ASSERT_TRUE(is_err(choose));
    EXPECT_TRUE(unwrap_err(choose).is(RpcError::Kind::RemoteInvocation));

    transport->answer(204, "", "");
    auto say = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(say));
    EXPECT_TRUE(unwrap_err(say).is(RpcError::Kind::RemoteInvocation));
}

TEST_F(ClientTest, ResponseMismatchesAreProtocolErrors) {
    auto echo = proxy("https://a.example/echo");

    transport->answer(200, R"({"rsp-type":"later","rsp":{}})");
    auto unknown = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(unknown));
    EXPECT_TRUE(unwrap_err(unknown).is(RpcError::Kind::Protocol));

    transport->answer(200, R"({"rsp-type":"ok","rsp":{}})");
    auto missing = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(missing));
    EXPECT_TRUE(unwrap_err(missing).is(RpcError::Kind::Protocol));

    transport->answer(200, R"({"rsp-type":"ok","rsp":{"echo":5}})");
    auto wrong = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(wrong));
    EXPECT_TRUE(unwrap_err(wrong).is(RpcError::Kind::Protocol));
}

TEST_F(ClientTest, FailureOutcomes) {
    auto echo = proxy("https://a.example/echo");

    transport->fail("connection refused");
    auto refused = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(refused));
    EXPECT_TRUE(unwrap_err(refused).is(RpcError::Kind::Transport));
    EXPECT_NE(unwrap_err(refused).cause.find("connection refused"), std::string::npos);
    EXPECT_NE(unwrap_err(refused).cause.find("a.example"), std::string::npos);

    transport->answer(404, "gone", "text/plain");
    auto gone = call(echo, "say", {std::string("hi")});
    ASSERT_TRUE(is_err(gone));
    EXPECT_TRUE(unwrap_err(gone).is(RpcError::Kind::MissingEndpoint));
    EXPECT_EQ(unwrap_err(gone).endpoint, "https://a.example/echo");

    transport->answer(422, R"({"params":{"msg":"empty"},"message":"no"})");
    auto rejected = call(echo, "say", {std::string("")});
    ASSERT_TRUE(is_err(rejected));
    EXPECT_EQ(unwrap_err(rejected).params.at("msg"), "empty");
}

TEST_F(ClientTest, ArgumentMisuseThrows) {
    auto echo = proxy("https://a.example/echo");
    EXPECT_THROW((void)call(echo, "say"), std::invalid_argument);
    EXPECT_THROW((void)call(echo, "say", {std::any()}), std::invalid_argument);
    EXPECT_THROW((void)call(echo, "shout", {std::string("hi")}), std::invalid_argument);
}

// ============================================================================
// Binding Checks
// ============================================================================

TEST_F(ClientTest, BindingMismatchThrowsAtBuild) {
    auto n = [](const char* text) { return ExternalName::of(text); };
    PeekCounters other;
    auto complete = echoer_binding(other);

    auto lacking = make_rc<InterfaceBinding>(*complete);
    lacking->calls.pop_back();
    EXPECT_THROW((void)presence->translator(*lacking), std::runtime_error);

    auto extra = make_rc<InterfaceBinding>(*complete);
    extra->calls.push_back(CallBinding{n("shout"), {}, {}});
    EXPECT_THROW((void)presence->translator(*extra), std::runtime_error);

    auto renamed = make_rc<InterfaceBinding>(*complete);
    renamed->calls[0].arguments = {n("message")};
    EXPECT_THROW((void)presence->translator(*renamed), std::runtime_error);

    auto no_field = make_rc<InterfaceBinding>(*complete);
    no_field->calls[0].responses[0].fields.clear();
    EXPECT_THROW((void)presence->translator(*no_field), std::runtime_error);
}

TEST_F(ClientTest, UnknownInterfaceIsMissingType) {
    InterfaceBinding stranger(ExternalName::of("org.example.echo.stranger"), {});
    auto result = presence->elaborate(stranger, at("https://a.example/x"));
    ASSERT_TRUE(is_err(result));
    EXPECT_TRUE(unwrap_err(result).is(RpcError::Kind::MissingType));
    EXPECT_FALSE(unwrap_err(result).module_missing);

    InterfaceBinding nowhere(ExternalName::of("org.nowhere.thing"), {});
    auto absent = presence->translator(nowhere);
    ASSERT_TRUE(is_err(absent));
    EXPECT_TRUE(unwrap_err(absent).module_missing);
}

TEST_F(ClientTest, UndefinedTypeInsideParameterIsMissingType) {
    auto n = [](const char* text) { return ExternalName::of(text); };
    InterfaceBinding lister(n("org.example.echo.lister"),
                            {CallBinding{n("list"), {n("items")}, {}}});
    auto built = presence->translator(lister);
    ASSERT_TRUE(is_err(built));
    EXPECT_TRUE(unwrap_err(built).is(RpcError::Kind::MissingType));
    EXPECT_FALSE(unwrap_err(built).module_missing);
    EXPECT_EQ(unwrap_err(built).type_name, "org.example.echo.gone");
}

// ============================================================================
// Interface References
// ============================================================================

TEST_F(ClientTest, ProxiesTravelAsEndpointsWithPrints) {
    auto echo = proxy("https://a.example/echo");
    auto other = proxy("https://b.example:9000/other");
    prints->record(net::PeerIdentity{"b.example", 9000}, net::Fingerprint("SHA-256", {9, 9}));

    transport->answer(
        200, R"({"rsp-type":"ok","rsp":{"next":"https://c.example/next"},)"
             R"("prints":[{"host":"c.example","port":443,"print":{"algo":"SHA-256","val":[1,2]}}]})");
    auto result = call(echo, "refer", {other});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    auto request = transport->last_request();
    EXPECT_EQ(request.get("req")->get("other")->as_string(), "https://b.example:9000/other");
    const auto& sent_prints = request.get("prints")->as_array();
    ASSERT_EQ(sent_prints.size(), 1u);
    EXPECT_EQ(sent_prints[0].get("host")->as_string(), "b.example");
    EXPECT_EQ(sent_prints[0].get("port")->as_i64(), 9000);

    const auto& record = std::any_cast<const codec::Record&>(unwrap(result)->value);
    auto next = std::any_cast<Rc<Proxy>>(record.at(ExternalName::of("next")));
    EXPECT_EQ(next->endpoint().to_string(), "https://c.example/next");
    EXPECT_TRUE(next == proxy("https://c.example/next"));

    auto recorded = prints->lookup(net::PeerIdentity{"c.example", 443});
    ASSERT_TRUE(recorded.has_value());
    EXPECT_EQ(recorded->bytes(), (std::vector<uint8_t>{1, 2}));
}

TEST_F(ClientTest, ForeignProxyCannotBeSent) {
    auto echo = proxy("https://a.example/echo");
    auto translator = presence->translator(*echoer);
    ASSERT_TRUE(is_ok(translator));
    auto foreign = make_rc<Proxy>(unwrap(translator), at("https://b.example/other"));

    EXPECT_FALSE(presence->locate(*echoer, foreign).has_value());
    auto result = call(echo, "refer", {foreign});
    ASSERT_TRUE(is_err(result));
    EXPECT_TRUE(unwrap_err(result).is(RpcError::Kind::RemoteInvocation));
}

// ============================================================================
// Caches
// ============================================================================

TEST_F(ClientTest, OneProxyPerEndpoint) {
    auto first = proxy("https://a.example/echo");
    EXPECT_TRUE(first == proxy("https://a.example/echo"));
    EXPECT_TRUE(first != proxy("https://a.example/other"));

    auto located = presence->locate(*echoer, first);
    ASSERT_TRUE(located.has_value());
    EXPECT_EQ(located->to_string(), "https://a.example/echo");
    EXPECT_EQ(first->to_string(), "carp:https://a.example/echo");
}

TEST_F(ClientTest, ConcurrentCallersShareOneProxy) {
    const int callers = 8;
    std::vector<Rc<Proxy>> seen(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([this, &seen, i] {
            auto elaborated = presence->elaborate(*echoer, at("https://a.example/shared"));
            if (is_ok(elaborated)) {
                seen[i] = unwrap(elaborated);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& p : seen) {
        ASSERT_TRUE(p != nullptr);
        EXPECT_TRUE(p == seen[0]);
    }
    EXPECT_EQ(presence->proxies().size(), 1u);
}

TEST_F(ClientTest, ProxiesAndTranslatorsAreReclaimed) {
    {
        auto a = proxy("https://a.example/echo");
        auto b = proxy("https://b.example/echo");
        EXPECT_EQ(presence->proxies().size(), 2u);
        EXPECT_EQ(presence->translators().size(), 1u);

        a.reset();
        ReclaimDaemon::instance().flush();
        EXPECT_EQ(presence->proxies().size(), 1u);
        EXPECT_EQ(presence->translators().size(), 1u);
    }
    ReclaimDaemon::instance().flush();
    EXPECT_EQ(presence->proxies().size(), 0u);
    EXPECT_EQ(presence->translators().size(), 0u);

    // A fresh proxy after reclamation is a new object at the same endpoint
    auto again = proxy("https://a.example/echo");
    EXPECT_EQ(presence->proxies().size(), 1u);
    auto located = presence->locate(*echoer, again);
    ASSERT_TRUE(located.has_value());
}

TEST_F(ClientTest, ResolverLoadsModuleOnce) {
    auto a = proxy("https://a.example/echo");
    auto b = proxy("https://b.example/echo");
    EXPECT_EQ(presence->resolver().load_count(), 1u);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ClientConfigTest, RejectsIncompleteConfig) {
    ClientConfig config;
    EXPECT_TRUE(is_err(config.validate()));

    config.transport = make_rc<ScriptedTransport>();
    EXPECT_TRUE(is_err(config.validate()));

    config.arena = make_rc<scope::ScopeArena>();
    EXPECT_TRUE(is_err(config.validate()));

    config.scope = config.arena->add_root("app", nullptr);
    EXPECT_TRUE(is_ok(config.validate()));

    scope::ScopeArena elsewhere;
    config.resolver = make_rc<types::TypeResolver>(elsewhere);
    EXPECT_TRUE(is_err(config.validate()));

    config.resolver = make_rc<types::TypeResolver>(*config.arena);
    EXPECT_TRUE(is_ok(config.validate()));

    auto created = ClientPresence::create(ClientConfig{});
    EXPECT_TRUE(is_err(created));
}
