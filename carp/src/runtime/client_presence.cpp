#include "runtime/client_presence.hpp"

#include "codec/std_codecs.hpp"
#include "log/log.hpp"

namespace carp::runtime {

namespace {

class PresenceEncodingContext : public codec::EncodingContext {
public:
    PresenceEncodingContext(net::FingerprintTable& prints, Rc<ClientPresence> presence)
        : codec::EncodingContext(prints), presence_(std::move(presence)) {}

    auto locate(const InterfaceBinding& binding, const Rc<Proxy>& proxy)
        -> Result<net::Endpoint, RpcError> override {
        auto endpoint = presence_->locate(binding, proxy);
        if (!endpoint) {
            return RpcError::remote_invocation(proxy->to_string() +
                                               " was not produced by this presence");
        }
        const auto& repository = presence_->fingerprints();
        if (repository) {
            auto peer = endpoint->peer();
            if (is_ok(peer)) {
                if (auto print = repository->lookup(unwrap(peer))) {
                    prints().insert_or_assign(unwrap(peer), *print);
                }
            }
        }
        return *endpoint;
    }

private:
    Rc<ClientPresence> presence_;
};

class PresenceDecodingContext : public codec::DecodingContext {
public:
    PresenceDecodingContext(const net::FingerprintTable& prints, Rc<ClientPresence> presence)
        : codec::DecodingContext(prints), presence_(std::move(presence)) {}

    auto elaborate(const InterfaceBinding& binding, const net::Endpoint& endpoint)
        -> Result<Rc<Proxy>, RpcError> override {
        const auto& repository = presence_->fingerprints();
        if (repository) {
            auto peer = endpoint.peer();
            if (is_ok(peer)) {
                auto it = prints().find(unwrap(peer));
                if (it != prints().end()) {
                    repository->record(it->first, it->second);
                }
            } else {
                CARP_LOG_DEBUG("client", "no peer for " << endpoint << ": " << unwrap_err(peer));
            }
        }
        return presence_->elaborate(binding, endpoint);
    }

private:
    Rc<ClientPresence> presence_;
};

} // namespace

auto ClientPresence::create(ClientConfig config) -> Result<Rc<ClientPresence>, std::string> {
    auto valid = config.validate();
    if (is_err(valid)) {
        return unwrap_err(valid);
    }
    return Rc<ClientPresence>(new ClientPresence(std::move(config)));
}

ClientPresence::ClientPresence(ClientConfig config)
    : transport_(std::move(config.transport)), arena_(std::move(config.arena)),
      scope_(config.scope), fingerprints_(std::move(config.fingerprints)),
      resolver_(config.resolver ? std::move(config.resolver)
                                : make_rc<types::TypeResolver>(*arena_)),
      codecs_(config.codecs ? std::move(config.codecs)
                            : Rc<codec::CodecFactory>(make_rc<codec::StandardCodecs>(*resolver_))),
      translators_([this](const InterfaceBinding& binding) {
          return CallTranslator::build(binding, *resolver_, *codecs_, scope_, transport_,
                                       contexts());
      }),
      proxies_([this](const InterfaceBinding& binding, const net::Endpoint& endpoint)
                   -> Result<Box<Proxy>, RpcError> {
          auto translator = translators_.get(binding);
          if (is_err(translator)) {
              return unwrap_err(translator);
          }
          return make_box<Proxy>(std::move(unwrap(translator)), endpoint);
      }) {
    CARP_LOG_INFO("client", "presence ready at scope " << arena_->name(scope_));
}

auto ClientPresence::contexts() -> ContextFactory {
    Rc<ClientPresence> self = shared_from_this();
    return ContextFactory{
        [self](net::FingerprintTable& prints) -> Box<codec::EncodingContext> {
            return make_box<PresenceEncodingContext>(prints, self);
        },
        [self](const net::FingerprintTable& prints) -> Box<codec::DecodingContext> {
            return make_box<PresenceDecodingContext>(prints, self);
        }};
}

auto ClientPresence::translator(const InterfaceBinding& binding)
    -> Result<Rc<CallTranslator>, RpcError> {
    return translators_.get(binding);
}

auto ClientPresence::elaborate(const InterfaceBinding& binding, const net::Endpoint& endpoint)
    -> Result<Rc<Proxy>, RpcError> {
    return proxies_.get_proxy(binding, endpoint);
}

auto ClientPresence::locate(const InterfaceBinding& binding, const Rc<Proxy>& proxy) const
    -> std::optional<net::Endpoint> {
    return proxies_.get_location(binding, proxy);
}

auto ClientPresence::invoke(const Rc<Proxy>& proxy, const ExternalName& call,
                            std::vector<std::any> args) -> CallResult {
    return proxy->invoke(call, std::move(args));
}

} // namespace carp::runtime
