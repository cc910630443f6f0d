//! # Client Presence
//!
//! The client side of the runtime for one application: it owns the
//! translator and proxy caches, supplies the codec contexts every call uses,
//! and keeps the fingerprint exchange going.
//!
//! ## Fingerprints
//!
//! - A proxy sent as an argument adds the print recorded for its peer, if
//!   any, to the request's `prints`.
//! - An endpoint received in a response has the print the response carried
//!   for its peer recorded before the proxy is produced.
//!
//! Neither ever fails a call.
//!
//! ## Lifetime
//!
//! Translators hold the presence, and proxies hold their translator, so a
//! presence lives as long as any proxy it produced. The caches hold nothing
//! strongly.

#ifndef CARP_RUNTIME_CLIENT_PRESENCE_HPP
#define CARP_RUNTIME_CLIENT_PRESENCE_HPP

#include "runtime/call_translator_cache.hpp"
#include "runtime/configuration.hpp"
#include "runtime/proxy_cache.hpp"

#include <memory>
#include <optional>
#include <string>

namespace carp::runtime {

class ClientPresence : public std::enable_shared_from_this<ClientPresence> {
public:
    /// # Returns
    ///
    /// The presence, or the message from `ClientConfig::validate`.
    static auto create(ClientConfig config) -> Result<Rc<ClientPresence>, std::string>;

    ClientPresence(const ClientPresence&) = delete;
    auto operator=(const ClientPresence&) -> ClientPresence& = delete;

    /// Proxy for the receiver of `binding`'s interface at `endpoint`.
    auto elaborate(const InterfaceBinding& binding, const net::Endpoint& endpoint)
        -> Result<Rc<Proxy>, RpcError>;

    /// Endpoint of a live proxy produced by this presence.
    [[nodiscard]] auto locate(const InterfaceBinding& binding, const Rc<Proxy>& proxy) const
        -> std::optional<net::Endpoint>;

    /// Calls a method through a proxy.
    auto invoke(const Rc<Proxy>& proxy, const ExternalName& call, std::vector<std::any> args)
        -> CallResult;

    /// The translator for `binding`, shared with its proxies.
    auto translator(const InterfaceBinding& binding) -> Result<Rc<CallTranslator>, RpcError>;

    [[nodiscard]] auto resolver() -> types::TypeResolver& {
        return *resolver_;
    }

    [[nodiscard]] auto fingerprints() const -> const Rc<net::FingerprintRepository>& {
        return fingerprints_;
    }

    [[nodiscard]] auto proxies() const -> const ProxyCache& {
        return proxies_;
    }

    [[nodiscard]] auto translators() const -> const CallTranslatorCache& {
        return translators_;
    }

private:
    explicit ClientPresence(ClientConfig config);

    auto contexts() -> ContextFactory;

    Rc<TransportClient> transport_;
    Rc<scope::ScopeArena> arena_;
    scope::ScopeId scope_;
    Rc<net::FingerprintRepository> fingerprints_;
    Rc<types::TypeResolver> resolver_;
    Rc<codec::CodecFactory> codecs_;
    CallTranslatorCache translators_;
    ProxyCache proxies_;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_CLIENT_PRESENCE_HPP
