//! # Client Configuration
//!
//! Everything a `ClientPresence` needs, gathered in one place. Only the
//! transport and the scope arena are mandatory; the resolver and codecs
//! default to a `TypeResolver` over the arena and `StandardCodecs` over
//! that resolver.
//!
//! # Example
//!
//! ```cpp
//! ClientConfig config;
//! config.transport = my_transport;
//! config.arena = arena;
//! config.scope = app_scope;
//! config.fingerprints = make_rc<net::InMemoryFingerprintRepository>();
//! auto presence = ClientPresence::create(std::move(config));
//! ```

#ifndef CARP_RUNTIME_CONFIGURATION_HPP
#define CARP_RUNTIME_CONFIGURATION_HPP

#include "codec/codec.hpp"
#include "net/fingerprint_repository.hpp"
#include "runtime/transport.hpp"
#include "scope/resolution_scope.hpp"
#include "types/type_resolver.hpp"

#include <string>

namespace carp::runtime {

struct ClientConfig {
    Rc<TransportClient> transport;                ///< Required.
    Rc<scope::ScopeArena> arena;                  ///< Required.
    scope::ScopeId scope = 0;                     ///< Scope interfaces are resolved from.
    Rc<net::FingerprintRepository> fingerprints;  ///< Optional; no print exchange without it.
    Rc<types::TypeResolver> resolver;             ///< Optional; must be over `arena`.
    Rc<codec::CodecFactory> codecs;               ///< Optional.

    /// Checks the mandatory settings.
    ///
    /// # Returns
    ///
    /// `true`, or a message naming the first setting that is missing or
    /// inconsistent.
    [[nodiscard]] auto validate() const -> Result<bool, std::string>;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_CONFIGURATION_HPP
