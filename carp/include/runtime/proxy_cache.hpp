//! # Proxy Cache
//!
//! Hands out one proxy per (interface, endpoint) for as long as anyone
//! holds it, and remembers which endpoint each live proxy stands for so a
//! proxy can be sent back out as a reference.
//!
//! ```text
//! forward: (binding, endpoint) -> CollectibleRef<Proxy>
//! reverse: binding -> (proxy address -> {weak proxy, id, endpoint})
//! ```
//!
//! Both maps hold proxies weakly. When a proxy is reclaimed its cleanup
//! removes the entries it created, and only those: an entry installed
//! since by a newer proxy carries a different id and is left alone.

#ifndef CARP_RUNTIME_PROXY_CACHE_HPP
#define CARP_RUNTIME_PROXY_CACHE_HPP

#include "runtime/collectible.hpp"
#include "runtime/proxy.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace carp::runtime {

class ProxyCache {
public:
    using Factory = std::function<Result<Box<Proxy>, RpcError>(const InterfaceBinding&,
                                                               const net::Endpoint&)>;

    explicit ProxyCache(Factory factory)
        : factory_(std::move(factory)), state_(make_rc<State>()) {}

    /// The live proxy for `endpoint`, creating one if there is none.
    ///
    /// Concurrent callers asking for the same pair get the same proxy.
    auto get_proxy(const InterfaceBinding& binding, const net::Endpoint& endpoint)
        -> Result<Rc<Proxy>, RpcError>;

    /// Endpoint of a proxy this cache produced and that is still alive.
    [[nodiscard]] auto get_location(const InterfaceBinding& binding,
                                    const Rc<Proxy>& proxy) const
        -> std::optional<net::Endpoint>;

    /// Forward entries currently held.
    [[nodiscard]] auto size() const -> size_t;

private:
    struct Location {
        std::weak_ptr<Proxy> ref;
        uint64_t id;
        net::Endpoint endpoint;
    };

    struct State {
        std::mutex mutex;
        std::map<std::pair<const InterfaceBinding*, std::string>, CollectibleRef<Proxy>> forward;
        std::map<const InterfaceBinding*, std::map<const Proxy*, Location>> reverse;
    };

    Factory factory_;
    Rc<State> state_;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_PROXY_CACHE_HPP
