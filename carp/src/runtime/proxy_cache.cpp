#include "runtime/proxy_cache.hpp"

#include "log/log.hpp"

namespace carp::runtime {

auto ProxyCache::get_proxy(const InterfaceBinding& binding, const net::Endpoint& endpoint)
    -> Result<Rc<Proxy>, RpcError> {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto key = std::make_pair(&binding, endpoint.to_string());
    auto it = state_->forward.find(key);
    if (it != state_->forward.end()) {
        if (auto live = it->second.get()) {
            return live;
        }
    }

    auto created = factory_(binding, endpoint);
    if (is_err(created)) {
        return unwrap_err(created);
    }
    const Proxy* address = unwrap(created).get();

    std::weak_ptr<State> weak = state_;
    auto watched = watch(std::move(unwrap(created)), [weak, key, address](uint64_t id) {
        auto state = weak.lock();
        if (!state) {
            return;
        }
        std::lock_guard<std::mutex> inner(state->mutex);
        auto fwd = state->forward.find(key);
        if (fwd != state->forward.end() && fwd->second.id == id) {
            state->forward.erase(fwd);
        }
        auto rev = state->reverse.find(key.first);
        if (rev != state->reverse.end()) {
            auto entry = rev->second.find(address);
            if (entry != rev->second.end() && entry->second.id == id) {
                rev->second.erase(entry);
            }
            if (rev->second.empty()) {
                state->reverse.erase(rev);
            }
        }
        CARP_LOG_DEBUG("reclaim", "proxy for " << key.second << " reclaimed");
    });

    state_->forward.insert_or_assign(key, watched.ref);
    state_->reverse[&binding].insert_or_assign(address,
                                               Location{watched.ref.ref, watched.ref.id, endpoint});
    CARP_LOG_DEBUG("proxy", "new proxy " << watched.strong->to_string() << " for "
                                         << binding.type_name());
    return watched.strong;
}

auto ProxyCache::get_location(const InterfaceBinding& binding, const Rc<Proxy>& proxy) const
    -> std::optional<net::Endpoint> {
    if (!proxy) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto rev = state_->reverse.find(&binding);
    if (rev == state_->reverse.end()) {
        return std::nullopt;
    }
    auto entry = rev->second.find(proxy.get());
    if (entry == rev->second.end() || entry->second.ref.lock() != proxy) {
        return std::nullopt;
    }
    return entry->second.endpoint;
}

auto ProxyCache::size() const -> size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->forward.size();
}

} // namespace carp::runtime
