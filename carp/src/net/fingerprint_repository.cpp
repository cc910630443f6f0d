#include "net/fingerprint_repository.hpp"

#include "log/log.hpp"

#include <mutex>

namespace carp::net {

void InMemoryFingerprintRepository::record(const PeerIdentity& peer, const Fingerprint& print) {
    std::unique_lock lock(mutex_);
    auto it = prints_.find(peer);
    if (it == prints_.end()) {
        CARP_LOG_DEBUG("client", "learned " << print.algorithm() << " print for " << peer.to_string());
        prints_.emplace(peer, print);
        return;
    }
    if (!(it->second == print)) {
        CARP_LOG_WARN("client", "print for " << peer.to_string() << " changed from "
                                               << it->second.to_hex() << " to " << print.to_hex());
        it->second = print;
    }
}

auto InMemoryFingerprintRepository::lookup(const PeerIdentity& peer) const
    -> std::optional<Fingerprint> {
    std::shared_lock lock(mutex_);
    auto it = prints_.find(peer);
    if (it == prints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto InMemoryFingerprintRepository::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return prints_.size();
}

} // namespace carp::net
