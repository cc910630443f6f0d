//! # Fingerprint Repository
//!
//! Long-lived store of peer certificate fingerprints. The runtime records
//! prints that arrive with responses and consults the store when sending an
//! endpoint onward. The exchange is advisory: the store never blocks or
//! fails a call, and a mismatch with a previously recorded print only
//! replaces it and logs a warning.

#ifndef CARP_NET_FINGERPRINT_REPOSITORY_HPP
#define CARP_NET_FINGERPRINT_REPOSITORY_HPP

#include "net/fingerprint.hpp"

#include <map>
#include <optional>
#include <shared_mutex>

namespace carp::net {

class FingerprintRepository {
public:
    virtual ~FingerprintRepository() = default;

    virtual void record(const PeerIdentity& peer, const Fingerprint& print) = 0;

    [[nodiscard]] virtual auto lookup(const PeerIdentity& peer) const
        -> std::optional<Fingerprint> = 0;
};

/// Thread-safe repository held in memory.
class InMemoryFingerprintRepository : public FingerprintRepository {
public:
    void record(const PeerIdentity& peer, const Fingerprint& print) override;

    [[nodiscard]] auto lookup(const PeerIdentity& peer) const
        -> std::optional<Fingerprint> override;

    [[nodiscard]] auto size() const -> size_t;

private:
    mutable std::shared_mutex mutex_;
    std::map<PeerIdentity, Fingerprint> prints_;
};

} // namespace carp::net

#endif // CARP_NET_FINGERPRINT_REPOSITORY_HPP
