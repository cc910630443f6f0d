//! # Certificate Fingerprints
//!
//! An algorithm-tagged digest of a peer's DER-encoded certificate. Calls
//! carry tables of these (`prints`) so that peers learn each other's
//! certificates without a separate exchange.
//!
//! Digests are computed with OpenSSL; the algorithm is any name OpenSSL's
//! digest table knows (`SHA-256`, `SHA256`, `SHA-512`, ...).

#ifndef CARP_NET_FINGERPRINT_HPP
#define CARP_NET_FINGERPRINT_HPP

#include "common.hpp"
#include "net/endpoint.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/x509.h>

namespace carp::net {

class Fingerprint {
public:
    Fingerprint(std::string algorithm, std::vector<uint8_t> bytes)
        : algorithm_(std::move(algorithm)), bytes_(std::move(bytes)) {}

    /// Digests raw DER bytes.
    static auto of_der(std::string_view algorithm, std::span<const uint8_t> der)
        -> Result<Fingerprint, std::string>;

    /// Digests a parsed certificate.
    static auto of_certificate(std::string_view algorithm, const X509* cert)
        -> Result<Fingerprint, std::string>;

    /// Digests the first certificate of a PEM document.
    static auto of_pem(std::string_view algorithm, std::string_view pem)
        -> Result<Fingerprint, std::string>;

    [[nodiscard]] auto algorithm() const -> const std::string& {
        return algorithm_;
    }

    [[nodiscard]] auto bytes() const -> const std::vector<uint8_t>& {
        return bytes_;
    }

    /// Colon-separated upper-case hex, e.g. `BA:78:16:...`.
    [[nodiscard]] auto to_hex() const -> std::string;

    auto operator==(const Fingerprint&) const -> bool = default;

private:
    std::string algorithm_;
    std::vector<uint8_t> bytes_;
};

/// Peer fingerprints exchanged with one call. Call-local, never shared.
using FingerprintTable = std::map<PeerIdentity, Fingerprint>;

} // namespace carp::net

#endif // CARP_NET_FINGERPRINT_HPP
