//! # Endpoints
//!
//! An endpoint is the URI naming a remote receiver, e.g.
//! `https://svc.example.org:8443/orders/17`. Its scheme, host and port
//! determine the peer whose certificate fingerprint may travel with a call.

#ifndef CARP_NET_ENDPOINT_HPP
#define CARP_NET_ENDPOINT_HPP

#include "common.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace carp::net {

/// Host and port of a peer. The host is kept as written in the endpoint.
struct PeerIdentity {
    std::string host;
    uint16_t port = 0;

    auto operator==(const PeerIdentity&) const -> bool = default;
    auto operator<=>(const PeerIdentity&) const = default;

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

/// A parsed absolute URI of the form `scheme://host[:port][/path]`.
class Endpoint {
public:
    /// # Returns
    ///
    /// The endpoint, or a message naming the malformed part.
    static auto parse(std::string_view text) -> Result<Endpoint, std::string>;

    [[nodiscard]] auto scheme() const -> const std::string& {
        return scheme_;
    }

    [[nodiscard]] auto host() const -> const std::string& {
        return host_;
    }

    /// Explicit port, if the URI has one.
    [[nodiscard]] auto port() const -> std::optional<uint16_t> {
        return port_;
    }

    /// Path, query and fragment; empty or starting with `/`.
    [[nodiscard]] auto path() const -> const std::string& {
        return path_;
    }

    /// The peer this endpoint is served from.
    ///
    /// Without an explicit port, `http` implies 80 and `https` 443. Any
    /// other scheme without a port is an error.
    [[nodiscard]] auto peer() const -> Result<PeerIdentity, std::string>;

    /// The text the endpoint was parsed from.
    [[nodiscard]] auto to_string() const -> const std::string& {
        return text_;
    }

    auto operator==(const Endpoint& other) const -> bool {
        return text_ == other.text_;
    }

    auto operator<(const Endpoint& other) const -> bool {
        return text_ < other.text_;
    }

private:
    Endpoint() = default;

    std::string text_;
    std::string scheme_;
    std::string host_;
    std::optional<uint16_t> port_;
    std::string path_;
};

inline auto operator<<(std::ostream& os, const Endpoint& endpoint) -> std::ostream& {
    return os << endpoint.to_string();
}

} // namespace carp::net

template <> struct std::hash<carp::net::Endpoint> {
    auto operator()(const carp::net::Endpoint& endpoint) const noexcept -> size_t {
        return std::hash<std::string>{}(endpoint.to_string());
    }
};

#endif // CARP_NET_ENDPOINT_HPP
