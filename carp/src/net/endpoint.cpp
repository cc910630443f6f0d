#include "net/endpoint.hpp"

#include <charconv>

namespace carp::net {

namespace {

auto lowered(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

auto is_scheme_char(char c, bool first) -> bool {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return true;
    }
    if (first) {
        return false;
    }
    return (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

} // namespace

auto Endpoint::parse(std::string_view text) -> Result<Endpoint, std::string> {
    auto sep = text.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return "not an absolute URI: " + std::string(text);
    }
    for (size_t i = 0; i < sep; ++i) {
        if (!is_scheme_char(text[i], i == 0)) {
            return "bad URI scheme: " + std::string(text);
        }
    }

    Endpoint ep;
    ep.text_ = std::string(text);
    ep.scheme_ = lowered(text.substr(0, sep));

    auto rest = text.substr(sep + 3);
    auto path_start = rest.find_first_of("/?#");
    auto authority = rest.substr(0, path_start);
    ep.path_ = path_start == std::string_view::npos ? "" : std::string(rest.substr(path_start));

    // user-info is not part of the peer identity
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view port_text;
    if (authority.starts_with("[")) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return "unterminated IPv6 literal: " + std::string(text);
        }
        ep.host_ = std::string(authority.substr(0, close + 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return "bad authority: " + std::string(text);
            }
            port_text = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            ep.host_ = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
        } else {
            ep.host_ = std::string(authority);
        }
    }

    if (ep.host_.empty()) {
        return "missing host: " + std::string(text);
    }
    ep.host_ = lowered(ep.host_);

    if (!port_text.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || value > 65535) {
            return "bad port in " + std::string(text);
        }
        ep.port_ = static_cast<uint16_t>(value);
    }

    return ep;
}

auto Endpoint::peer() const -> Result<PeerIdentity, std::string> {
    if (port_) {
        return PeerIdentity{host_, *port_};
    }
    if (scheme_ == "http") {
        return PeerIdentity{host_, 80};
    }
    if (scheme_ == "https") {
        return PeerIdentity{host_, 443};
    }
    return "unknown URI scheme: " + scheme_;
}

} // namespace carp::net
