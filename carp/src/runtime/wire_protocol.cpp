#include "runtime/wire_protocol.hpp"

#include "log/log.hpp"
#include "wire/wire.hpp"

#include <cctype>
#include <limits>
#include <map>
#include <vector>

namespace carp::runtime {

using wire::WireArray;
using wire::WireObject;
using wire::WireValue;

auto classify_status(int code) -> Outcome {
    switch (code) {
    case status::OK:
        return Outcome::Success;
    case status::NO_CONTENT:
        return Outcome::NoContent;
    case status::NOT_FOUND:
        return Outcome::NotFound;
    case status::UNPROCESSABLE:
        return Outcome::Unprocessable;
    case status::INTERNAL_ERROR:
        return Outcome::InternalError;
    default:
        return Outcome::Other;
    }
}

auto media_type(std::string_view content_type) -> std::string {
    auto end = content_type.find(';');
    std::string_view type = content_type.substr(0, end);
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.front()))) {
        type.remove_prefix(1);
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.remove_suffix(1);
    }
    std::string out;
    out.reserve(type.size());
    for (char c : type) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// ============================================================================
// Fingerprint Tables
// ============================================================================

auto encode_prints(const net::FingerprintTable& prints) -> WireValue {
    WireValue out{WireArray{}};
    for (const auto& [peer, print] : prints) {
        WireValue val{WireArray{}};
        for (uint8_t byte : print.bytes()) {
            val.push(WireValue(static_cast<int64_t>(byte)));
        }
        WireValue digest{WireObject{}};
        digest.set("algo", WireValue(print.algorithm()));
        digest.set("val", std::move(val));

        WireValue entry{WireObject{}};
        entry.set("host", WireValue(peer.host));
        entry.set("port", WireValue(static_cast<int64_t>(peer.port)));
        entry.set("print", std::move(digest));
        out.push(std::move(entry));
    }
    return out;
}

auto decode_prints(const WireValue& prints) -> Result<net::FingerprintTable, RpcError> {
    if (!prints.is_array()) {
        return RpcError::protocol("\"prints\" is not an array");
    }
    net::FingerprintTable table;
    for (const auto& entry : prints.as_array()) {
        const WireValue* host = entry.get("host");
        const WireValue* port = entry.get("port");
        const WireValue* print = entry.get("print");
        if (host == nullptr || !host->is_string() || port == nullptr || print == nullptr) {
            return RpcError::protocol("malformed print entry");
        }
        auto port_num = port->try_as_i64();
        if (!port_num || *port_num < 0 || *port_num > std::numeric_limits<uint16_t>::max()) {
            return RpcError::protocol("bad port in print entry");
        }
        const WireValue* algo = print->get("algo");
        const WireValue* val = print->get("val");
        if (algo == nullptr || !algo->is_string() || val == nullptr || !val->is_array()) {
            return RpcError::protocol("malformed fingerprint for " + host->as_string());
        }
        std::vector<uint8_t> bytes;
        bytes.reserve(val->size());
        for (const auto& b : val->as_array()) {
            auto byte = b.try_as_i64();
            if (!byte || *byte < 0 || *byte > 255) {
                return RpcError::protocol("fingerprint byte out of range");
            }
            bytes.push_back(static_cast<uint8_t>(*byte));
        }
        table.insert_or_assign(
            net::PeerIdentity{host->as_string(), static_cast<uint16_t>(*port_num)},
            net::Fingerprint(algo->as_string(), std::move(bytes)));
    }
    return table;
}

// ============================================================================
// Requests
// ============================================================================

auto build_request(const ExternalName& call, WireValue req, const net::FingerprintTable& prints)
    -> WireValue {
    WireValue out{WireObject{}};
    out.set("req-type", WireValue(call.to_string()));
    out.set("req", std::move(req));
    out.set("prints", encode_prints(prints));
    return out;
}

// ============================================================================
// Responses
// ============================================================================

namespace {

auto status_modification(const WireValue& body) -> RpcError {
    std::map<std::string, std::string> params;
    if (const WireValue* p = body.get("params")) {
        if (!p->is_object()) {
            return RpcError::protocol("\"params\" is not an object");
        }
        for (const auto& [key, value] : p->as_object()) {
            if (!value.is_string()) {
                return RpcError::protocol("parameter " + key + " is not a string");
            }
            params.emplace(key, value.as_string());
        }
    }
    std::string message;
    if (const WireValue* m = body.get("message")) {
        if (!m->is_string()) {
            return RpcError::protocol("\"message\" is not a string");
        }
        message = m->as_string();
    }
    return RpcError::status_modification(std::move(params), std::move(message));
}

auto internal_server(const WireValue& body) -> RpcError {
    const WireValue* error = body.get("error");
    if (error == nullptr || !error->is_string()) {
        return RpcError::protocol("internal error without an error id");
    }
    auto id = Uuid::parse(error->as_string());
    if (is_err(id)) {
        return RpcError::protocol("bad error id: " + unwrap_err(id));
    }
    return RpcError::internal_server(unwrap(id));
}

} // namespace

auto interpret_response(const net::Endpoint& endpoint, const TransportResponse& response)
    -> Result<ResponseEnvelope, RpcError> {
    Outcome outcome = classify_status(response.status);
    CARP_LOG_DEBUG("wire", "status " << response.status << " from " << endpoint);

    if (outcome == Outcome::NoContent) {
        ResponseEnvelope empty;
        empty.no_content = true;
        return empty;
    }
    if (outcome == Outcome::NotFound) {
        return RpcError::missing_endpoint(endpoint.to_string());
    }

    auto type = media_type(response.content_type);
    if (type != RuntimeOptions::content_type) {
        return RpcError::protocol("non-JSON (" + response.content_type + ") from " +
                                  endpoint.to_string());
    }
    if (RuntimeOptions::trace_bodies) {
        CARP_LOG_TRACE("wire", "rsp: " << response.body);
    }

    auto parsed = wire::parse_wire(response.body);
    if (is_err(parsed)) {
        return RpcError::protocol("bad body from " + endpoint.to_string() + ": " +
                                  unwrap_err(parsed).to_string());
    }
    WireValue body = std::move(unwrap(parsed));
    if (!body.is_object()) {
        return RpcError::protocol("body from " + endpoint.to_string() + " is not an object");
    }

    switch (outcome) {
    case Outcome::Success:
        break;
    case Outcome::Unprocessable:
        return status_modification(body);
    case Outcome::InternalError:
        return internal_server(body);
    default:
        return RpcError::remote_invocation("bad code " + std::to_string(response.status) +
                                           " from " + endpoint.to_string());
    }

    ResponseEnvelope envelope;
    const WireValue* rsp_type = body.get("rsp-type");
    if (rsp_type == nullptr || !rsp_type->is_string()) {
        return RpcError::protocol("response lacks \"rsp-type\"");
    }
    auto variant = ExternalName::parse(rsp_type->as_string());
    if (is_err(variant)) {
        return RpcError::protocol("bad \"rsp-type\": " + unwrap_err(variant));
    }
    envelope.variant = std::move(unwrap(variant));

    if (WireValue* rsp = body.get_mut("rsp")) {
        if (!rsp->is_object()) {
            return RpcError::protocol("\"rsp\" is not an object");
        }
        envelope.rsp = std::move(*rsp);
    } else {
        envelope.rsp = WireValue(WireObject{});
    }

    if (const WireValue* prints = body.get("prints")) {
        auto table = decode_prints(*prints);
        if (is_err(table)) {
            return unwrap_err(table);
        }
        envelope.prints = std::move(unwrap(table));
    }
    return envelope;
}

} // namespace carp::runtime
