//! # Wire Protocol
//!
//! Shape of the messages a call exchanges, and the mapping from what the
//! peer answered to a decoded envelope or an error.
//!
//! ## Messages
//!
//! ```text
//! Request:   {"req-type": call, "req": {param: value, ...}, "prints": [PrintEntry, ...]}
//! Response:  {"rsp-type": variant, "rsp": {field: value, ...}, "prints": [PrintEntry, ...]}
//! PrintEntry {"host": string, "port": int, "print": {"algo": string, "val": [0..255, ...]}}
//! 422 body:  {"params": {string: string, ...}, "message": string}
//! 500 body:  {"error": uuid}
//! ```
//!
//! ## Outcomes
//!
//! | Status | Result |
//! |--------|--------|
//! | 204 | empty envelope; the caller decides whether the call allows it |
//! | 404 | `MissingEndpoint` |
//! | any other, non-JSON body | `Protocol` |
//! | 200 | envelope with variant, fields and prints |
//! | 422 | `StatusModification` with the body's params and message |
//! | 500 | `InternalServer` with the body's error id |
//! | anything else | `RemoteInvocation` |

#ifndef CARP_RUNTIME_WIRE_PROTOCOL_HPP
#define CARP_RUNTIME_WIRE_PROTOCOL_HPP

#include "common.hpp"
#include "errors/rpc_error.hpp"
#include "name/external_name.hpp"
#include "net/endpoint.hpp"
#include "net/fingerprint.hpp"
#include "runtime/transport.hpp"
#include "wire/wire_value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace carp::runtime {

enum class Outcome { Success, NoContent, NotFound, Unprocessable, InternalError, Other };

auto classify_status(int code) -> Outcome;

/// The media type of a Content-Type header: lower-case, parameters dropped.
auto media_type(std::string_view content_type) -> std::string;

/// `prints` array for a fingerprint table.
auto encode_prints(const net::FingerprintTable& prints) -> wire::WireValue;

/// Fingerprint table from a `prints` array.
auto decode_prints(const wire::WireValue& prints) -> Result<net::FingerprintTable, RpcError>;

/// Request envelope for one call.
///
/// # Arguments
///
/// * `call` - The call name, sent as `req-type`
/// * `req` - Object of encoded arguments
/// * `prints` - Fingerprints gathered while encoding the arguments
auto build_request(const ExternalName& call, wire::WireValue req,
                   const net::FingerprintTable& prints) -> wire::WireValue;

/// A successful answer, before the variant is decoded.
struct ResponseEnvelope {
    bool no_content = false;
    std::optional<ExternalName> variant; ///< absent iff `no_content`
    wire::WireValue rsp;
    net::FingerprintTable prints;
};

/// Applies the outcome table to a transport response.
auto interpret_response(const net::Endpoint& endpoint, const TransportResponse& response)
    -> Result<ResponseEnvelope, RpcError>;

} // namespace carp::runtime

#endif // CARP_RUNTIME_WIRE_PROTOCOL_HPP
