//! # Transport
//!
//! The blocking client that carries one request to an endpoint and returns
//! the peer's answer. Connection handling, TLS, timeouts and retries all
//! belong to the implementation.

#ifndef CARP_RUNTIME_TRANSPORT_HPP
#define CARP_RUNTIME_TRANSPORT_HPP

#include "common.hpp"
#include "net/endpoint.hpp"

#include <string>

namespace carp::runtime {

/// HTTP status codes the runtime distinguishes.
namespace status {
constexpr int OK = 200;
constexpr int NO_CONTENT = 204;
constexpr int NOT_FOUND = 404;
constexpr int UNPROCESSABLE = 422;
constexpr int INTERNAL_ERROR = 500;
} // namespace status

struct TransportResponse {
    int status = 0;
    std::string content_type; ///< as sent, parameters included
    std::string body;
};

class TransportClient {
public:
    virtual ~TransportClient() = default;

    /// Sends `body` to `endpoint` and waits for the answer.
    ///
    /// # Returns
    ///
    /// The response, whatever its status, or a description of the I/O
    /// failure that prevented one.
    virtual auto post(const net::Endpoint& endpoint, const std::string& content_type,
                      const std::string& body) -> Result<TransportResponse, std::string> = 0;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_TRANSPORT_HPP
