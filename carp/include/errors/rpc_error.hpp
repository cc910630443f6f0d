//! # RPC Errors
//!
//! The single error value returned by every fallible runtime operation.
//! `Kind` discriminates the failure; the remaining fields carry the detail
//! a caller may act upon for that kind.
//!
//! | Kind | Raised when | Detail |
//! |------|-------------|--------|
//! | `MissingType` | a module or type is defined in no visible scope | `module_missing`, `type_name` |
//! | `Resource` | a module descriptor exists but cannot be read or parsed | `message` |
//! | `MissingEndpoint` | the peer does not know the receiver (404) | `endpoint` |
//! | `StatusModification` | the peer rejected a status update (422) | `params`, `message` |
//! | `InternalServer` | the peer failed internally (500) | `error_id` |
//! | `Protocol` | a response broke the wire contract | `message` |
//! | `Transport` | connect, read or write failed | `cause` |
//! | `RemoteInvocation` | any other unrecognized outcome | `message` |
//!
//! None of these is retried by the runtime.

#ifndef CARP_ERRORS_RPC_ERROR_HPP
#define CARP_ERRORS_RPC_ERROR_HPP

#include "name/uuid.hpp"

#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace carp {

struct RpcError {
    enum class Kind {
        MissingType,
        Resource,
        MissingEndpoint,
        StatusModification,
        InternalServer,
        Protocol,
        Transport,
        RemoteInvocation,
    };

    Kind kind = Kind::RemoteInvocation;
    std::string message;

    /// MissingType: true if no scope defines the module at all.
    bool module_missing = false;

    /// MissingType: the name that failed to resolve.
    std::string type_name;

    /// MissingEndpoint: the endpoint the peer disowned.
    std::string endpoint;

    /// StatusModification: structured reasons supplied by the peer.
    std::map<std::string, std::string> params;

    /// InternalServer: opaque identifier of the failure at the peer.
    std::optional<Uuid> error_id;

    /// Transport: description of the underlying I/O failure.
    std::string cause;

    // ========================================================================
    // Factories
    // ========================================================================

    static auto missing_module(const std::string& type_name, const std::string& module) -> RpcError;
    static auto missing_type(const std::string& type_name) -> RpcError;
    static auto resource(const std::string& module, const std::string& detail) -> RpcError;
    static auto missing_endpoint(const std::string& endpoint) -> RpcError;
    static auto status_modification(std::map<std::string, std::string> params,
                                    std::string message) -> RpcError;
    static auto internal_server(Uuid id) -> RpcError;
    static auto protocol(std::string message) -> RpcError;
    static auto transport(std::string cause) -> RpcError;
    static auto remote_invocation(std::string message) -> RpcError;

    [[nodiscard]] auto is(Kind k) const -> bool {
        return kind == k;
    }

    /// One-line description, e.g. `missing endpoint: https://h/x`.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Lower-case kind name ("missing-type", "transport", ...).
auto kind_name(RpcError::Kind kind) -> const char*;

inline auto operator<<(std::ostream& os, const RpcError& error) -> std::ostream& {
    return os << error.to_string();
}

} // namespace carp

#endif // CARP_ERRORS_RPC_ERROR_HPP
