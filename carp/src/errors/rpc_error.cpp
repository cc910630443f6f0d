#include "errors/rpc_error.hpp"

namespace carp {

auto RpcError::missing_module(const std::string& type_name, const std::string& module)
    -> RpcError {
    RpcError e;
    e.kind = Kind::MissingType;
    e.module_missing = true;
    e.type_name = type_name;
    e.message = "no module " + module + " for " + type_name;
    return e;
}

auto RpcError::missing_type(const std::string& type_name) -> RpcError {
    RpcError e;
    e.kind = Kind::MissingType;
    e.type_name = type_name;
    e.message = "undefined type " + type_name;
    return e;
}

auto RpcError::resource(const std::string& module, const std::string& detail) -> RpcError {
    RpcError e;
    e.kind = Kind::Resource;
    e.message = "module " + module + ": " + detail;
    return e;
}

auto RpcError::missing_endpoint(const std::string& endpoint) -> RpcError {
    RpcError e;
    e.kind = Kind::MissingEndpoint;
    e.endpoint = endpoint;
    e.message = endpoint;
    return e;
}

auto RpcError::status_modification(std::map<std::string, std::string> params,
                                   std::string message) -> RpcError {
    RpcError e;
    e.kind = Kind::StatusModification;
    e.params = std::move(params);
    e.message = std::move(message);
    return e;
}

auto RpcError::internal_server(Uuid id) -> RpcError {
    RpcError e;
    e.kind = Kind::InternalServer;
    e.error_id = id;
    e.message = id.to_string();
    return e;
}

auto RpcError::protocol(std::string message) -> RpcError {
    RpcError e;
    e.kind = Kind::Protocol;
    e.message = std::move(message);
    return e;
}

auto RpcError::transport(std::string cause) -> RpcError {
    RpcError e;
    e.kind = Kind::Transport;
    e.message = cause;
    e.cause = std::move(cause);
    return e;
}

auto RpcError::remote_invocation(std::string message) -> RpcError {
    RpcError e;
    e.kind = Kind::RemoteInvocation;
    e.message = std::move(message);
    return e;
}

auto kind_name(RpcError::Kind kind) -> const char* {
    switch (kind) {
    case RpcError::Kind::MissingType:
        return "missing-type";
    case RpcError::Kind::Resource:
        return "resource";
    case RpcError::Kind::MissingEndpoint:
        return "missing-endpoint";
    case RpcError::Kind::StatusModification:
        return "status-modification";
    case RpcError::Kind::InternalServer:
        return "internal-server";
    case RpcError::Kind::Protocol:
        return "protocol";
    case RpcError::Kind::Transport:
        return "transport";
    case RpcError::Kind::RemoteInvocation:
        return "remote-invocation";
    }
    return "unknown";
}

auto RpcError::to_string() const -> std::string {
    std::string out = kind_name(kind);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    if (kind == Kind::StatusModification && !params.empty()) {
        out += " {";
        bool first = true;
        for (const auto& [key, value] : params) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += key + "=" + value;
        }
        out += "}";
    }
    return out;
}

} // namespace carp
