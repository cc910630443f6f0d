//! # Value Codecs
//!
//! Per-type conversion between native values and wire values. Native values
//! travel as `std::any`; the representation each schema type uses is fixed
//! by the codec that handles it.
//!
//! | Schema type | Native representation |
//! |-------------|-----------------------|
//! | `string` | `std::string` |
//! | `integer` | `int64_t` |
//! | `real` | `double` |
//! | `boolean` | `bool` |
//! | `uuid` | `carp::Uuid` |
//! | `integer` with bounds | `int64_t`, range-checked both ways |
//! | sequence | `codec::Sequence` |
//! | set | `codec::Set` |
//! | map | `codec::Map` |
//! | structure | `codec::Record`, unless a codec is registered for it |
//! | enumeration | `std::string` holding the constant's text |
//! | interface reference | `Rc<runtime::Proxy>` |
//!
//! Handing an encoder a value of the wrong native type is a wiring defect
//! and throws `std::invalid_argument`. A wire value of the wrong shape is a
//! `Protocol` error.

#ifndef CARP_CODEC_CODEC_HPP
#define CARP_CODEC_CODEC_HPP

#include "common.hpp"
#include "errors/rpc_error.hpp"
#include "model/type.hpp"
#include "net/endpoint.hpp"
#include "net/fingerprint.hpp"
#include "scope/resolution_scope.hpp"
#include "wire/wire_value.hpp"

#include <any>
#include <map>
#include <utility>
#include <vector>

namespace carp::runtime {
class Proxy;
struct InterfaceBinding;
} // namespace carp::runtime

namespace carp::codec {

/// Native form of a sequence.
using Sequence = std::vector<std::any>;

/// Native form of a set. Elements are distinct by wire form; duplicates
/// are dropped in both directions.
using Set = std::vector<std::any>;

/// Native form of a map, in wire order. Keys are distinct by wire form.
using Map = std::vector<std::pair<std::any, std::any>>;

/// Native form of a structure without a dedicated codec. Absent optional
/// members have no entry.
using Record = std::map<ExternalName, std::any>;

// ============================================================================
// Contexts
// ============================================================================

/// Per-call state visible to encoders.
class EncodingContext {
public:
    explicit EncodingContext(net::FingerprintTable& prints) : prints_(prints) {}
    virtual ~EncodingContext() = default;

    /// The `prints` table that goes out with the request.
    [[nodiscard]] auto prints() -> net::FingerprintTable& {
        return prints_;
    }

    /// Endpoint a proxy stands for, when the proxy is sent as an argument.
    virtual auto locate(const runtime::InterfaceBinding& binding,
                        const Rc<runtime::Proxy>& proxy) -> Result<net::Endpoint, RpcError> = 0;

private:
    net::FingerprintTable& prints_;
};

/// Per-call state visible to decoders.
class DecodingContext {
public:
    explicit DecodingContext(const net::FingerprintTable& prints) : prints_(prints) {}
    virtual ~DecodingContext() = default;

    /// The `prints` table that came with the response.
    [[nodiscard]] auto prints() const -> const net::FingerprintTable& {
        return prints_;
    }

    /// Proxy for an endpoint received in a response.
    virtual auto elaborate(const runtime::InterfaceBinding& binding, const net::Endpoint& endpoint)
        -> Result<Rc<runtime::Proxy>, RpcError> = 0;

private:
    const net::FingerprintTable& prints_;
};

// ============================================================================
// Codecs
// ============================================================================

class Encoder {
public:
    virtual ~Encoder() = default;

    virtual auto encode(const std::any& value, EncodingContext& ctx) const
        -> Result<wire::WireValue, RpcError> = 0;
};

class Decoder {
public:
    virtual ~Decoder() = default;

    virtual auto decode(const wire::WireValue& value, DecodingContext& ctx) const
        -> Result<std::any, RpcError> = 0;
};

/// Supplies the codec for a schema type seen from a scope.
///
/// Resolution failures of referenced types are returned; a type that no
/// codec can handle is a wiring defect and throws `std::runtime_error`.
class CodecFactory {
public:
    virtual ~CodecFactory() = default;

    virtual auto encoder_for(const model::Type& type, scope::ScopeId scope)
        -> Result<Rc<const Encoder>, RpcError> = 0;

    virtual auto decoder_for(const model::Type& type, scope::ScopeId scope)
        -> Result<Rc<const Decoder>, RpcError> = 0;
};

} // namespace carp::codec

#endif // CARP_CODEC_CODEC_HPP
