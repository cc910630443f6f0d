//! # Standard Codecs
//!
//! The codec factory used when nothing more specific is configured. It
//! handles builtins, sequences, sets, maps, enumerations, structures (as
//! `codec::Record`) and interface references. Codecs for individual named
//! types can be registered to override the generic forms.
//!
//! Building a codec resolves every named type reachable from it, so an
//! undefined type anywhere in the graph surfaces immediately. The codec of a
//! referenced type is built on first use, which keeps recursive structures
//! finite.

#ifndef CARP_CODEC_STD_CODECS_HPP
#define CARP_CODEC_STD_CODECS_HPP

#include "codec/codec.hpp"
#include "types/type_resolver.hpp"

#include <map>
#include <set>
#include <shared_mutex>
#include <utility>

namespace carp::codec {

class StandardCodecs : public CodecFactory {
public:
    /// The resolver must outlive this factory, and the factory must outlive
    /// every codec it hands out.
    explicit StandardCodecs(types::TypeResolver& resolver) : resolver_(resolver) {}

    /// Uses `encoder` and `decoder` for every reference to `type_name`.
    void register_codec(const ExternalName& type_name, Rc<const Encoder> encoder,
                        Rc<const Decoder> decoder);

    auto encoder_for(const model::Type& type, scope::ScopeId scope)
        -> Result<Rc<const Encoder>, RpcError> override;

    auto decoder_for(const model::Type& type, scope::ScopeId scope)
        -> Result<Rc<const Decoder>, RpcError> override;

private:
    using Pair = std::pair<Rc<const Encoder>, Rc<const Decoder>>;
    using Visited = std::set<std::pair<const model::Type*, scope::ScopeId>>;

    auto registered(const ExternalName& type_name) const -> std::optional<Pair>;

    /// Resolves every named type reachable from `target`.
    auto check_reachable(const types::TypeRecord& target) -> Result<bool, RpcError>;

    auto check_references(const model::Type& type, scope::ScopeId scope, Visited& visited)
        -> Result<bool, RpcError>;

    types::TypeResolver& resolver_;
    mutable std::shared_mutex mutex_;
    std::map<ExternalName, Pair> registered_;
};

} // namespace carp::codec

#endif // CARP_CODEC_STD_CODECS_HPP
