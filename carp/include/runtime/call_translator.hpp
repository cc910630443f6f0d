//! # Call Translator
//!
//! Turns calls on an interface into wire exchanges. A translator is built
//! once per interface binding: it checks the binding against the schema
//! model, fetches a codec for every argument and response field, and keeps
//! the resulting `CallPlan`s. Any disagreement between binding and schema is
//! a wiring defect and throws at build time, never at call time.
//!
//! ## Example
//!
//! ```cpp
//! auto built = CallTranslator::build(binding, resolver, codecs, scope, transport, contexts);
//! auto methods = unwrap(built)->handler(endpoint);
//! auto rsp = methods.at(ExternalName::of("say"))({std::string("hi")});
//! ```

#ifndef CARP_RUNTIME_CALL_TRANSLATOR_HPP
#define CARP_RUNTIME_CALL_TRANSLATOR_HPP

#include "codec/codec.hpp"
#include "runtime/binding.hpp"
#include "runtime/call_plan.hpp"
#include "runtime/transport.hpp"
#include "types/type_resolver.hpp"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace carp::runtime {

/// Outcome of one call. Empty only for a call that declares no response
/// variant and was answered with no content.
using CallResult = Result<std::optional<CallResponse>, RpcError>;

/// One method of a proxy, bound to its endpoint.
using MethodImplementation = std::function<CallResult(std::vector<std::any> args)>;

/// Creates the per-call codec contexts.
struct ContextFactory {
    std::function<Box<codec::EncodingContext>(net::FingerprintTable&)> encoding;
    std::function<Box<codec::DecodingContext>(const net::FingerprintTable&)> decoding;
};

class CallTranslator {
public:
    /// Builds the plans for every call of `binding`.
    ///
    /// # Arguments
    ///
    /// * `binding` - Generated declaration of the interface; must outlive the translator
    /// * `resolver` - Resolves the interface and the types it mentions
    /// * `codecs` - Supplies argument and field codecs
    /// * `scope` - Scope the interface is resolved from
    /// * `transport` - Carries the requests
    /// * `contexts` - Creates codec contexts for each call
    ///
    /// # Returns
    ///
    /// The translator, or the error that resolving a type produced.
    ///
    /// # Panics
    ///
    /// Throws `std::runtime_error` if the binding and the schema disagree
    /// about calls, arguments, response variants or fields.
    static auto build(const InterfaceBinding& binding, types::TypeResolver& resolver,
                      codec::CodecFactory& codecs, scope::ScopeId scope,
                      Rc<TransportClient> transport, ContextFactory contexts)
        -> Result<Box<CallTranslator>, RpcError>;

    /// Invocation table for a proxy bound to `endpoint`. The closures refer
    /// to this translator, which must outlive them.
    [[nodiscard]] auto handler(const net::Endpoint& endpoint) const
        -> std::map<ExternalName, MethodImplementation>;

    /// Performs one call.
    ///
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if `args` does not match the plan.
    auto invoke(const CallPlan& plan, const net::Endpoint& endpoint,
                std::vector<std::any> args) const -> CallResult;

    /// Plan of a call, or `nullptr`.
    [[nodiscard]] auto plan(const ExternalName& call) const -> const CallPlan*;

    [[nodiscard]] auto binding() const -> const InterfaceBinding& {
        return binding_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return plans_.size();
    }

private:
    CallTranslator(const InterfaceBinding& binding, Rc<TransportClient> transport,
                   ContextFactory contexts)
        : binding_(binding), transport_(std::move(transport)), contexts_(std::move(contexts)) {}

    const InterfaceBinding& binding_;
    Rc<TransportClient> transport_;
    ContextFactory contexts_;
    std::map<ExternalName, CallPlan> plans_;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_CALL_TRANSLATOR_HPP
