#include "runtime/call_translator.hpp"

#include "log/log.hpp"
#include "runtime/wire_protocol.hpp"

#include <set>
#include <stdexcept>

namespace carp::runtime {

// ============================================================================
// ResponseDecoder
// ============================================================================

auto ResponseDecoder::decode(const wire::WireValue& rsp, codec::DecodingContext& ctx) const
    -> Result<std::any, RpcError> {
    Box<ResponseBuilder> builder;
    for (const auto& param : params_) {
        const wire::WireValue* field = rsp.get(param.name.to_string());
        if (field == nullptr || field->is_null()) {
            if (!param.optional) {
                return RpcError::protocol("response " + variant_.to_string() + " lacks field " +
                                          param.name.to_string());
            }
            continue;
        }
        auto value = param.decoder->decode(*field, ctx);
        if (is_err(value)) {
            return value;
        }
        if (!builder) {
            builder = param.init_setter(std::move(unwrap(value)));
            if (!builder) {
                throw std::runtime_error("init setter of " + variant_.to_string() + "." +
                                         param.name.to_string() + " yielded no builder");
            }
        } else {
            param.setter(*builder, std::move(unwrap(value)));
        }
    }
    if (!builder) {
        return init_done_();
    }
    return builder->complete();
}

// ============================================================================
// Construction
// ============================================================================

namespace {

auto names_of(const std::vector<model::Field>& fields) -> std::vector<ExternalName> {
    std::vector<ExternalName> out;
    out.reserve(fields.size());
    for (const auto& f : fields) {
        out.push_back(f.name);
    }
    return out;
}

auto find_field(const ResponseBinding& binding, const ExternalName& name) -> const FieldBinding* {
    for (const auto& f : binding.fields) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

auto find_response(const CallBinding& binding, const ExternalName& name)
    -> const ResponseBinding* {
    for (const auto& r : binding.responses) {
        if (r.name == name) {
            return &r;
        }
    }
    return nullptr;
}

[[noreturn]] void defect(const InterfaceBinding& binding, const std::string& what) {
    throw std::runtime_error("interface " + binding.type_name().to_string() + ": " + what);
}

} // namespace

auto CallTranslator::build(const InterfaceBinding& binding, types::TypeResolver& resolver,
                           codec::CodecFactory& codecs, scope::ScopeId scope,
                           Rc<TransportClient> transport, ContextFactory contexts)
    -> Result<Box<CallTranslator>, RpcError> {
    auto record = resolver.resolve(binding.type_name(), scope);
    if (is_err(record)) {
        return unwrap_err(record);
    }
    const types::TypeRecord& iface = unwrap(record);
    if (iface.type->kind != model::Type::Kind::Interface) {
        defect(binding, "schema type is " + iface.type->describe());
    }

    for (const auto& call : binding.calls) {
        if (iface.type->calls.find(call.name) == iface.type->calls.end()) {
            defect(binding, "no call " + call.name.to_string() + " in schema");
        }
    }

    Box<CallTranslator> translator(
        new CallTranslator(binding, std::move(transport), std::move(contexts)));

    for (const auto& [call_name, spec] : iface.type->calls) {
        const CallBinding* call = binding.find(call_name);
        if (call == nullptr) {
            defect(binding, "binding lacks call " + call_name.to_string());
        }
        if (call->arguments != names_of(spec.params)) {
            defect(binding, "arguments of " + call_name.to_string() +
                                " differ from the schema's parameters");
        }

        CallPlan plan{call_name, {}, {}, false};
        for (const auto& param : spec.params) {
            auto encoder = codecs.encoder_for(*param.type, iface.scope);
            if (is_err(encoder)) {
                return unwrap_err(encoder);
            }
            plan.params.push_back(OutParam{param.name, unwrap(encoder), param.optional});
        }

        for (const auto& rsp : call->responses) {
            if (spec.responses.find(rsp.name) == spec.responses.end()) {
                defect(binding, "call " + call_name.to_string() + " has no response " +
                                    rsp.name.to_string() + " in schema");
            }
        }

        for (const auto& [rsp_name, rsp_spec] : spec.responses) {
            const ResponseBinding* rsp = find_response(*call, rsp_name);
            if (rsp == nullptr) {
                defect(binding, "binding lacks response " + call_name.to_string() + "." +
                                    rsp_name.to_string());
            }
            if (!rsp->init_done) {
                defect(binding, "response " + rsp_name.to_string() + " has no empty form");
            }
            if (rsp->fields.size() != rsp_spec.fields.size()) {
                defect(binding, "fields of " + call_name.to_string() + "." +
                                    rsp_name.to_string() + " differ from the schema");
            }

            std::vector<InParam> params;
            for (const auto& field : rsp_spec.fields) {
                const FieldBinding* fb = find_field(*rsp, field.name);
                if (fb == nullptr || !fb->init_setter || !fb->setter) {
                    defect(binding, "binding lacks setters for " + call_name.to_string() + "." +
                                        rsp_name.to_string() + "." + field.name.to_string());
                }
                auto decoder = codecs.decoder_for(*field.type, iface.scope);
                if (is_err(decoder)) {
                    return unwrap_err(decoder);
                }
                params.push_back(InParam{field.name, unwrap(decoder), fb->init_setter,
                                         fb->setter, field.optional});
            }
            plan.responses.emplace(rsp_name,
                                   ResponseDecoder(rsp_name, rsp->init_done, std::move(params)));
        }

        plan.accepts_empty_body =
            plan.responses.empty() ||
            (plan.responses.size() == 1 && plan.responses.begin()->second.params().empty());
        translator->plans_.emplace(call_name, std::move(plan));
    }

    CARP_LOG_DEBUG("client", "translator for " << binding.type_name() << " with "
                                               << translator->plans_.size() << " calls");
    return translator;
}

// ============================================================================
// Invocation
// ============================================================================

auto CallTranslator::plan(const ExternalName& call) const -> const CallPlan* {
    auto it = plans_.find(call);
    return it == plans_.end() ? nullptr : &it->second;
}

auto CallTranslator::handler(const net::Endpoint& endpoint) const
    -> std::map<ExternalName, MethodImplementation> {
    std::map<ExternalName, MethodImplementation> methods;
    for (const auto& [name, plan] : plans_) {
        const CallPlan* p = &plan;
        methods.emplace(name, [this, p, endpoint](std::vector<std::any> args) {
            return invoke(*p, endpoint, std::move(args));
        });
    }
    return methods;
}

auto CallTranslator::invoke(const CallPlan& plan, const net::Endpoint& endpoint,
                            std::vector<std::any> args) const -> CallResult {
    if (args.size() != plan.params.size()) {
        throw std::invalid_argument("call " + plan.call.to_string() + " takes " +
                                    std::to_string(plan.params.size()) + " arguments, got " +
                                    std::to_string(args.size()));
    }

    net::FingerprintTable out_prints;
    auto enc = contexts_.encoding(out_prints);
    wire::WireValue req{wire::WireObject{}};
    for (size_t i = 0; i < args.size(); ++i) {
        const OutParam& param = plan.params[i];
        if (!args[i].has_value()) {
            if (!param.optional) {
                throw std::invalid_argument("call " + plan.call.to_string() +
                                            " requires argument " + param.name.to_string());
            }
            continue;
        }
        auto encoded = param.encoder->encode(args[i], *enc);
        if (is_err(encoded)) {
            return unwrap_err(encoded);
        }
        req.set(param.name.to_string(), std::move(unwrap(encoded)));
    }

    auto body = build_request(plan.call, std::move(req), out_prints).to_string();
    if (RuntimeOptions::trace_bodies) {
        CARP_LOG_TRACE("client", "req to " << endpoint << ": " << body);
    }

    auto sent = transport_->post(endpoint, RuntimeOptions::content_type, body);
    if (is_err(sent)) {
        CARP_LOG_DEBUG("client", "transport to " << endpoint << " failed: " << unwrap_err(sent));
        return RpcError::transport(endpoint.to_string() + ": " + unwrap_err(sent));
    }

    auto interpreted = interpret_response(endpoint, unwrap(sent));
    if (is_err(interpreted)) {
        return unwrap_err(interpreted);
    }
    ResponseEnvelope& envelope = unwrap(interpreted);

    if (envelope.no_content) {
        if (!plan.accepts_empty_body) {
            return RpcError::remote_invocation("empty response to " + plan.call.to_string() +
                                               " from " + endpoint.to_string());
        }
        if (plan.responses.empty()) {
            return std::optional<CallResponse>();
        }
        const auto& only = plan.responses.begin()->second;
        return std::optional<CallResponse>(CallResponse{only.variant(), only.empty()});
    }

    auto it = plan.responses.find(*envelope.variant);
    if (it == plan.responses.end()) {
        return RpcError::protocol("call " + plan.call.to_string() + " has no response " +
                                  envelope.variant->to_string());
    }

    auto dec = contexts_.decoding(envelope.prints);
    auto value = it->second.decode(envelope.rsp, *dec);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    return std::optional<CallResponse>(CallResponse{it->first, std::move(unwrap(value))});
}

} // namespace carp::runtime
