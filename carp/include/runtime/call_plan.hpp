//! # Call Plans
//!
//! The fixed encoding and decoding recipe for one call of an interface,
//! built once by the call translator and never changed afterwards.

#ifndef CARP_RUNTIME_CALL_PLAN_HPP
#define CARP_RUNTIME_CALL_PLAN_HPP

#include "codec/codec.hpp"
#include "runtime/binding.hpp"

#include <map>
#include <vector>

namespace carp::runtime {

/// An argument, in declaration order.
struct OutParam {
    ExternalName name;
    Rc<const codec::Encoder> encoder;
    bool optional = false;
};

/// A field of a response variant, in declaration order.
struct InParam {
    ExternalName name;
    Rc<const codec::Decoder> decoder;
    std::function<Box<ResponseBuilder>(std::any)> init_setter;
    std::function<void(ResponseBuilder&, std::any)> setter;
    bool optional = false;
};

/// Rebuilds the native value of one response variant.
class ResponseDecoder {
public:
    ResponseDecoder(ExternalName variant, std::function<std::any()> init_done,
                    std::vector<InParam> params)
        : variant_(std::move(variant)), init_done_(std::move(init_done)),
          params_(std::move(params)) {}

    /// Decodes the `rsp` object of a response.
    ///
    /// Fields are visited in declaration order and absent ones skipped. The
    /// first present field starts a builder, later ones update it. With no
    /// field present the value comes from `init_done` and no builder exists.
    ///
    /// # Returns
    ///
    /// The native value, or a `Protocol` error if a required field is
    /// missing, or whatever error a field decoder reports.
    auto decode(const wire::WireValue& rsp, codec::DecodingContext& ctx) const
        -> Result<std::any, RpcError>;

    /// Value for an empty body.
    [[nodiscard]] auto empty() const -> std::any {
        return init_done_();
    }

    [[nodiscard]] auto variant() const -> const ExternalName& {
        return variant_;
    }

    [[nodiscard]] auto params() const -> const std::vector<InParam>& {
        return params_;
    }

private:
    ExternalName variant_;
    std::function<std::any()> init_done_;
    std::vector<InParam> params_;
};

struct CallPlan {
    ExternalName call;
    std::vector<OutParam> params;
    std::map<ExternalName, ResponseDecoder> responses;

    /// A 204 answer is accepted when the call declares no variant, or a
    /// single variant without fields.
    bool accepts_empty_body = false;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_CALL_PLAN_HPP
