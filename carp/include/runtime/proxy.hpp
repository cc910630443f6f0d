//! # Proxies
//!
//! Local stand-in for a remote receiver. A proxy is bound to one endpoint
//! and one interface for its whole life; two proxies are the same receiver
//! only if they are the same object.

#ifndef CARP_RUNTIME_PROXY_HPP
#define CARP_RUNTIME_PROXY_HPP

#include "runtime/call_translator.hpp"

#include <map>
#include <string>
#include <vector>

namespace carp::runtime {

class Proxy {
public:
    Proxy(Rc<CallTranslator> translator, net::Endpoint endpoint);

    Proxy(const Proxy&) = delete;
    auto operator=(const Proxy&) -> Proxy& = delete;

    /// Calls a method of the remote receiver.
    ///
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if the interface has no such call, or
    /// the arguments do not fit it.
    auto invoke(const ExternalName& call, std::vector<std::any> args) const -> CallResult;

    [[nodiscard]] auto endpoint() const -> const net::Endpoint& {
        return endpoint_;
    }

    [[nodiscard]] auto binding() const -> const InterfaceBinding& {
        return translator_->binding();
    }

    /// `carp:` followed by the endpoint.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    Rc<CallTranslator> translator_;
    net::Endpoint endpoint_;
    std::map<ExternalName, MethodImplementation> methods_;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_PROXY_HPP
