#include "runtime/proxy.hpp"

#include <stdexcept>

namespace carp::runtime {

Proxy::Proxy(Rc<CallTranslator> translator, net::Endpoint endpoint)
    : translator_(std::move(translator)), endpoint_(std::move(endpoint)),
      methods_(translator_->handler(endpoint_)) {}

auto Proxy::invoke(const ExternalName& call, std::vector<std::any> args) const -> CallResult {
    auto it = methods_.find(call);
    if (it == methods_.end()) {
        throw std::invalid_argument(binding().type_name().to_string() + " has no call " +
                                    call.to_string());
    }
    return it->second(std::move(args));
}

auto Proxy::to_string() const -> std::string {
    return "carp:" + endpoint_.to_string();
}

} // namespace carp::runtime
