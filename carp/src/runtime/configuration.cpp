#include "runtime/configuration.hpp"

namespace carp::runtime {

auto ClientConfig::validate() const -> Result<bool, std::string> {
    if (!transport) {
        return std::string("no transport client configured");
    }
    if (!arena) {
        return std::string("no scope arena configured");
    }
    if (!arena->contains(scope)) {
        return std::string("scope ") + std::to_string(scope) + " is not in the arena";
    }
    if (resolver && &resolver->arena() != arena.get()) {
        return std::string("resolver is over a different scope arena");
    }
    if (codecs && !resolver) {
        return std::string("custom codecs need the resolver they were built with");
    }
    return true;
}

} // namespace carp::runtime
