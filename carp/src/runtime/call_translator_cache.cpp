#include "runtime/call_translator_cache.hpp"

#include "log/log.hpp"

namespace carp::runtime {

auto CallTranslatorCache::get(const InterfaceBinding& binding)
    -> Result<Rc<CallTranslator>, RpcError> {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->entries.find(&binding);
    if (it != state_->entries.end()) {
        if (auto live = it->second.get()) {
            return live;
        }
    }

    auto built = factory_(binding);
    if (is_err(built)) {
        return unwrap_err(built);
    }

    const InterfaceBinding* key = &binding;
    std::weak_ptr<State> weak = state_;
    ExternalName name = binding.type_name();
    auto watched = watch(std::move(unwrap(built)), [weak, key, name](uint64_t id) {
        auto state = weak.lock();
        if (!state) {
            return;
        }
        std::lock_guard<std::mutex> inner(state->mutex);
        auto found = state->entries.find(key);
        if (found != state->entries.end() && found->second.id == id) {
            state->entries.erase(found);
            CARP_LOG_DEBUG("reclaim", "translator for " << name << " reclaimed");
        }
    });
    state_->entries.insert_or_assign(key, watched.ref);
    return watched.strong;
}

auto CallTranslatorCache::size() const -> size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

} // namespace carp::runtime
