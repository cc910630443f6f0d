//! # Call Translator Cache
//!
//! One translator per interface binding, shared by every proxy of that
//! interface. The cache does not keep translators alive: once the last
//! proxy using one is gone it is reclaimed, and the next request builds a
//! fresh one.

#ifndef CARP_RUNTIME_CALL_TRANSLATOR_CACHE_HPP
#define CARP_RUNTIME_CALL_TRANSLATOR_CACHE_HPP

#include "runtime/call_translator.hpp"
#include "runtime/collectible.hpp"

#include <functional>
#include <map>
#include <mutex>

namespace carp::runtime {

class CallTranslatorCache {
public:
    using Factory = std::function<Result<Box<CallTranslator>, RpcError>(const InterfaceBinding&)>;

    explicit CallTranslatorCache(Factory factory)
        : factory_(std::move(factory)), state_(make_rc<State>()) {}

    /// The live translator for `binding`, building one if there is none.
    /// At most one build per binding runs at a time.
    auto get(const InterfaceBinding& binding) -> Result<Rc<CallTranslator>, RpcError>;

    /// Entries currently held, reclaimed ones not yet cleaned up included.
    [[nodiscard]] auto size() const -> size_t;

private:
    struct State {
        std::mutex mutex;
        std::map<const InterfaceBinding*, CollectibleRef<CallTranslator>> entries;
    };

    Factory factory_;
    Rc<State> state_;
};

} // namespace carp::runtime

#endif // CARP_RUNTIME_CALL_TRANSLATOR_CACHE_HPP
