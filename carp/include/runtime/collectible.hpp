//! # Collectible References
//!
//! Cache entries that disappear once nothing else holds their value.
//!
//! `watch()` takes ownership of a value and returns a strong handle plus a
//! `CollectibleRef` that a cache keeps. When the last strong handle goes
//! away the value is destroyed and the cleanup action is queued on the
//! `ReclaimDaemon`, which runs it on its own thread. Each watched value gets
//! a process-unique id so a cleanup can check that the cache entry it is
//! about to remove is still the one it was created for.
//!
//! ```text
//! caller drops last Rc<Proxy>
//!   -> deleter: delete proxy, post cleanup(id)
//!        -> daemon thread: cleanup(id)
//!             -> cache lock, remove entry if its id is still `id`
//! ```

#ifndef CARP_RUNTIME_COLLECTIBLE_HPP
#define CARP_RUNTIME_COLLECTIBLE_HPP

#include "common.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace carp::runtime {

// ============================================================================
// ReclaimDaemon
// ============================================================================

/// The single background thread that runs cleanup actions.
///
/// The thread is detached and the instance is never destroyed, so it does
/// not hold the process open. An action that throws a `std::exception` is
/// logged and skipped; anything else escapes the thread and terminates the
/// process.
class ReclaimDaemon {
public:
    static auto instance() -> ReclaimDaemon&;

    ReclaimDaemon(const ReclaimDaemon&) = delete;
    auto operator=(const ReclaimDaemon&) -> ReclaimDaemon& = delete;

    /// Queues an action. Never blocks on running actions.
    void post(std::function<void()> action);

    /// Waits until every action posted before this call has run.
    ///
    /// # Panics
    ///
    /// Throws `std::logic_error` when called from the daemon thread itself.
    void flush();

    [[nodiscard]] auto completed() -> uint64_t;

    /// Actions that ended with an exception.
    [[nodiscard]] auto failures() -> uint64_t;

    [[nodiscard]] auto on_daemon_thread() const -> bool {
        return std::this_thread::get_id() == thread_id_;
    }

private:
    ReclaimDaemon();

    void run();

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::deque<std::function<void()>> queue_;
    uint64_t posted_ = 0;
    uint64_t completed_ = 0;
    uint64_t failures_ = 0;
    std::thread::id thread_id_;
};

// ============================================================================
// Watched Values
// ============================================================================

/// What a cache keeps for a value it does not own.
template <typename T> struct CollectibleRef {
    std::weak_ptr<T> ref;
    uint64_t id = 0;

    /// The value, or null once reclaimed.
    [[nodiscard]] auto get() const -> Rc<T> {
        return ref.lock();
    }
};

template <typename T> struct Watched {
    Rc<T> strong;
    CollectibleRef<T> ref;
};

/// Process-unique id for the next watched value.
auto next_collectible_id() -> uint64_t;

/// Takes ownership of `value` and arranges for `cleanup(id)` to run on the
/// daemon after the value is destroyed.
template <typename T>
auto watch(Box<T> value, std::function<void(uint64_t)> cleanup) -> Watched<T> {
    uint64_t id = next_collectible_id();
    Rc<T> strong(value.release(), [id, cleanup = std::move(cleanup)](T* raw) {
        delete raw;
        ReclaimDaemon::instance().post([id, cleanup] { cleanup(id); });
    });
    CollectibleRef<T> ref{strong, id};
    return Watched<T>{std::move(strong), std::move(ref)};
}

} // namespace carp::runtime

#endif // CARP_RUNTIME_COLLECTIBLE_HPP
