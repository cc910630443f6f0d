#include "log/log.hpp"
#include "runtime/collectible.hpp"

#include <atomic>
#include <stdexcept>

namespace carp::runtime {

auto next_collectible_id() -> uint64_t {
    static std::atomic<uint64_t> next{1};
    return next.fetch_add(1, std::memory_order_relaxed);
}

auto ReclaimDaemon::instance() -> ReclaimDaemon& {
    // Leaked: the detached thread may still be waiting at exit.
    static ReclaimDaemon* daemon = new ReclaimDaemon();
    return *daemon;
}

ReclaimDaemon::ReclaimDaemon() {
    std::thread worker([this] { run(); });
    thread_id_ = worker.get_id();
    worker.detach();
    CARP_LOG_DEBUG("reclaim", "daemon started");
}

void ReclaimDaemon::post(std::function<void()> action) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(action));
        ++posted_;
    }
    work_cv_.notify_one();
}

void ReclaimDaemon::flush() {
    if (on_daemon_thread()) {
        throw std::logic_error("ReclaimDaemon::flush called from the daemon thread");
    }
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t target = posted_;
    done_cv_.wait(lock, [this, target] { return completed_ >= target; });
}

auto ReclaimDaemon::completed() -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

auto ReclaimDaemon::failures() -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void ReclaimDaemon::run() {
    for (;;) {
        std::function<void()> action;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !queue_.empty(); });
            action = std::move(queue_.front());
            queue_.pop_front();
        }

        bool failed = false;
        try {
            action();
        } catch (const std::exception& e) {
            failed = true;
            CARP_LOG_WARN("reclaim", "cleanup failed: " << e.what());
        }
        action = nullptr;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++completed_;
            if (failed) {
                ++failures_;
            }
        }
        done_cv_.notify_all();
    }
}

} // namespace carp::runtime
