#include "supervisor/TimerQueue.hpp"
#include "log/Registry.hpp"

using namespace usd::log;

namespace usd::supervisor {

TimerQueue::TimerQueue() : AsyncService("TimerQueue") {}

TimerQueue::~TimerQueue() { stop(); }

TimerQueue::Id TimerQueue::schedule(const Clock::duration delay, Callback fn) {
    std::lock_guard lock(mutex_);
    const Id id = nextId_++;
    const auto deadline = Clock::now() + delay;
    timers_.emplace(deadline, Timer{id, std::move(fn)});
    index_.emplace(id, deadline);
    cv_.notify_all();
    return id;
}

bool TimerQueue::cancel(const Id id) {
    std::lock_guard lock(mutex_);
    const auto it = index_.find(id);
    if (it == index_.end()) return false;

    auto [first, last] = timers_.equal_range(it->second);
    for (; first != last; ++first) {
        if (first->second.id == id) {
            timers_.erase(first);
            break;
        }
    }
    index_.erase(it);
    return true;
}

std::size_t TimerQueue::pending() const {
    std::lock_guard lock(mutex_);
    return timers_.size();
}

void TimerQueue::onStop() {
    std::lock_guard lock(mutex_);
    cv_.notify_all();
}

void TimerQueue::runLoop() {
    std::unique_lock lock(mutex_);
    while (!interruptFlag_.load()) {
        if (timers_.empty()) {
            cv_.wait(lock, [this] { return interruptFlag_.load() || !timers_.empty(); });
            continue;
        }

        const auto deadline = timers_.begin()->first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        auto node = timers_.extract(timers_.begin());
        index_.erase(node.mapped().id);

        lock.unlock();
        try {
            node.mapped().fn(node.mapped().id);
        } catch (const std::exception& e) {
            Registry::supervisor()->error("[TimerQueue] Timer {} callback failed: {}", node.mapped().id, e.what());
        }
        lock.lock();
    }
}

}
