#pragma once

#include "services/AsyncService.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace usd::supervisor {

// Deadline scheduler running callbacks on its own thread. Callbacks run without the
// queue lock held, so they may schedule or cancel other timers.
class TimerQueue final : public services::AsyncService {
public:
    using Clock = std::chrono::steady_clock;
    using Id = uint64_t;
    using Callback = std::function<void(Id)>;

    TimerQueue();
    ~TimerQueue() override;

    Id schedule(Clock::duration delay, Callback fn);

    // False when the timer already fired or was never scheduled.
    bool cancel(Id id);

    [[nodiscard]] std::size_t pending() const;

protected:
    void runLoop() override;
    void onStop() override;

private:
    struct Timer {
        Id id;
        Callback fn;
    };

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, Timer> timers_;
    std::map<Id, Clock::time_point> index_;
    Id nextId_ = 1;
};

}
