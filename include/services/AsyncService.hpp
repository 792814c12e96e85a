#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace usd::services {

// Background worker thread with start/stop lifecycle. Subclasses implement runLoop()
// and poll running_/interruptFlag_; onStop() wakes a loop blocked in a syscall.
class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const noexcept { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    virtual void onStop() {}
};

}
