#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace usd::services;
using namespace usd::log;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    // Subclasses stop() in their own destructor while their members are alive;
    // this only joins what is left.
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true);
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::daemon()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::daemon()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::daemon()->debug("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true);
    onStop();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::daemon()->debug("[{}] Service stopped.", serviceName_);
}
