#pragma once

#include "services/AsyncService.hpp"
#include "util/UniqueFd.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace usd::ctl {

class Router;

// Unix-socket control endpoint. One thread per connection; each connection carries any
// number of request/response frames until the client hangs up.
class Server final : public services::AsyncService {
public:
    Server(std::shared_ptr<Router> router, std::filesystem::path socketPath, uint32_t maxRequestBytes);
    ~Server() override;

    // Creates the runtime directory (0700) and binds the socket (0600). Throws Error(Connection)
    // if another daemon already answers on the socket; a stale socket file is replaced.
    void bind();

    [[nodiscard]] const std::filesystem::path& socketPath() const noexcept { return socketPath_; }
    [[nodiscard]] std::size_t activeConnections() const;

protected:
    void runLoop() override;
    void onStop() override;

private:
    struct Connection {
        util::UniqueFd fd;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    std::shared_ptr<Router> router_;
    std::filesystem::path socketPath_;
    uint32_t maxRequestBytes_;
    util::UniqueFd listenFd_;

    mutable std::mutex connMutex_;
    std::list<std::unique_ptr<Connection>> connections_;

    void serve(Connection& conn) const;
    void joinFinished();
    void closeAll();
};

}
