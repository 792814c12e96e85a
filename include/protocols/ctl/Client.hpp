#pragma once

#include "protocols/ctl/Request.hpp"
#include "util/UniqueFd.hpp"

#include <cstdint>
#include <filesystem>

namespace usd::ctl {

class Client {
public:
    explicit Client(std::filesystem::path socketPath);

    // Throws Error(Connection) when no daemon listens on the socket.
    void connect();

    // Sends one request and waits for its response. Connects on first use.
    Response call(const Request& req);

    // Raw exchange for arbitrary bodies.
    nlohmann::json callRaw(const std::string& body);

    [[nodiscard]] bool connected() const noexcept { return fd_.valid(); }

private:
    static constexpr uint32_t MAX_RESPONSE_BYTES = 64 * 1024 * 1024;

    std::filesystem::path socketPath_;
    util::UniqueFd fd_;
};

}
