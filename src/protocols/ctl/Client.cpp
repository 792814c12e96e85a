#include "protocols/ctl/Client.hpp"
#include "protocols/ctl/Frame.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <fmt/format.h>

namespace usd::ctl {

Client::Client(std::filesystem::path socketPath) : socketPath_(std::move(socketPath)) {}

void Client::connect() {
    if (fd_) return;

    util::UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) throw Error(ErrorKind::Connection, fmt::format("socket() failed: {}", std::strerror(errno)));

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const auto& path = socketPath_.native();
    if (path.size() >= sizeof(addr.sun_path))
        throw Error(ErrorKind::Connection, fmt::format("socket path too long: {}", path));
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0)
        throw Error(ErrorKind::Connection,
                    fmt::format("cannot reach userserversd at {}: {}", path, std::strerror(errno)));

    fd_ = std::move(fd);
}

nlohmann::json Client::callRaw(const std::string& body) {
    connect();
    try {
        writeFrame(fd_.get(), body);
        const auto reply = readFrame(fd_.get(), MAX_RESPONSE_BYTES);
        if (!reply) throw Error(ErrorKind::Connection, "daemon closed the connection");
        return nlohmann::json::parse(*reply);
    } catch (const nlohmann::json::parse_error& e) {
        fd_.reset();
        throw Error(ErrorKind::Protocol, fmt::format("undecodable response: {}", e.what()));
    } catch (const Error&) {
        fd_.reset();
        throw;
    }
}

Response Client::call(const Request& req) { return parseResponse(callRaw(toJson(req).dump())); }

}
