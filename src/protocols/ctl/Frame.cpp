#include "protocols/ctl/Frame.hpp"
#include "error/Error.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace usd::ctl {

bool readn(const int fd, void* buf, std::size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= static_cast<std::size_t>(r);
    }
    return true;
}

bool writen(const int fd, const void* buf, std::size_t n) {
    const auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        // MSG_NOSIGNAL: a vanished peer must not raise SIGPIPE
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<std::size_t>(w);
    }
    return true;
}

std::optional<std::string> readFrame(const int fd, const uint32_t maxBytes) {
    unsigned char prefix[4];
    std::size_t got = 0;
    while (got < sizeof(prefix)) {
        const ssize_t r = ::read(fd, prefix + got, sizeof(prefix) - got);
        if (r < 0 && errno == EINTR) continue;
        if (r < 0) throw Error(ErrorKind::Connection, fmt::format("read failed: {}", std::strerror(errno)));
        if (r == 0) {
            if (got == 0) return std::nullopt;
            throw Error(ErrorKind::Protocol, "truncated frame length");
        }
        got += static_cast<std::size_t>(r);
    }

    uint32_t be = 0;
    std::memcpy(&be, prefix, sizeof(be));
    const uint32_t len = ntohl(be);
    if (len > maxBytes)
        throw Error(ErrorKind::Protocol, fmt::format("frame of {} bytes exceeds limit of {}", len, maxBytes));

    std::string body(len, '\0');
    if (len && !readn(fd, body.data(), len)) throw Error(ErrorKind::Protocol, "truncated frame body");
    return body;
}

void writeFrame(const int fd, const std::string& body) {
    const uint32_t len = htonl(static_cast<uint32_t>(body.size()));
    if (!writen(fd, &len, sizeof(len)) || !writen(fd, body.data(), body.size()))
        throw Error(ErrorKind::Connection, "peer closed the connection");
}

// Service output may not be UTF-8; invalid bytes go out as U+FFFD.
void sendJson(const int fd, const nlohmann::json& j) {
    writeFrame(fd, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}
