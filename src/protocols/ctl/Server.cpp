#include "protocols/ctl/Server.hpp"
#include "protocols/ctl/Frame.hpp"
#include "protocols/ctl/Router.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace usd::log;
using usd::util::UniqueFd;
namespace fs = std::filesystem;

namespace usd::ctl {

namespace {

struct Peer {
    uid_t uid;
    gid_t gid;
    pid_t pid;
};

Peer peercred(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (::getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) != 0)
        throw Error(ErrorKind::Connection, fmt::format("SO_PEERCRED failed: {}", std::strerror(errno)));
    return {c.uid, c.gid, c.pid};
}

sockaddr_un makeAddress(const fs::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const auto& s = path.native();
    if (s.size() >= sizeof(addr.sun_path))
        throw Error(ErrorKind::Connection, fmt::format("socket path too long: {}", s));
    std::memcpy(addr.sun_path, s.c_str(), s.size() + 1);
    return addr;
}

bool daemonAnswers(const fs::path& path) {
    const UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) return false;
    const auto addr = makeAddress(path);
    return ::connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
}

}

Server::Server(std::shared_ptr<Router> router, fs::path socketPath, const uint32_t maxRequestBytes)
    : AsyncService("CtlServer"),
      router_(std::move(router)),
      socketPath_(std::move(socketPath)),
      maxRequestBytes_(maxRequestBytes) {}

Server::~Server() {
    stop();
    if (listenFd_) {
        listenFd_.reset();
        ::unlink(socketPath_.c_str());
    }
}

void Server::bind() {
    util::ensurePrivateDir(socketPath_.parent_path());

    if (fs::exists(fs::symlink_status(socketPath_))) {
        if (daemonAnswers(socketPath_))
            throw Error(ErrorKind::Connection, fmt::format("another daemon is already listening on {}", socketPath_.string()));
        Registry::ctl()->info("[CtlServer] Removing stale socket {}", socketPath_.string());
        ::unlink(socketPath_.c_str());
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd) throw Error(ErrorKind::Connection, fmt::format("socket() failed: {}", std::strerror(errno)));

    const auto addr = makeAddress(socketPath_);
    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0)
        throw Error(ErrorKind::Connection, fmt::format("bind({}) failed: {}", socketPath_.string(), std::strerror(errno)));

    if (::chmod(socketPath_.c_str(), 0600) != 0)
        Registry::ctl()->warn("[CtlServer] chmod 0600 on {} failed: {}", socketPath_.string(), std::strerror(errno));

    if (::listen(fd.get(), 16) != 0)
        throw Error(ErrorKind::Connection, fmt::format("listen() failed: {}", std::strerror(errno)));

    listenFd_ = std::move(fd);
    Registry::ctl()->info("[CtlServer] Listening on {}", socketPath_.string());
}

std::size_t Server::activeConnections() const {
    std::lock_guard lock(connMutex_);
    std::size_t n = 0;
    for (const auto& c : connections_)
        if (!c->done.load()) ++n;
    return n;
}

void Server::onStop() {
    // wakes accept() and every blocked connection read
    if (listenFd_) ::shutdown(listenFd_.get(), SHUT_RDWR);
    std::lock_guard lock(connMutex_);
    for (const auto& c : connections_) ::shutdown(c->fd.get(), SHUT_RDWR);
}

void Server::runLoop() {
    if (!listenFd_) bind();

    while (!interruptFlag_.load()) {
        UniqueFd cfd(::accept4(listenFd_.get(), nullptr, nullptr, SOCK_CLOEXEC));
        if (!cfd) {
            if (interruptFlag_.load()) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            Registry::ctl()->error("[CtlServer] accept failed: {}", std::strerror(errno));
            break;
        }

        joinFinished();

        auto conn = std::make_unique<Connection>();
        conn->fd = std::move(cfd);
        auto* raw = conn.get();

        std::lock_guard lock(connMutex_);
        if (interruptFlag_.load()) break;
        connections_.push_back(std::move(conn));
        raw->thread = std::thread([this, raw] {
            serve(*raw);
            // the peer sees EOF now; the fd is closed when the thread is joined
            ::shutdown(raw->fd.get(), SHUT_RDWR);
            raw->done.store(true);
        });
    }

    closeAll();
}

void Server::serve(Connection& conn) const {
    const int fd = conn.fd.get();

    try {
        const auto peer = peercred(fd);
        if (peer.uid != ::geteuid()) {
            Registry::ctl()->warn("[CtlServer] Rejecting connection from UID {} (PID {})", peer.uid, peer.pid);
            sendJson(fd, toJson(Response::failure(ErrorKind::Protocol, "permission denied")));
            return;
        }
        Registry::ctl()->debug("[CtlServer] Connection from PID {}", peer.pid);

        while (!interruptFlag_.load()) {
            std::optional<std::string> body;
            try {
                body = readFrame(fd, maxRequestBytes_);
            } catch (const Error& e) {
                if (e.kind() != ErrorKind::Protocol) throw;
                Registry::ctl()->warn("[CtlServer] Closing connection from PID {}: {}", peer.pid, e.what());
                sendJson(fd, toJson(Response::failure(ErrorKind::Protocol, e.what())));
                return;
            }
            if (!body) return;

            sendJson(fd, toJson(router_->handle(*body)));
        }
    } catch (const Error& e) {
        Registry::ctl()->debug("[CtlServer] Connection ended: {}", e.what());
    } catch (const std::exception& e) {
        Registry::ctl()->error("[CtlServer] Connection handler failed: {}", e.what());
    }
}

void Server::joinFinished() {
    std::lock_guard lock(connMutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        if ((*it)->done.load()) {
            if ((*it)->thread.joinable()) (*it)->thread.join();
            it = connections_.erase(it);
        } else ++it;
    }
}

void Server::closeAll() {
    std::list<std::unique_ptr<Connection>> conns;
    {
        std::lock_guard lock(connMutex_);
        for (const auto& c : connections_) ::shutdown(c->fd.get(), SHUT_RDWR);
        conns.swap(connections_);
    }
    for (const auto& c : conns)
        if (c->thread.joinable()) c->thread.join();

    Registry::ctl()->debug("[CtlServer] Closed {} connection(s)", conns.size());
}

}
