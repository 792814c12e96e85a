#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace usd::ctl {

// Wire framing: 4-byte big-endian length followed by a UTF-8 JSON body.

// False on EOF or a socket error before all bytes arrived.
bool readn(int fd, void* buf, std::size_t n);
bool writen(int fd, const void* buf, std::size_t n);

// nullopt on a clean EOF before the length prefix. Throws Error(Protocol) on an
// oversized or truncated frame.
std::optional<std::string> readFrame(int fd, uint32_t maxBytes);

// Throws Error(Connection) when the peer went away.
void writeFrame(int fd, const std::string& body);

void sendJson(int fd, const nlohmann::json& j);

}
