#include "util/files.hpp"

#include <cerrno>
#include <deque>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

void writeAll(const int fd, const std::string& content, const fs::path& path) {
    const char* p = content.data();
    std::size_t n = content.size();
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            throwErrno("write " + path.string());
        }
        p += w;
        n -= static_cast<std::size_t>(w);
    }
}

}

namespace usd::util {

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<std::size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void writeFileAtomic(const fs::path& path, const std::string& content, const unsigned mode) {
    const auto dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    const auto tmp = dir / ("." + path.filename().string() + ".tmp." + generate_random_suffix());

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
    if (fd < 0) throwErrno("open " + tmp.string());

    try {
        writeAll(fd, content, tmp);
        if (::fsync(fd) != 0) throwErrno("fsync " + tmp.string());
    } catch (...) {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "close " + tmp.string());
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw std::system_error(err, std::generic_category(), "rename " + tmp.string() + " -> " + path.string());
    }

    // Persist the rename itself
    if (const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC); dfd >= 0) {
        const int rc = ::fsync(dfd);
        const int err = errno;
        ::close(dfd);
        if (rc != 0) throw UnsyncedRename(err, std::generic_category(), "fsync " + dir.string());
    }
}

std::vector<std::string> tailLines(const fs::path& path, const std::size_t lines) {
    std::ifstream in(path);
    if (!in || lines == 0) return {};

    std::deque<std::string> window;
    for (std::string line; std::getline(in, line);) {
        window.push_back(std::move(line));
        if (window.size() > lines) window.pop_front();
    }
    return {window.begin(), window.end()};
}

void ensurePrivateDir(const fs::path& dir, const unsigned mode) {
    fs::create_directories(dir);
    fs::permissions(dir, static_cast<fs::perms>(mode), fs::perm_options::replace);
}

std::string generate_random_suffix(const std::size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

}
