#include "protocols/framing.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <unistd.h>

using namespace tr::protocols;

FrameTooLarge::FrameTooLarge(const uint32_t len, const size_t max)
    : std::runtime_error(fmt::format("request too large ({} bytes, limit {})", len, max)),
      length(len), limit(max) {}

bool tr::protocols::readn(const int fd, void* buf, size_t n) {
    auto* p = static_cast<unsigned char*>(buf);
    while (n) {
        const ssize_t r = ::read(fd, p, n);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        p += r;
        n -= static_cast<size_t>(r);
    }
    return true;
}

bool tr::protocols::writen(const int fd, const void* buf, size_t n) {
    auto* p = static_cast<const unsigned char*>(buf);
    while (n) {
        // MSG_NOSIGNAL keeps a vanished peer from raising SIGPIPE
        const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        p += w;
        n -= static_cast<size_t>(w);
    }
    return true;
}

bool tr::protocols::sendFrame(const int fd, const std::string& body) {
    const uint32_t len = htonl(static_cast<uint32_t>(body.size()));
    return writen(fd, &len, FRAME_HEADER_BYTES) && writen(fd, body.data(), body.size());
}

bool tr::protocols::sendJson(const int fd, const nlohmann::json& j) {
    // child output is raw bytes; invalid UTF-8 goes out as U+FFFD instead of throwing
    return sendFrame(fd, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string tr::protocols::recvFrame(const int fd, const size_t maxBytes) {
    uint32_t be = 0;
    if (!readn(fd, &be, FRAME_HEADER_BYTES)) throw std::runtime_error("EOF reading length");
    const uint32_t len = ntohl(be);
    if (len > maxBytes) throw FrameTooLarge(len, maxBytes);

    std::string body(len, '\0');
    if (len && !readn(fd, body.data(), len)) throw std::runtime_error("EOF reading body");
    return body;
}

nlohmann::json tr::protocols::recvJson(const int fd, const size_t maxBytes) {
    return nlohmann::json::parse(recvFrame(fd, maxBytes));
}
