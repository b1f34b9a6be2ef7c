#include "services/ToolServerService.hpp"
#include "protocols/tools/Router.hpp"
#include "protocols/framing.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <system_error>
#include <thread>
#include <unistd.h>

using nlohmann::json;

using namespace tr::services;
using namespace tr::protocols;
using namespace tr::tools;
using namespace tr::logging;

namespace {

struct Peer {
    uid_t uid;
    gid_t gid;
    pid_t pid;
};

Peer peercred(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) != 0) throw std::runtime_error("SO_PEERCRED failed");
    return {c.uid, c.gid, c.pid};
}

json errorReply(const ErrorCode code, const std::string& message) {
    return ToolResult::failure(code, message).toJson();
}

std::runtime_error sysError(const std::string& what) {
    return std::runtime_error(fmt::format("{}: {}", what, std::strerror(errno)));
}

}

ToolServerService::ToolServerService(tr::config::ServerConfig cfg, std::shared_ptr<const Router> router)
    : AsyncService("tool-server"), config_(std::move(cfg)), router_(std::move(router)) {
    if (!router_) throw std::invalid_argument("ToolServerService: router must not be null");
    if (config_.socket_path.size() >= sizeof(sockaddr_un::sun_path))
        throw std::invalid_argument(fmt::format("Socket path too long: {}", config_.socket_path));
}

ToolServerService::~ToolServerService() {
    stop();
    closeListener();
}

size_t ToolServerService::activeConnections() const {
    std::lock_guard lock(connMutex_);
    return active_;
}

void ToolServerService::start() {
    if (isRunning()) return;
    openListener();
    AsyncService::start();
}

void ToolServerService::openListener() {
    closeListener();

    const std::filesystem::path path(config_.socket_path);
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
    ::unlink(config_.socket_path.c_str());

    listenFd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) throw sysError("socket()");

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", config_.socket_path.c_str());
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr),
               sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        const auto err = sysError(fmt::format("bind({})", config_.socket_path));
        closeListener();
        throw err;
    }
    if (::chmod(config_.socket_path.c_str(), 0660) != 0)
        LogRegistry::tools()->warn("[ToolServer] chmod 0660 on {} failed: {}", config_.socket_path, std::strerror(errno));

    if (::listen(listenFd_, LISTEN_BACKLOG) != 0) {
        const auto err = sysError("listen()");
        closeListener();
        throw err;
    }

    LogRegistry::tools()->info("[ToolServer] Listening on {}", config_.socket_path);
}

void ToolServerService::closeListener() {
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
        ::unlink(config_.socket_path.c_str());
    }
}

void ToolServerService::onStop() {
    // close() alone does not wake a thread blocked in accept()
    if (listenFd_ >= 0) ::shutdown(listenFd_, SHUT_RDWR);
}

void ToolServerService::waitForConnections() {
    std::unique_lock lock(connMutex_);
    if (active_) LogRegistry::tools()->info("[ToolServer] Waiting for {} connection(s) to finish", active_);
    connCv_.wait(lock, [this] { return active_ == 0; });
}

void ToolServerService::runLoop() {
    while (running_) {
        const int cfd = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (!running_) break; // listener shut down during stop
            if (errno == EINTR || errno == ECONNABORTED) continue;
            LogRegistry::tools()->error("[ToolServer] accept() failed: {}", std::strerror(errno));
            break;
        }

        {
            std::lock_guard lock(connMutex_);
            ++active_;
        }

        const auto release = [this, cfd] {
            ::close(cfd);
            std::lock_guard lock(connMutex_);
            --active_;
            connCv_.notify_all();
        };

        try {
            std::thread([this, cfd, release] {
                try {
                    handleConnection(cfd);
                } catch (const std::exception& e) {
                    LogRegistry::tools()->error("[ToolServer] Connection handler failed: {}", e.what());
                }
                release();
            }).detach();
        } catch (const std::system_error& e) {
            LogRegistry::tools()->error("[ToolServer] Could not start connection thread: {}", e.what());
            release();
        }
    }

    waitForConnections();
}

void ToolServerService::handleConnection(const int cfd) const {
    const auto p = peercred(cfd);
    LogRegistry::tools()->debug("[ToolServer] Connection from UID {} (PID {})", p.uid, p.pid);

    timeval tv{RECEIVE_TIMEOUT_SECONDS, 0};
    if (::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0)
        LogRegistry::tools()->warn("[ToolServer] SO_RCVTIMEO failed: {}", std::strerror(errno));

    json reply;
    try {
        const auto req = recvJson(cfd, config_.max_request_bytes);

        if (req.is_object() && req.contains("tool") && req["tool"].is_string())
            LogRegistry::audit()->info("uid {} pid {} called {}", p.uid, p.pid, req["tool"].get<std::string>());

        reply = router_->handleRequest(req);
    } catch (const FrameTooLarge& e) {
        LogRegistry::tools()->warn("[ToolServer] UID {} (PID {}): {}", p.uid, p.pid, e.what());
        reply = errorReply(ErrorCode::InvalidParams, e.what());
    } catch (const json::parse_error& e) {
        LogRegistry::tools()->warn("[ToolServer] UID {} (PID {}) sent invalid JSON: {}", p.uid, p.pid, e.what());
        reply = errorReply(ErrorCode::InvalidParams, "invalid JSON request");
    } catch (const std::runtime_error& e) {
        // peer hung up or timed out before a full frame arrived; nobody to answer
        LogRegistry::tools()->debug("[ToolServer] UID {} (PID {}) dropped: {}", p.uid, p.pid, e.what());
        return;
    }

    if (!sendJson(cfd, reply))
        LogRegistry::tools()->warn("[ToolServer] Failed to send reply to UID {} (PID {})", p.uid, p.pid);
}
