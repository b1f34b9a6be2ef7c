#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace tr::tools { class Router; }

namespace tr::services {

/**
 * Serves the tool router on a Unix stream socket. One request frame per connection,
 * answered with one reply frame. Each connection is handled on its own thread, so a
 * long test run does not hold up other callers.
 *
 * start() binds synchronously and throws if the socket cannot be set up.
 * stop() closes the listener and waits for in-flight connections to finish.
 */
class ToolServerService final : public AsyncService {
public:
    ToolServerService(config::ServerConfig cfg, std::shared_ptr<const tools::Router> router);
    ~ToolServerService() override;

    void start() override;

    [[nodiscard]] const std::string& socketPath() const noexcept { return config_.socket_path; }
    [[nodiscard]] size_t activeConnections() const;

protected:
    void runLoop() override;
    void onStop() override; // shut the listener down to break accept()

private:
    static constexpr int LISTEN_BACKLOG = 16;
    static constexpr int RECEIVE_TIMEOUT_SECONDS = 30;

    config::ServerConfig config_;
    std::shared_ptr<const tools::Router> router_;
    int listenFd_ = -1;

    mutable std::mutex connMutex_;
    std::condition_variable connCv_;
    size_t active_ = 0;

    void openListener();
    void closeListener();
    void handleConnection(int cfd) const;
    void waitForConnections();
};

}
