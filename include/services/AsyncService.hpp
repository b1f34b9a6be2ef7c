#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace tr::services {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Runs on the stopping thread before the worker is joined; unblock runLoop() here.
    virtual void onStop() {}
};

}
