#include "services/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace tr::services;
using namespace tr::logging;

AsyncService::AsyncService(const std::string& serviceName) : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own

    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::testrunner()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    LogRegistry::testrunner()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::testrunner()->info("[{}] Stopping service...", serviceName_);
    running_.store(false);
    onStop();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();


    LogRegistry::testrunner()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    LogRegistry::testrunner()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
