// Services
#include "services/ToolServerService.hpp"

// Runner
#include "runner/TestRunner.hpp"
#include "protocols/tools/Router.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fmt/core.h>
#include <string>
#include <thread>

using namespace tr::config;
using namespace tr::services;
using namespace tr::runner;
using namespace tr::tools;
using namespace tr::logging;

namespace {
std::atomic<bool> shouldExit = false;
std::atomic<bool> shouldReopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) shouldReopenLogs = true;
    else shouldExit = true;
}

void usage() {
    fmt::print(stderr, "usage: testrunnerd [--config <path>] [--print-config]\n");
}
}

int main(const int argc, char** argv) {
    std::string configPath = DEFAULT_CONFIG_PATH.string();
    bool printConfig = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) configPath = argv[++i];
        else if (std::strcmp(argv[i], "--print-config") == 0) printConfig = true;
        else {
            usage();
            return 2;
        }
    }

    try {
        ConfigRegistry::init(configPath);
        const auto& config = ConfigRegistry::get();

        if (printConfig) {
            fmt::print("{}\n", config.dump());
            return EXIT_SUCCESS;
        }

        LogRegistry::init(config.logging);
        LogRegistry::testrunner()->info("[*] Loaded configuration from {}", configPath);

        const auto runner = std::make_shared<const TestRunner>(config.rspec, config.cypress);
        const auto router = std::make_shared<Router>();
        registerTestRunnerTools(*router, runner);

        ToolServerService server(config.server, router);
        server.start();

        LogRegistry::testrunner()->info("[*] testrunner {} serving {} tool(s) on {}",
                                        SERVER_VERSION, router->listTools().size(), server.socketPath());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);
        std::signal(SIGPIPE, SIG_IGN);

        while (!shouldExit && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            if (shouldReopenLogs.exchange(false)) {
                LogRegistry::reopenMainLog();
                LogRegistry::reopenAuditLog();
                LogRegistry::testrunner()->info("[*] Log files reopened");
            }
        }

        if (!server.isRunning() && !shouldExit) LogRegistry::testrunner()->error("[-] Tool server exited unexpectedly");

        LogRegistry::testrunner()->info("[*] Shutting down testrunner...");
        server.stop();
        LogRegistry::testrunner()->info("[✓] testrunner shut down cleanly.");

        return shouldExit ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::testrunner()->error("[-] Failed to start testrunner: {}", e.what());
        else fmt::print(stderr, "testrunnerd: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
