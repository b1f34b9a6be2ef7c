#pragma once

#include "config/Config.hpp"
#include "process/CommandBuilder.hpp"
#include "process/Executor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tr::runner {

/**
 * The three guarded entry points. Every call validates its input completely before
 * anything is spawned, then makes exactly one execution attempt.
 *
 * Throws InvalidParams when validation fails and InternalError when the runner could
 * not be started. A test run that finished, however badly, always returns report text.
 *
 * Holds only read-only configuration, so one instance may serve concurrent callers.
 */
class TestRunner {
public:
    TestRunner(config::RspecConfig rspec,
               config::CypressConfig cypress,
               std::shared_ptr<const process::Executor> executor = std::make_shared<process::Executor>());

    [[nodiscard]] std::string runRspec(const std::string& file, const std::vector<int64_t>& lineNumbers = {}) const;
    [[nodiscard]] std::string runRspecArguments(const std::vector<std::string>& tokens) const;
    [[nodiscard]] std::string runCypress(const std::string& file) const;

private:
    config::RspecConfig rspecConfig_;
    config::CypressConfig cypressConfig_;
    process::CommandTemplate rspecCommand_;
    std::optional<process::CommandTemplate> cypressCommand_;
    std::shared_ptr<const process::Executor> executor_;

    [[nodiscard]] process::ExecutionResult execute(const process::Invocation& invocation) const;
    [[nodiscard]] process::Invocation cypressInvocation(const std::string& path) const;
};

}
