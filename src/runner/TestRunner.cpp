#include "runner/TestRunner.hpp"
#include "runner/Report.hpp"
#include "runner/errors.hpp"
#include "validation/ArgumentSanitizer.hpp"
#include "validation/FileTarget.hpp"
#include "validation/PathValidator.hpp"
#include "cypress/Pipeline.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

using namespace tr::runner;
using namespace tr::process;
using namespace tr::validation;
using namespace tr::logging;

namespace {

[[noreturn]] void reject(const std::string& op, const std::string& reason) {
    LogRegistry::validation()->warn("[TestRunner] {} rejected: {}", op, reason);
    LogRegistry::audit()->info("rejected {}: {}", op, reason);
    throw InvalidParams(reason);
}

// The target is appended as a bare argv element; the runner's option parser must not see it as a flag
void rejectOptionLike(const std::string& op, const std::string& file) {
    if (!file.empty() && file.front() == '-')
        reject(op, fmt::format("File path must not start with '-': {}", file));
}

}

TestRunner::TestRunner(tr::config::RspecConfig rspec,
                       tr::config::CypressConfig cypress,
                       std::shared_ptr<const Executor> executor)
    : rspecConfig_(std::move(rspec)),
      cypressConfig_(std::move(cypress)),
      rspecCommand_(rspecConfig_.command),
      executor_(std::move(executor)) {
    if (!executor_) throw std::invalid_argument("TestRunner: executor must not be null");
    if (cypressConfig_.shell_pipeline.empty()) cypressCommand_.emplace(cypressConfig_.command);
}

ExecutionResult TestRunner::execute(const Invocation& invocation) const {
    try {
        return executor_->run(invocation);
    } catch (const SpawnError& e) {
        throw InternalError(fmt::format("Test runner command failed: {}", e.what()));
    }
}

std::string TestRunner::runRspec(const std::string& file, const std::vector<int64_t>& lineNumbers) const {
    rejectOptionLike("run_rspec", file);
    auto created = ValidatedFileTarget::create(file, lineNumbers, FileKind::Rspec);
    if (const auto* err = std::get_if<TargetError>(&created)) reject("run_rspec", describe(*err));

    const auto& target = std::get<ValidatedFileTarget>(created);
    const auto invocation = buildTargetInvocation(rspecCommand_, rspecConfig_.default_args, target);
    const auto argument = formatTargetArgument(target);

    LogRegistry::testrunner()->info("[TestRunner] Running RSpec for {}", argument);
    const auto result = execute(invocation);
    return formatRspecReport(argument, result);
}

std::string TestRunner::runRspecArguments(const std::vector<std::string>& tokens) const {
    if (const auto check = validateArguments(tokens); !check) reject("run_rspec_args", describe(*check.error));

    const auto invocation = buildArgumentInvocation(rspecCommand_, tokens);

    LogRegistry::testrunner()->info("[TestRunner] Running RSpec with {} argument(s)", tokens.size());
    const auto result = execute(invocation);
    return formatArgumentsReport(invocation, result);
}

Invocation TestRunner::cypressInvocation(const std::string& path) const {
    if (!cypressCommand_) return buildShellInvocation(cypressConfig_.shell_pipeline, path);

    Invocation inv{cypressCommand_->program(), cypressCommand_->leadingArgs()};
    inv.args.push_back(path);
    if (!cypressConfig_.working_dir.empty() && cypressConfig_.working_dir != CURRENT_DIRECTORY)
        inv.working_dir = cypressConfig_.working_dir;
    return inv;
}

std::string TestRunner::runCypress(const std::string& file) const {
    rejectOptionLike("run_cypress", file);
    if (const auto check = validatePath(file, FileKind::Cypress); !check) reject("run_cypress", describe(*check.error));

    const auto path = normalizeToWorkingDirectory(file, cypressConfig_.working_dir);
    const auto invocation = cypressInvocation(path);

    LogRegistry::testrunner()->info("[TestRunner] Running Cypress for {} (as {})", file, path);
    const auto result = execute(invocation);
    return formatCypressReport(file, result, cypress::processOutput(result.stdout_text));
}
