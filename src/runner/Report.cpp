#include "runner/Report.hpp"

#include <fmt/core.h>

using namespace tr::process;
using namespace tr::cypress;

namespace tr::runner {

std::string formatRspecReport(const std::string& target, const ExecutionResult& result) {
    return fmt::format("RSpec Test Results for: {}\nExit Code: {}\n\nOutput:\n{}\n\nErrors:\n{}",
                       target, result.exitCodeString(), result.stdout_text, result.stderr_text);
}

std::string formatArgumentsReport(const Invocation& invocation, const ExecutionResult& result) {
    return fmt::format("RSpec Test Results\nCommand: {}\nExit Code: {}\n\nOutput:\n{}\n\nErrors:\n{}",
                       invocation.commandLine(), result.exitCodeString(), result.stdout_text, result.stderr_text);
}

std::string formatCypressReport(const std::string& file,
                                const ExecutionResult& result,
                                const StageResult<std::string>& processed) {
    if (const auto* json = std::get_if<std::string>(&processed)) {
        return fmt::format("Cypress Test Results for: {}\nExit Code: {}\n\nResults:\n{}\n\nErrors:\n{}",
                           file, result.exitCodeString(), *json, result.stderr_text);
    }

    const auto& err = std::get<StageError>(processed);
    return fmt::format("Cypress Test Results for: {}\nExit Code: {}\n\n{}: {}\n\nRaw Output:\n{}\n\nErrors:\n{}",
                       file, result.exitCodeString(), describe(err.stage), err.message,
                       result.stdout_text, result.stderr_text);
}

}
