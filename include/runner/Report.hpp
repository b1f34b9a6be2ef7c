#pragma once

#include "cypress/Pipeline.hpp"
#include "process/Invocation.hpp"

#include <string>

namespace tr::runner {

[[nodiscard]] std::string formatRspecReport(const std::string& target, const process::ExecutionResult& result);

[[nodiscard]] std::string formatArgumentsReport(const process::Invocation& invocation,
                                                const process::ExecutionResult& result);

// Degraded pipeline output still produces a report: the failing stage plus raw stdout/stderr
[[nodiscard]] std::string formatCypressReport(const std::string& file,
                                              const process::ExecutionResult& result,
                                              const cypress::StageResult<std::string>& processed);

}
